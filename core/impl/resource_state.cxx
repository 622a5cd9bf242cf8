/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2025-Present Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#include <cbinit/resource_state.hxx>

namespace cbinit
{
auto
resource_snapshot::property(const std::string& key) const -> std::optional<std::string>
{
  if (auto it = properties.find(key); it != properties.end()) {
    return it->second;
  }
  return {};
}

auto
to_string(resource_state state) -> std::string_view
{
  switch (state) {
    case resource_state::not_started:
      return "NotStarted";
    case resource_state::starting:
      return "Starting";
    case resource_state::running:
      return "Running";
    case resource_state::failed_to_start:
      return "FailedToStart";
    case resource_state::stopping:
      return "Stopping";
    case resource_state::exited:
      return "Exited";
  }
  return "Unknown";
}

auto
to_string(resource_kind kind) -> std::string_view
{
  switch (kind) {
    case resource_kind::cluster:
      return "cluster";
    case resource_kind::server_group:
      return "server_group";
    case resource_kind::server:
      return "server";
    case resource_kind::bucket:
      return "bucket";
  }
  return "unknown";
}
} // namespace cbinit
