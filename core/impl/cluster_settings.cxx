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

#include <cbinit/cluster_settings.hxx>

namespace cbinit
{
auto
cluster_settings::effective_index_storage_mode() const -> cbinit::index_storage_mode
{
  if (index_storage_mode) {
    return index_storage_mode.value();
  }
  return edition == edition::enterprise ? index_storage_mode::plasma : index_storage_mode::forestdb;
}

auto
to_string(edition value) -> std::string_view
{
  switch (value) {
    case edition::enterprise:
      return "enterprise";
    case edition::community:
      return "community";
  }
  return "unknown";
}

auto
edition_from_string(std::string_view value) -> std::optional<edition>
{
  if (value == "enterprise") {
    return edition::enterprise;
  }
  if (value == "community") {
    return edition::community;
  }
  return {};
}

auto
to_string(index_storage_mode value) -> std::string_view
{
  switch (value) {
    case index_storage_mode::plasma:
      return "plasma";
    case index_storage_mode::forestdb:
      return "forestdb";
    case index_storage_mode::memory_optimized:
      return "memory_optimized";
  }
  return "unknown";
}

auto
index_storage_mode_from_string(std::string_view value) -> std::optional<index_storage_mode>
{
  if (value == "plasma") {
    return index_storage_mode::plasma;
  }
  if (value == "forestdb") {
    return index_storage_mode::forestdb;
  }
  if (value == "memory_optimized" || value == "memopt") {
    return index_storage_mode::memory_optimized;
  }
  return {};
}
} // namespace cbinit
