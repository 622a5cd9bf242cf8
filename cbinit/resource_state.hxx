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

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cbinit
{
enum class resource_kind { cluster, server_group, server, bucket };

enum class resource_state {
  not_started,
  starting,
  running,
  failed_to_start,
  stopping,
  exited,
};

/**
 * Point-in-time view of the externally observable state of a resource.
 */
struct resource_snapshot {
  std::string name{};
  resource_kind kind{ resource_kind::cluster };

  /**
   * Name of the parent resource, empty for the cluster.
   */
  std::string parent{};
  resource_state state{ resource_state::not_started };

  /**
   * Human readable state, may describe an intermediate step ("Initializing", "Rebalancing",
   * "Loading").
   */
  std::string state_text{};
  std::optional<int> exit_code{};
  std::map<std::string, std::string> properties{};

  [[nodiscard]] auto property(const std::string& key) const -> std::optional<std::string>;
};

constexpr auto
is_terminal(resource_state state) -> bool
{
  return state == resource_state::failed_to_start || state == resource_state::exited;
}

auto
to_string(resource_state state) -> std::string_view;

auto
to_string(resource_kind kind) -> std::string_view;
} // namespace cbinit
