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

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace cbinit::core::management
{
struct alternate_address {
  std::string hostname{};

  /**
   * Service key of the alternate address API ("mgmt", "kvSSL", ...) to the port.
   */
  std::map<std::string, std::uint16_t> ports{};

  auto operator==(const alternate_address& other) const -> bool
  {
    return hostname == other.hostname && ports == other.ports;
  }
};

/**
 * Entry of "nodesExt" in "/pools/default/nodeServices".
 */
struct node_services {
  std::string hostname{};
  std::map<std::string, std::uint16_t> services{};
  bool this_node{ false };
  std::optional<alternate_address> external_address{};
};
} // namespace cbinit::core::management
