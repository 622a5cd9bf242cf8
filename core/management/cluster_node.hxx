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

#include <string>
#include <vector>

namespace cbinit::core::management
{
/**
 * Node entry of "/pools/nodes" and "/pools/default".
 */
struct cluster_node {
  std::string hostname{};
  std::string otp_node{};
  std::string status{};
  std::string cluster_membership{};
  std::string version{};
  std::vector<std::string> services{};
  bool this_node{ false };

  [[nodiscard]] auto is_healthy() const -> bool
  {
    return status == "healthy";
  }
};
} // namespace cbinit::core::management
