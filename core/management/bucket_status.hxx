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
 * Subset of "/pools/default/buckets/{name}" needed to track provisioning.
 */
struct bucket_status {
  struct node {
    std::string hostname{};
    std::string status{};
  };

  std::string name{};
  std::string bucket_type{};
  std::vector<node> nodes{};

  /**
   * The bucket is healthy when it is present on at least one node and every node reports it as
   * "healthy". A freshly created bucket may be listed without nodes before its vBuckets are
   * placed, so an empty list keeps the health poll running.
   */
  [[nodiscard]] auto is_healthy() const -> bool
  {
    if (nodes.empty()) {
      return false;
    }
    for (const auto& n : nodes) {
      if (n.status != "healthy") {
        return false;
      }
    }
    return true;
  }
};
} // namespace cbinit::core::management
