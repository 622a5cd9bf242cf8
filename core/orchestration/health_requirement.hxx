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

#include "core/management/cluster_node.hxx"

#include <cbinit/service.hxx>

#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace cbinit::core::orchestration
{
/**
 * Requires a minimum number of healthy nodes and allows a maximum number of unhealthy nodes of a
 * service.
 */
struct health_requirement {
  cbinit::service service{ service::data };
  std::size_t minimum_healthy_nodes{ 1 };
  std::size_t maximum_unhealthy_nodes{ std::numeric_limits<int>::max() };

  /**
   * @param nodes node list of the cluster, only nodes running the service are considered
   * @return failure message, or empty optional if the requirement is met
   */
  [[nodiscard]] auto evaluate(const std::vector<core::management::cluster_node>& nodes) const
    -> std::optional<std::string>;
};

/**
 * Evaluates the requirement of every service in @p services with the default thresholds.
 */
auto
evaluate_services(cbinit::service services,
                  const std::vector<core::management::cluster_node>& nodes)
  -> std::vector<std::string>;
} // namespace cbinit::core::orchestration
