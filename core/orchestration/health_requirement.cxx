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

#include "health_requirement.hxx"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <iterator>
#include <set>

namespace cbinit::core::orchestration
{
auto
health_requirement::evaluate(const std::vector<core::management::cluster_node>& nodes) const
  -> std::optional<std::string>
{
  const auto identifier = to_management_services(service);

  std::set<std::string> all_nodes{};
  std::set<std::string> healthy_nodes{};
  for (const auto& node : nodes) {
    if (std::find(node.services.begin(), node.services.end(), identifier) == node.services.end()) {
      continue;
    }
    all_nodes.insert(node.hostname);
    if (node.is_healthy()) {
      healthy_nodes.insert(node.hostname);
    }
  }

  if (healthy_nodes.size() >= minimum_healthy_nodes &&
      all_nodes.size() - healthy_nodes.size() <= maximum_unhealthy_nodes) {
    return {};
  }

  auto message = fmt::format("Couchbase health check failed for service {}", to_string(service));
  if (all_nodes.empty()) {
    message += ", no nodes available.";
  } else if (all_nodes.size() == healthy_nodes.size()) {
    // every node is healthy, but there are not enough of them
    message += fmt::format(", {} healthy nodes.", healthy_nodes.size());
  } else {
    std::vector<std::string> unhealthy_nodes{};
    std::set_difference(all_nodes.begin(),
                        all_nodes.end(),
                        healthy_nodes.begin(),
                        healthy_nodes.end(),
                        std::back_inserter(unhealthy_nodes));
    message += fmt::format(" for nodes {}.", fmt::join(unhealthy_nodes, ", "));
  }
  return message;
}

auto
evaluate_services(cbinit::service services,
                  const std::vector<core::management::cluster_node>& nodes)
  -> std::vector<std::string>
{
  std::vector<std::string> failures{};
  for (auto flag : all_services) {
    if (!has_service(services, flag)) {
      continue;
    }
    if (auto failure = health_requirement{ flag }.evaluate(nodes); failure) {
      failures.emplace_back(std::move(failure.value()));
    }
  }
  return failures;
}
} // namespace cbinit::core::orchestration
