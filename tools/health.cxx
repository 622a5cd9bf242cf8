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

#include "health.hxx"

#include "environment.hxx"
#include "utils.hxx"

#include "core/management_api.hxx"
#include "core/operations/management/node_list_get.hxx"
#include "core/orchestration/health_requirement.hxx"

#include <cbinit/fmt/error.hxx>

#include <fmt/core.h>

#include <future>

namespace
{
class health_app : public CLI::App
{
public:
  health_app()
    : CLI::App("Check that every declared service has healthy nodes.", "health")
  {
    cbinit_tool::add_options(this, topology_options_);
    cbinit_tool::add_options(this, logger_options_);

    add_option("--max-attempts", max_attempts_, "Number of attempts of the node list request.")
      ->default_val(1)
      ->check(CLI::PositiveNumber);
  }

  [[nodiscard]] auto execute() const -> int
  {
    cbinit_tool::apply_logger_options(logger_options_);
    auto topology = cbinit_tool::load_topology_or_fail(topology_options_);

    cbinit::service services{ cbinit::service::none };
    for (const auto& group : topology.groups()) {
      services |= group.services;
    }

    cbinit::core::orchestration::orchestrator_options options{};
    options.api.retry.max_attempts = max_attempts_;
    cbinit_tool::cluster_environment environment{ topology, options };

    std::promise<cbinit::core::operations::management::node_list_get_response> barrier;
    auto f = barrier.get_future();
    environment.api()->execute(topology.primary().value(),
                               cbinit::core::operations::management::node_list_get_request{},
                               cbinit::core::cancellation_token::create(),
                               [&barrier](auto&& resp) {
                                 barrier.set_value(std::move(resp));
                               });
    auto resp = f.get();
    if (resp.ctx.ec) {
      fmt::print(stderr,
                 "ERROR: unable to list nodes of cluster \"{}\": {}\n",
                 topology.name(),
                 resp.ctx.to_error());
      return 1;
    }

    auto failures = cbinit::core::orchestration::evaluate_services(services, resp.nodes);
    for (const auto& failure : failures) {
      fmt::print(stdout, "{}\n", failure);
    }
    if (!failures.empty()) {
      return 1;
    }
    fmt::print(stdout, "cluster \"{}\" is healthy\n", topology.name());
    return 0;
  }

private:
  cbinit_tool::topology_options topology_options_{};
  cbinit_tool::logger_options logger_options_{};
  std::size_t max_attempts_{ 1 };
};
} // namespace

namespace cbinit_tool
{
auto
make_health_command() -> std::shared_ptr<CLI::App>
{
  return std::make_shared<health_app>();
}

auto
execute_health_command(const CLI::App* app) -> int
{
  if (const auto* health = dynamic_cast<const health_app*>(app); health != nullptr) {
    return health->execute();
  }
  return 1;
}
} // namespace cbinit_tool
