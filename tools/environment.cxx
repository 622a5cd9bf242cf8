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

#include "environment.hxx"
#include "utils.hxx"

#include "core/io/http_transport.hxx"
#include "core/logger/logger.hxx"
#include "core/management_api.hxx"
#include "core/orchestration/node_probe.hxx"
#include "core/orchestration/resource_notification_service.hxx"

#include <cbinit/fmt/error.hxx>

#include <fmt/core.h>

namespace cbinit_tool
{
cluster_environment::cluster_environment(cbinit::cluster_topology topology,
                                         cbinit::core::orchestration::orchestrator_options options,
                                         std::size_t number_of_io_threads)
  : guard_{ asio::make_work_guard(io_) }
{
  auto transport = cbinit::core::io::make_asio_http_transport(io_, topology.authority());
  if (!transport) {
    fail(fmt::format(R"(unable to configure TLS for cluster "{}": {})",
                     topology.name(),
                     transport.error()));
  }
  api_ = std::make_shared<cbinit::core::management_api>(
    io_,
    transport.value(),
    [topology]() {
      return topology.credentials();
    },
    topology.has_certificate_authority(),
    options.api);
  notifications_ =
    std::make_shared<cbinit::core::orchestration::resource_notification_service>(io_);
  probe_ = std::make_shared<cbinit::core::orchestration::node_probe>(
    io_,
    api_,
    notifications_,
    topology,
    cbinit::core::orchestration::node_probe_options{ options.node_probe_interval });
  orchestrator_ = cbinit::core::orchestration::cluster_orchestrator::create(
    io_, std::move(topology), { api_, notifications_, probe_ }, options);

  io_pool_.reserve(number_of_io_threads);
  for (std::size_t i = 0; i < number_of_io_threads; ++i) {
    io_pool_.emplace_back([this]() {
      io_.run();
    });
  }
}

cluster_environment::~cluster_environment()
{
  orchestrator_->shutdown();
  probe_->shutdown();
  guard_.reset();
  io_.stop();
  for (auto& thread : io_pool_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

auto
cluster_environment::io() -> asio::io_context&
{
  return io_;
}

auto
cluster_environment::api() const -> std::shared_ptr<cbinit::core::management_api>
{
  return api_;
}

auto
cluster_environment::notifications() const
  -> std::shared_ptr<cbinit::core::orchestration::resource_notification_service>
{
  return notifications_;
}

auto
cluster_environment::orchestrator() const
  -> std::shared_ptr<cbinit::core::orchestration::cluster_orchestrator>
{
  return orchestrator_;
}
} // namespace cbinit_tool
