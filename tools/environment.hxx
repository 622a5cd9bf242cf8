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

#include "core/orchestration/cluster_orchestrator.hxx"

#include <cbinit/topology.hxx>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

namespace cbinit::core::orchestration
{
class node_probe;
class resource_notification_service;
} // namespace cbinit::core::orchestration

namespace cbinit_tool
{
/**
 * Wires the orchestrator for nodes that are managed outside of the tool, and runs the I/O
 * threads until destroyed.
 */
class cluster_environment
{
public:
  cluster_environment(cbinit::cluster_topology topology,
                      cbinit::core::orchestration::orchestrator_options options = {},
                      std::size_t number_of_io_threads = 1);
  ~cluster_environment();

  cluster_environment(const cluster_environment&) = delete;
  cluster_environment(cluster_environment&&) = delete;
  auto operator=(const cluster_environment&) -> cluster_environment& = delete;
  auto operator=(cluster_environment&&) -> cluster_environment& = delete;

  [[nodiscard]] auto io() -> asio::io_context&;
  [[nodiscard]] auto api() const -> std::shared_ptr<cbinit::core::management_api>;
  [[nodiscard]] auto notifications() const
    -> std::shared_ptr<cbinit::core::orchestration::resource_notification_service>;
  [[nodiscard]] auto orchestrator() const
    -> std::shared_ptr<cbinit::core::orchestration::cluster_orchestrator>;

private:
  asio::io_context io_{};
  asio::executor_work_guard<asio::io_context::executor_type> guard_;
  std::vector<std::thread> io_pool_{};
  std::shared_ptr<cbinit::core::management_api> api_{};
  std::shared_ptr<cbinit::core::orchestration::resource_notification_service> notifications_{};
  std::shared_ptr<cbinit::core::orchestration::node_probe> probe_{};
  std::shared_ptr<cbinit::core::orchestration::cluster_orchestrator> orchestrator_{};
};
} // namespace cbinit_tool
