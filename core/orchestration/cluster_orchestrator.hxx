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

#include "core/cancellation_token.hxx"
#include "core/management_api.hxx"
#include "core/orchestration/node_join_coordinator.hxx"
#include "core/orchestration/resource_command_service.hxx"

#include <cbinit/error.hxx>
#include <cbinit/resource_state.hxx>
#include <cbinit/topology.hxx>

#include <asio/io_context.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cbinit::core::orchestration
{
class bucket_provisioner;
class certificate_trust_bootstrapper;
class cluster_bootstrapper;
class rebalance_controller;
class resource_notification_service;

struct orchestrator_options {
  management_api_options api{};
  std::chrono::milliseconds rebalance_poll_interval{ std::chrono::seconds{ 1 } };
  std::chrono::milliseconds bucket_health_poll_interval{ std::chrono::milliseconds{ 250 } };
  std::chrono::milliseconds sample_task_poll_interval{ std::chrono::milliseconds{ 500 } };
  std::chrono::milliseconds node_probe_interval{ std::chrono::seconds{ 1 } };
};

struct orchestrator_dependencies {
  std::shared_ptr<management_api> api{};
  std::shared_ptr<resource_notification_service> notifications{};

  /**
   * Starts and stops the servers. When empty, the servers are driven from outside and only their
   * published state is observed.
   */
  std::shared_ptr<resource_command_service> commands{};
};

/**
 * Drives the cluster from declared topology to running state: initializes the primary node, joins
 * the other nodes, rebalances and provisions the buckets. Every step is reflected in the published
 * state of the resources.
 */
class cluster_orchestrator : public std::enable_shared_from_this<cluster_orchestrator>
{
public:
  using handler_type = std::function<void(cbinit::error)>;

  /**
   * Registers the resources of the topology and starts watching their state.
   */
  static auto create(asio::io_context& ctx,
                     cluster_topology topology,
                     orchestrator_dependencies dependencies,
                     orchestrator_options options = {}) -> std::shared_ptr<cluster_orchestrator>;

  cluster_orchestrator(asio::io_context& ctx,
                       cluster_topology topology,
                       orchestrator_dependencies dependencies,
                       orchestrator_options options);

  ~cluster_orchestrator();

  cluster_orchestrator(const cluster_orchestrator&) = delete;
  cluster_orchestrator(cluster_orchestrator&&) = delete;
  auto operator=(const cluster_orchestrator&) -> cluster_orchestrator& = delete;
  auto operator=(cluster_orchestrator&&) -> cluster_orchestrator& = delete;

  /**
   * Starts the servers (if the command service is available) and bootstraps the cluster once the
   * primary node is running. Ignored unless the cluster is not started or has exited.
   */
  void start();

  /**
   * Stops the buckets, every server and finally the cluster. The handler is invoked once the
   * cluster has exited.
   */
  void stop(handler_type&& handler);

  /**
   * Cancels all background tasks without publishing any state.
   */
  void shutdown();

  void start_resource(const std::string& name, handler_type&& handler);
  void stop_resource(const std::string& name, handler_type&& handler);

  /**
   * Removes all documents from the bucket and waits until it is healthy again.
   */
  void flush_bucket(const std::string& name, handler_type&& handler);

  /**
   * Completes once the cluster and all its buckets are either running or have exited.
   * Completes with errc::orchestration::bootstrap_failed if any of them has non-zero exit code.
   */
  void wait_until_settled(const std::shared_ptr<cancellation_token>& token, handler_type&& handler);

  [[nodiscard]] auto topology() const -> const cluster_topology&;
  [[nodiscard]] auto notifications() const -> std::shared_ptr<resource_notification_service>;

private:
  struct bootstrap_context {
    std::shared_ptr<cancellation_token> token{};
    server_node primary{};
    std::vector<server_node> others{};
    bool initialized_now{ false };
    std::vector<std::string> existing_nodes{};
    std::vector<join_result> joins{};
  };

  using bootstrap_step = void (cluster_orchestrator::*)(const std::shared_ptr<bootstrap_context>&,
                                                        handler_type&&);

  void register_resources();
  void on_resource_changed(const resource_snapshot& snapshot);

  void run_bootstrap(std::shared_ptr<bootstrap_context> context, std::size_t step);
  void wait_for_primary(const std::shared_ptr<bootstrap_context>& context, handler_type&& next);
  void initialize_primary(const std::shared_ptr<bootstrap_context>& context, handler_type&& next);
  void join_nodes(const std::shared_ptr<bootstrap_context>& context, handler_type&& next);
  void rebalance_if_needed(const std::shared_ptr<bootstrap_context>& context,
                           handler_type&& next);
  void publish_running(const std::shared_ptr<bootstrap_context>& context, handler_type&& next);
  void on_bootstrap_finished(const std::shared_ptr<bootstrap_context>& context,
                             cbinit::error err);

  void start_bucket(const bucket_declaration& bucket);
  void stop_bucket(const std::string& name, handler_type&& handler);
  void stop_servers(handler_type&& handler);

  /**
   * Publishes the state of the resource. With @p propagate, the children of the resource receive
   * the same state with exit code zero.
   */
  void publish_state(const std::string& name,
                     resource_state state,
                     std::string state_text,
                     std::optional<int> exit_code = {},
                     bool propagate = false,
                     bool include_buckets = true);
  void publish_state_text(const std::string& name, std::string state_text);

  [[nodiscard]] auto state_of(const std::string& name) const -> std::optional<resource_state>;
  [[nodiscard]] auto cluster_token() const -> std::shared_ptr<cancellation_token>;

  asio::io_context& ctx_;
  cluster_topology topology_;
  orchestrator_options options_;
  std::shared_ptr<management_api> api_;
  std::shared_ptr<resource_notification_service> notifications_;
  std::shared_ptr<resource_command_service> commands_;

  std::shared_ptr<cluster_bootstrapper> bootstrapper_;
  std::shared_ptr<certificate_trust_bootstrapper> trust_;
  std::shared_ptr<node_join_coordinator> joiner_;
  std::shared_ptr<rebalance_controller> rebalancer_;
  std::shared_ptr<bucket_provisioner> provisioner_;

  std::shared_ptr<cancellation_token> root_token_{ cancellation_token::create() };
  std::uint64_t watch_id_{ 0 };

  mutable std::mutex tasks_mutex_{};
  std::shared_ptr<cancellation_token> cluster_token_{};
  std::map<std::string, std::shared_ptr<cancellation_token>> bucket_tasks_{};
};
} // namespace cbinit::core::orchestration
