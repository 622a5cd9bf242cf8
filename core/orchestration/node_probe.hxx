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

#include "resource_command_service.hxx"

#include "core/cancellation_token.hxx"

#include <cbinit/topology.hxx>

#include <asio/io_context.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace cbinit::core
{
class management_api;
} // namespace cbinit::core

namespace cbinit::core::orchestration
{
class resource_notification_service;

struct node_probe_options {
  std::chrono::milliseconds interval{ std::chrono::seconds{ 1 } };

  /**
   * Deadline of a single probe request.
   */
  std::chrono::milliseconds request_timeout{ std::chrono::seconds{ 5 } };
};

/**
 * Commands for nodes that are managed outside of this process. A started node is published as
 * running once its management endpoint answers. Stopping only stops probing and publishes the
 * node as exited.
 */
class node_probe
  : public resource_command_service
  , public std::enable_shared_from_this<node_probe>
{
public:
  node_probe(asio::io_context& ctx,
             std::shared_ptr<management_api> api,
             std::shared_ptr<resource_notification_service> notifications,
             cluster_topology topology,
             node_probe_options options = {});

  void execute(const std::string& resource_name,
               resource_command command,
               handler_type&& handler) override;

  /**
   * Starts probing every server of the topology.
   */
  void start_all();

  /**
   * Cancels all probes, the servers keep their last published state.
   */
  void shutdown();

private:
  void start(const server_node& node);
  void stop(const server_node& node);
  void probe(const server_node& node, std::shared_ptr<cancellation_token> token);

  asio::io_context& ctx_;
  std::shared_ptr<management_api> api_;
  std::shared_ptr<resource_notification_service> notifications_;
  cluster_topology topology_;
  node_probe_options options_;

  std::mutex probes_mutex_{};
  std::map<std::string, std::shared_ptr<cancellation_token>> probes_{};
};
} // namespace cbinit::core::orchestration
