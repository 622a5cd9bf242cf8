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

#include <cbinit/cluster_settings.hxx>
#include <cbinit/error.hxx>
#include <cbinit/topology.hxx>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cbinit::core
{
class management_api;
} // namespace cbinit::core

namespace cbinit::core::orchestration
{
class certificate_trust_bootstrapper;
class resource_notification_service;

/**
 * Name of the server property that is set to "true" once the server is part of the cluster and
 * advertises its alternate address.
 */
constexpr auto server_initialized_property{ "initialized" };

struct join_result {
  std::string name{};

  /**
   * The node has been added by this pass, so rebalance is required.
   */
  bool added{ false };

  /**
   * The node belongs to the cluster after the pass, even if advertising its alternate address
   * has failed.
   */
  bool member{ false };
  cbinit::error error{};
};

class node_join_coordinator : public std::enable_shared_from_this<node_join_coordinator>
{
public:
  using credentials_provider = std::function<cluster_credentials()>;
  using join_all_handler = std::function<void(std::vector<join_result>)>;

  node_join_coordinator(std::shared_ptr<management_api> api,
                        std::shared_ptr<resource_notification_service> notifications,
                        std::shared_ptr<certificate_trust_bootstrapper> trust,
                        credentials_provider credentials);

  /**
   * Joins all nodes concurrently. A node that fails to join does not affect the others, the
   * handler is invoked once every node has finished.
   *
   * @param existing_nodes entries of the node list of the cluster ("{hostname}:8091")
   */
  void join_all(const server_node& primary,
                const std::vector<server_node>& nodes,
                const std::vector<std::string>& existing_nodes,
                const std::shared_ptr<cancellation_token>& token,
                join_all_handler&& handler);

  /**
   * Waits until the node is running, adds it unless it is already a member and advertises its
   * alternate address.
   */
  void join(const server_node& primary,
            const server_node& node,
            bool already_member,
            const std::shared_ptr<cancellation_token>& token,
            std::function<void(join_result)>&& handler);

  /**
   * Advertises external hostname and ports of the node. With @p skip_if_unchanged the current
   * configuration of the node is read first and nothing is written when it already matches.
   */
  void set_alternate_addresses(const server_node& node,
                               bool skip_if_unchanged,
                               const std::shared_ptr<cancellation_token>& token,
                               std::function<void(cbinit::error)>&& handler);

  /**
   * Publishes the initialized property of the server.
   */
  void mark_initialized(const server_node& node, bool initialized);

private:
  void add_node(const server_node& primary,
                const server_node& node,
                const std::shared_ptr<cancellation_token>& token,
                std::function<void(cbinit::error)>&& handler);

  std::shared_ptr<management_api> api_;
  std::shared_ptr<resource_notification_service> notifications_;
  std::shared_ptr<certificate_trust_bootstrapper> trust_;
  credentials_provider credentials_;
};
} // namespace cbinit::core::orchestration
