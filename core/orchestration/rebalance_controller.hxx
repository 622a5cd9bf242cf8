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

#include <cbinit/error.hxx>
#include <cbinit/topology.hxx>

#include <asio/io_context.hpp>

#include <chrono>
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
class rebalance_controller : public std::enable_shared_from_this<rebalance_controller>
{
public:
  rebalance_controller(asio::io_context& ctx,
                       std::shared_ptr<management_api> api,
                       std::chrono::milliseconds poll_interval = std::chrono::seconds{ 1 });

  /**
   * Starts rebalance, so that the cluster consists of the nodes with the given hostnames.
   */
  void trigger(const server_node& primary,
               const std::vector<std::string>& known_hostnames,
               const std::shared_ptr<cancellation_token>& token,
               std::function<void(cbinit::error)>&& handler);

  /**
   * Polls rebalance progress until the cluster reports that no rebalance is running.
   */
  void await_completion(const server_node& primary,
                        const std::shared_ptr<cancellation_token>& token,
                        std::function<void(cbinit::error)>&& handler);

  void rebalance(const server_node& primary,
                 const std::vector<std::string>& known_hostnames,
                 const std::shared_ptr<cancellation_token>& token,
                 std::function<void(cbinit::error)>&& handler);

private:
  asio::io_context& ctx_;
  std::shared_ptr<management_api> api_;
  std::chrono::milliseconds poll_interval_;
};
} // namespace cbinit::core::orchestration
