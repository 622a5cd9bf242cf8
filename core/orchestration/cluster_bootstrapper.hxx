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

namespace cbinit::core
{
class management_api;
} // namespace cbinit::core

namespace cbinit::core::orchestration
{
/**
 * Turns the primary node into a single-node cluster.
 */
class cluster_bootstrapper : public std::enable_shared_from_this<cluster_bootstrapper>
{
public:
  using settings_provider = std::function<cluster_settings()>;

  cluster_bootstrapper(std::shared_ptr<management_api> api, settings_provider settings);

  /**
   * Checks the default pool of the node. A node that does not have it yet is not initialized.
   */
  void is_initialized(const server_node& node,
                      const std::shared_ptr<cancellation_token>& token,
                      std::function<void(cbinit::error, bool)>&& handler);

  /**
   * Sends cluster initialization. Must not be repeated for the same node.
   */
  void initialize(const server_node& node,
                  const std::shared_ptr<cancellation_token>& token,
                  std::function<void(cbinit::error)>&& handler);

  /**
   * Initializes the node unless it is already initialized. The handler receives true when the
   * cluster has been initialized by this call.
   */
  void ensure_initialized(const server_node& node,
                          const std::shared_ptr<cancellation_token>& token,
                          std::function<void(cbinit::error, bool)>&& handler);

private:
  std::shared_ptr<management_api> api_;
  settings_provider settings_;
};
} // namespace cbinit::core::orchestration
