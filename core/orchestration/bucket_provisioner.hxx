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

#include <cbinit/bucket_settings.hxx>
#include <cbinit/error.hxx>
#include <cbinit/topology.hxx>

#include <asio/io_context.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace cbinit::core
{
class management_api;
} // namespace cbinit::core

namespace cbinit::core::orchestration
{
struct bucket_provisioner_options {
  std::chrono::milliseconds health_poll_interval{ 250 };
  std::chrono::milliseconds sample_task_poll_interval{ 500 };
};

/**
 * Creates the declared buckets. Existing buckets are never modified.
 */
class bucket_provisioner : public std::enable_shared_from_this<bucket_provisioner>
{
public:
  using handler_type = std::function<void(cbinit::error)>;

  /**
   * Receives intermediate state of the provisioning ("Loading").
   */
  using progress_handler = std::function<void(const std::string&)>;

  bucket_provisioner(asio::io_context& ctx,
                     std::shared_ptr<management_api> api,
                     bucket_provisioner_options options = {});

  void provision(const server_node& node,
                 const bucket_declaration& bucket,
                 const std::shared_ptr<cancellation_token>& token,
                 progress_handler&& progress,
                 handler_type&& handler);

  /**
   * Creates the bucket unless it exists, waits until it is healthy on every node, then creates
   * the missing scopes and collections.
   */
  void provision_standard(const server_node& node,
                          const bucket_declaration& bucket,
                          const std::shared_ptr<cancellation_token>& token,
                          handler_type&& handler);

  /**
   * Installs the sample unless the bucket exists, and waits until the loading task finishes.
   */
  void provision_sample(const server_node& node,
                        const std::string& name,
                        const std::shared_ptr<cancellation_token>& token,
                        progress_handler&& progress,
                        handler_type&& handler);

  /**
   * Removes all documents from the bucket, then waits until it is healthy again.
   */
  void flush(const server_node& node,
             const std::string& name,
             const std::shared_ptr<cancellation_token>& token,
             handler_type&& handler);

  /**
   * Polls the bucket until all nodes report it as healthy. Missing bucket is treated as not
   * healthy yet.
   */
  void wait_until_healthy(const server_node& node,
                          const std::string& name,
                          const std::shared_ptr<cancellation_token>& token,
                          handler_type&& handler);

  void ensure_scopes(const server_node& node,
                     const bucket_declaration& bucket,
                     const std::shared_ptr<cancellation_token>& token,
                     handler_type&& handler);

private:
  void wait_for_task(const server_node& node,
                     const std::string& task_id,
                     const std::shared_ptr<cancellation_token>& token,
                     handler_type&& handler);

  asio::io_context& ctx_;
  std::shared_ptr<management_api> api_;
  bucket_provisioner_options options_;
};
} // namespace cbinit::core::orchestration
