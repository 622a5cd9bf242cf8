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

#include <functional>
#include <memory>

namespace cbinit::core
{
class management_api;
} // namespace cbinit::core

namespace cbinit::core::orchestration
{
/**
 * Makes the node trust the certificate authority of the cluster and activate its node
 * certificate. The certificates are expected in the inbox directory of the node.
 */
class certificate_trust_bootstrapper
  : public std::enable_shared_from_this<certificate_trust_bootstrapper>
{
public:
  certificate_trust_bootstrapper(asio::io_context& ctx,
                                 std::shared_ptr<management_api> api,
                                 bool enabled);

  [[nodiscard]] auto enabled() const -> bool;

  /**
   * Loads trusted CAs, then reloads the node certificate. Does nothing when the cluster does not
   * have certificate authority.
   */
  void load_and_trust(const server_node& node,
                      const std::shared_ptr<cancellation_token>& token,
                      std::function<void(cbinit::error)>&& handler);

private:
  asio::io_context& ctx_;
  std::shared_ptr<management_api> api_;
  bool enabled_;
};
} // namespace cbinit::core::orchestration
