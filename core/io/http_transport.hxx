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

#include "http_message.hxx"

#include <cbinit/error.hxx>
#include <cbinit/topology.hxx>

#include <tl/expected.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <system_error>

namespace asio
{
class io_context;
} // namespace asio

namespace cbinit::core
{
class cancellation_token;
} // namespace cbinit::core

namespace cbinit::core::io
{
/**
 * Sends single HTTP request to the management endpoint of a node.
 */
class http_transport
{
public:
  using response_handler = std::function<void(std::error_code, http_response)>;

  virtual ~http_transport() = default;

  /**
   * The handler is invoked exactly once, with errc::common::request_canceled if the token has
   * been cancelled before the response arrived.
   */
  virtual void send(const endpoint_address& endpoint,
                    http_request request,
                    const std::shared_ptr<cancellation_token>& token,
                    response_handler&& handler) = 0;
};

/**
 * Creates the transport that opens a connection for every request. TLS connections trust only
 * the given certificate authority, errc::orchestration::certificate_unavailable is returned when
 * it cannot be loaded.
 */
auto
make_asio_http_transport(asio::io_context& ctx,
                         const std::optional<certificate_authority>& authority)
  -> tl::expected<std::shared_ptr<http_transport>, cbinit::error>;
} // namespace cbinit::core::io
