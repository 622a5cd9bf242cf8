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
#include "core/error_context/http.hxx"
#include "core/io/http_message.hxx"
#include "core/io/http_transport.hxx"

#include <cbinit/topology.hxx>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace cbinit::core
{
/**
 * Retry budget of management requests. The defaults give the node about a minute to come up.
 */
struct retry_policy {
  /**
   * Number of attempts including the first one.
   */
  std::size_t max_attempts{ 60 };
  std::chrono::milliseconds backoff{ std::chrono::seconds{ 1 } };
};

/**
 * @return true for responses that are worth sending again: 5xx, 408 and 429
 */
constexpr auto
is_retriable_status(std::uint32_t status_code) -> bool
{
  return status_code >= 500 || status_code == 408 || status_code == 429;
}

/**
 * @return true for failures of the connection (resolve, connect, handshake, timeout)
 */
auto
is_retriable_transport_error(std::error_code ec) -> bool;

/**
 * Sends single management request, repeating it with constant backoff while the node answers
 * with transient failures. Cancellation interrupts both the request in flight and the backoff.
 */
class management_command : public std::enable_shared_from_this<management_command>
{
public:
  using handler_type = std::function<void(error_context::http, io::http_response)>;

  management_command(asio::io_context& ctx,
                     std::shared_ptr<io::http_transport> transport,
                     endpoint_address endpoint,
                     io::http_request request,
                     bool auto_retry,
                     retry_policy policy,
                     std::shared_ptr<cancellation_token> token);

  void start(handler_type&& handler);

private:
  void send();
  void on_response(std::error_code ec, io::http_response&& msg);
  void backoff_and_send();
  void invoke_handler(std::error_code ec, io::http_response&& msg);

  asio::strand<asio::io_context::executor_type> strand_;
  asio::steady_timer backoff_;
  std::shared_ptr<io::http_transport> transport_;
  endpoint_address endpoint_;
  io::http_request request_;
  bool auto_retry_;
  retry_policy policy_;
  std::shared_ptr<cancellation_token> token_;
  cancellation_token::subscription_id subscription_{ 0 };
  std::size_t attempts_{ 0 };
  handler_type handler_{};
};
} // namespace cbinit::core
