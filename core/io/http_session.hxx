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
#include "http_parser.hxx"
#include "streams.hxx"

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl/context.hpp>
#include <asio/steady_timer.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

namespace cbinit::core::io
{
/**
 * Executes exactly one HTTP request over a dedicated connection.
 *
 * The management endpoints are contacted rarely and nodes come and go during bootstrap, so every
 * request resolves and connects again.
 */
class http_session : public std::enable_shared_from_this<http_session>
{
public:
  using response_handler = std::function<void(std::error_code, http_response)>;

  http_session(asio::io_context& ctx, std::string hostname, std::string service);

  http_session(asio::io_context& ctx,
               asio::ssl::context& tls,
               std::string hostname,
               std::string service);

  ~http_session();

  http_session(const http_session&) = delete;
  auto operator=(const http_session&) -> http_session& = delete;
  http_session(http_session&&) = delete;
  auto operator=(http_session&&) -> http_session& = delete;

  /**
   * The handler is invoked exactly once. Timeouts are reported as
   * errc::common::unambiguous_timeout if the request has not been written yet, and as
   * errc::common::ambiguous_timeout otherwise.
   */
  void execute(http_request request, response_handler&& handler);

  /**
   * Aborts the request, the handler receives errc::common::request_canceled.
   */
  void stop();

  [[nodiscard]] auto log_prefix() const -> const std::string&;

private:
  void on_resolve(std::error_code ec, const asio::ip::tcp::resolver::results_type& endpoints);
  void do_connect(asio::ip::tcp::resolver::results_type::iterator it);
  void on_connect(const std::error_code& ec, asio::ip::tcp::resolver::results_type::iterator it);
  void do_write();
  void do_read();
  void complete(std::error_code ec);

  asio::io_context& ctx_;
  asio::ip::tcp::resolver resolver_;
  std::unique_ptr<stream_impl> stream_;
  asio::steady_timer deadline_timer_;
  asio::steady_timer connect_deadline_timer_;
  std::string hostname_;
  std::string service_;
  std::string log_prefix_;

  std::chrono::milliseconds connect_timeout_{ std::chrono::seconds{ 10 } };
  std::string output_buffer_{};
  std::array<std::uint8_t, 16384> input_buffer_{};
  http_parser parser_{};
  asio::ip::tcp::resolver::results_type endpoints_{};

  std::mutex handler_mutex_{};
  response_handler handler_{};
  std::atomic_bool stopped_{ false };
  std::atomic_bool written_{ false };
};
} // namespace cbinit::core::io
