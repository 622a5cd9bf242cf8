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

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl/context.hpp>
#include <asio/ssl/stream.hpp>
#include <asio/strand.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace cbinit::core::io
{
/**
 * Connection to the management endpoint. The stream is used for a single request and never
 * reconnected.
 */
class stream_impl
{
public:
  using connect_handler = std::function<void(std::error_code)>;
  using io_handler = std::function<void(std::error_code, std::size_t)>;

  explicit stream_impl(asio::io_context& ctx);
  virtual ~stream_impl() = default;

  stream_impl(const stream_impl&) = delete;
  auto operator=(const stream_impl&) -> stream_impl& = delete;
  stream_impl(stream_impl&&) = delete;
  auto operator=(stream_impl&&) -> stream_impl& = delete;

  [[nodiscard]] auto get_executor() const noexcept
  {
    return strand_;
  }

  [[nodiscard]] virtual auto kind() const -> std::string_view = 0;

  /**
   * Closes the socket on the strand of the stream, immediately when called from the strand.
   * Pending operations complete with asio::error::operation_aborted.
   */
  virtual void close() = 0;

  /**
   * Connects to the endpoint and disables Nagle's algorithm. TLS streams also perform the
   * handshake, its failure is reported as errc::network::handshake_failure.
   */
  virtual void async_connect(const asio::ip::tcp::endpoint& endpoint,
                             connect_handler&& handler) = 0;

  virtual void async_write(asio::const_buffer buffer, io_handler&& handler) = 0;

  virtual void async_read_some(asio::mutable_buffer buffer, io_handler&& handler) = 0;

protected:
  asio::strand<asio::io_context::executor_type> strand_;
};

class plain_stream_impl : public stream_impl
{
public:
  explicit plain_stream_impl(asio::io_context& ctx);

  [[nodiscard]] auto kind() const -> std::string_view override;
  void close() override;
  void async_connect(const asio::ip::tcp::endpoint& endpoint, connect_handler&& handler) override;
  void async_write(asio::const_buffer buffer, io_handler&& handler) override;
  void async_read_some(asio::mutable_buffer buffer, io_handler&& handler) override;

private:
  std::shared_ptr<asio::ip::tcp::socket> socket_;
};

class tls_stream_impl : public stream_impl
{
public:
  /**
   * @param hostname server name indication, not sent for IP addresses
   */
  tls_stream_impl(asio::io_context& ctx, asio::ssl::context& tls, std::string hostname);

  [[nodiscard]] auto kind() const -> std::string_view override;
  void close() override;
  void async_connect(const asio::ip::tcp::endpoint& endpoint, connect_handler&& handler) override;
  void async_write(asio::const_buffer buffer, io_handler&& handler) override;
  void async_read_some(asio::mutable_buffer buffer, io_handler&& handler) override;

private:
  std::string hostname_;
  std::shared_ptr<asio::ssl::stream<asio::ip::tcp::socket>> stream_;
};
} // namespace cbinit::core::io
