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

#include "streams.hxx"

#include "core/logger/logger.hxx"

#include <cbinit/error_codes.hxx>

#include <asio/error.hpp>
#include <asio/dispatch.hpp>
#include <asio/ssl/error.hpp>
#include <asio/write.hpp>

#include <utility>

namespace cbinit::core::io
{
namespace
{
void
shutdown_socket(asio::ip::tcp::socket& socket)
{
  asio::error_code ignored{};
  socket.shutdown(asio::socket_base::shutdown_both, ignored);
  socket.close(ignored);
}

void
disable_delay(asio::ip::tcp::socket& socket)
{
  asio::error_code ec{};
  socket.set_option(asio::ip::tcp::no_delay{ true }, ec);
  if (ec) {
    CBINIT_LOG_TRACE("unable to set TCP_NODELAY: {}", ec.message());
  }
}
} // namespace

stream_impl::stream_impl(asio::io_context& ctx)
  : strand_(asio::make_strand(ctx))
{
}

plain_stream_impl::plain_stream_impl(asio::io_context& ctx)
  : stream_impl(ctx)
  , socket_(std::make_shared<asio::ip::tcp::socket>(strand_))
{
}

auto
plain_stream_impl::kind() const -> std::string_view
{
  return "plain";
}

void
plain_stream_impl::close()
{
  asio::dispatch(strand_, [socket = socket_]() {
    shutdown_socket(*socket);
  });
}

void
plain_stream_impl::async_connect(const asio::ip::tcp::endpoint& endpoint,
                                 connect_handler&& handler)
{
  socket_->async_connect(
    endpoint, [socket = socket_, handler = std::move(handler)](std::error_code ec) {
      if (!ec) {
        disable_delay(*socket);
      }
      handler(ec);
    });
}

void
plain_stream_impl::async_write(asio::const_buffer buffer, io_handler&& handler)
{
  asio::async_write(
    *socket_,
    buffer,
    [socket = socket_, handler = std::move(handler)](std::error_code ec, std::size_t bytes) {
      handler(ec, bytes);
    });
}

void
plain_stream_impl::async_read_some(asio::mutable_buffer buffer, io_handler&& handler)
{
  socket_->async_read_some(
    buffer,
    [socket = socket_, handler = std::move(handler)](std::error_code ec, std::size_t bytes) {
      handler(ec, bytes);
    });
}

tls_stream_impl::tls_stream_impl(asio::io_context& ctx,
                                 asio::ssl::context& tls,
                                 std::string hostname)
  : stream_impl(ctx)
  , hostname_(std::move(hostname))
  , stream_(std::make_shared<asio::ssl::stream<asio::ip::tcp::socket>>(
      asio::ip::tcp::socket(strand_), tls))
{
}

auto
tls_stream_impl::kind() const -> std::string_view
{
  return "tls";
}

void
tls_stream_impl::close()
{
  asio::dispatch(strand_, [stream = stream_]() {
    shutdown_socket(stream->next_layer());
  });
}

void
tls_stream_impl::async_connect(const asio::ip::tcp::endpoint& endpoint, connect_handler&& handler)
{
  std::error_code address_ec{};
  asio::ip::make_address(hostname_, address_ec);
  if (address_ec && SSL_set_tlsext_host_name(stream_->native_handle(), hostname_.c_str()) != 1) {
    CBINIT_LOG_DEBUG(R"(unable to set SNI host name "{}")", hostname_);
  }
  stream_->next_layer().async_connect(
    endpoint, [stream = stream_, handler = std::move(handler)](std::error_code ec) mutable {
      if (ec) {
        return handler(ec);
      }
      disable_delay(stream->next_layer());
      stream->async_handshake(
        asio::ssl::stream_base::client,
        [stream, handler = std::move(handler)](std::error_code handshake_ec) {
          if (handshake_ec && handshake_ec != asio::error::operation_aborted) {
            CBINIT_LOG_DEBUG("TLS handshake failed: {}", handshake_ec.message());
            return handler(errc::network::handshake_failure);
          }
          handler(handshake_ec);
        });
    });
}

void
tls_stream_impl::async_write(asio::const_buffer buffer, io_handler&& handler)
{
  asio::async_write(
    *stream_,
    buffer,
    [stream = stream_, handler = std::move(handler)](std::error_code ec, std::size_t bytes) {
      handler(ec, bytes);
    });
}

void
tls_stream_impl::async_read_some(asio::mutable_buffer buffer, io_handler&& handler)
{
  stream_->async_read_some(
    buffer,
    [stream = stream_, handler = std::move(handler)](std::error_code ec, std::size_t bytes) {
      handler(ec, bytes);
    });
}
} // namespace cbinit::core::io
