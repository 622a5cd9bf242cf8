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

#include "http_session.hxx"

#include "core/logger/logger.hxx"
#include "core/meta/version.hxx"

#include <cbinit/error_codes.hxx>

#include <asio/bind_executor.hpp>
#include <asio/post.hpp>
#include <fmt/core.h>

#include <algorithm>

namespace cbinit::core::io
{
http_session::http_session(asio::io_context& ctx, std::string hostname, std::string service)
  : ctx_(ctx)
  , resolver_(ctx_)
  , stream_(std::make_unique<plain_stream_impl>(ctx_))
  , deadline_timer_(stream_->get_executor())
  , connect_deadline_timer_(stream_->get_executor())
  , hostname_(std::move(hostname))
  , service_(std::move(service))
  , log_prefix_(fmt::format("[{}] <{}:{}>", stream_->kind(), hostname_, service_))
{
}

http_session::http_session(asio::io_context& ctx,
                           asio::ssl::context& tls,
                           std::string hostname,
                           std::string service)
  : ctx_(ctx)
  , resolver_(ctx_)
  , stream_(std::make_unique<tls_stream_impl>(ctx_, tls, hostname))
  , deadline_timer_(stream_->get_executor())
  , connect_deadline_timer_(stream_->get_executor())
  , hostname_(std::move(hostname))
  , service_(std::move(service))
  , log_prefix_(fmt::format("[{}] <{}:{}>", stream_->kind(), hostname_, service_))
{
}

http_session::~http_session()
{
  stream_->close();
}

auto
http_session::log_prefix() const -> const std::string&
{
  return log_prefix_;
}

void
http_session::execute(http_request request, response_handler&& handler)
{
  {
    const std::scoped_lock lock(handler_mutex_);
    handler_ = std::move(handler);
  }
  if (stopped_) {
    response_handler pending{};
    {
      const std::scoped_lock lock(handler_mutex_);
      std::swap(pending, handler_);
    }
    if (pending) {
      asio::post(asio::bind_executor(ctx_, [pending = std::move(pending)]() {
        pending(errc::common::request_canceled, {});
      }));
    }
    return;
  }
  if (request.timeout > std::chrono::milliseconds::zero()) {
    connect_timeout_ = std::min(connect_timeout_, request.timeout);
  }

  request.headers["host"] = fmt::format("{}:{}", hostname_, service_);
  request.headers["user-agent"] = meta::user_agent();
  request.headers["connection"] = "close";
  if (!request.body.empty() || request.method == "POST" || request.method == "PUT") {
    request.headers["content-length"] = std::to_string(request.body.size());
  }
  output_buffer_ = fmt::format("{} {} HTTP/1.1\r\n", request.method, request.path);
  for (const auto& [name, value] : request.headers) {
    output_buffer_.append(fmt::format("{}: {}\r\n", name, value));
  }
  output_buffer_.append("\r\n");
  output_buffer_.append(request.body);

  if (request.timeout > std::chrono::milliseconds::zero()) {
    deadline_timer_.expires_after(request.timeout);
    deadline_timer_.async_wait([self = shared_from_this()](std::error_code ec) {
      if (ec == asio::error::operation_aborted) {
        return;
      }
      CBINIT_LOG_DEBUG("{} request timed out", self->log_prefix_);
      self->complete(self->written_ ? errc::common::ambiguous_timeout
                                    : errc::common::unambiguous_timeout);
    });
  }

  CBINIT_LOG_TRACE("{} {} {}", log_prefix_, request.method, request.path);
  resolver_.async_resolve(hostname_,
                          service_,
                          [self = shared_from_this()](
                            std::error_code ec,
                            const asio::ip::tcp::resolver::results_type& endpoints) {
                            self->on_resolve(ec, endpoints);
                          });
}

void
http_session::stop()
{
  complete(errc::common::request_canceled);
}

void
http_session::complete(std::error_code ec)
{
  if (stopped_.exchange(true)) {
    return;
  }
  response_handler handler{};
  {
    const std::scoped_lock lock(handler_mutex_);
    std::swap(handler, handler_);
  }
  asio::post(stream_->get_executor(), [self = shared_from_this()]() {
    self->resolver_.cancel();
    self->deadline_timer_.cancel();
    self->connect_deadline_timer_.cancel();
    self->stream_->close();
  });
  if (handler) {
    auto response = ec ? http_response{} : std::move(parser_.response);
    asio::post(asio::bind_executor(
      ctx_, [handler = std::move(handler), ec, response = std::move(response)]() mutable {
        handler(ec, std::move(response));
      }));
  }
}

void
http_session::on_resolve(std::error_code ec,
                         const asio::ip::tcp::resolver::results_type& endpoints)
{
  if (ec == asio::error::operation_aborted || stopped_) {
    return;
  }
  if (ec) {
    CBINIT_LOG_DEBUG("{} error on resolve: {}", log_prefix_, ec.message());
    return complete(errc::network::resolve_failure);
  }
  endpoints_ = endpoints;
  CBINIT_LOG_TRACE("{} resolved to {} endpoint(s)", log_prefix_, endpoints_.size());
  do_connect(endpoints_.begin());
}

void
http_session::do_connect(asio::ip::tcp::resolver::results_type::iterator it)
{
  if (stopped_) {
    return;
  }
  if (it == endpoints_.end()) {
    CBINIT_LOG_DEBUG("{} no more endpoints left to connect", log_prefix_);
    return complete(errc::network::no_endpoints_left);
  }
  CBINIT_LOG_TRACE("{} connecting to {}:{}, timeout={}ms",
                   log_prefix_,
                   it->endpoint().address().to_string(),
                   it->endpoint().port(),
                   connect_timeout_.count());
  connect_deadline_timer_.expires_after(connect_timeout_);
  connect_deadline_timer_.async_wait([self = shared_from_this(), it](const auto timer_ec) mutable {
    if (timer_ec == asio::error::operation_aborted || self->stopped_) {
      return;
    }
    CBINIT_LOG_DEBUG("{} unable to connect to {}:{} in time",
                     self->log_prefix_,
                     it->endpoint().address().to_string(),
                     it->endpoint().port());
    self->stream_->close();
  });
  stream_->async_connect(it->endpoint(), [self = shared_from_this(), it](std::error_code ec) {
    self->on_connect(ec, it);
  });
}

void
http_session::on_connect(const std::error_code& ec,
                         asio::ip::tcp::resolver::results_type::iterator it)
{
  if (stopped_) {
    return;
  }
  connect_deadline_timer_.cancel();
  if (ec == errc::network::handshake_failure) {
    return complete(ec);
  }
  if (ec) {
    CBINIT_LOG_DEBUG("{} unable to connect to {}:{}: {}",
                     log_prefix_,
                     it->endpoint().address().to_string(),
                     it->endpoint().port(),
                     ec.message());
    stream_->close();
    return do_connect(++it);
  }
  do_write();
}

void
http_session::do_write()
{
  if (stopped_) {
    return;
  }
  stream_->async_write(
    asio::buffer(output_buffer_),
    [self = shared_from_this()](std::error_code ec, std::size_t /* bytes_transferred */) {
      if (ec == asio::error::operation_aborted || self->stopped_) {
        return;
      }
      if (ec) {
        CBINIT_LOG_DEBUG(
          "{} IO error while writing to the socket: {}", self->log_prefix_, ec.message());
        return self->complete(errc::network::end_of_stream);
      }
      self->written_ = true;
      self->do_read();
    });
}

void
http_session::do_read()
{
  if (stopped_) {
    return;
  }
  stream_->async_read_some(
    asio::buffer(input_buffer_),
    [self = shared_from_this()](std::error_code ec, std::size_t bytes_transferred) {
      if (ec == asio::error::operation_aborted || self->stopped_) {
        return;
      }
      if (ec) {
        if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
          if (auto res = self->parser_.finish(); !res.failure && res.complete) {
            return self->complete({});
          }
        }
        CBINIT_LOG_DEBUG(
          "{} IO error while reading from the socket: {}", self->log_prefix_, ec.message());
        return self->complete(errc::network::end_of_stream);
      }
      auto res = self->parser_.feed(reinterpret_cast<const char*>(self->input_buffer_.data()),
                                    bytes_transferred);
      if (res.failure) {
        CBINIT_LOG_DEBUG("{} unable to parse response: {}", self->log_prefix_, res.error);
        return self->complete(errc::network::protocol_error);
      }
      if (res.complete) {
        return self->complete({});
      }
      self->do_read();
    });
}
} // namespace cbinit::core::io
