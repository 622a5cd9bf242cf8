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

#include "management_command.hxx"

#include "core/logger/logger.hxx"

#include <cbinit/error_codes.hxx>

#include <asio/error.hpp>
#include <asio/post.hpp>

#include <utility>

namespace cbinit::core
{
auto
is_retriable_transport_error(std::error_code ec) -> bool
{
  if (!ec) {
    return false;
  }
  if (ec == errc::common::unambiguous_timeout || ec == errc::common::ambiguous_timeout) {
    return true;
  }
  if (ec.category() == impl::network_category()) {
    return true;
  }
  return ec.category() == asio::error::get_system_category() ||
         ec.category() == asio::error::get_netdb_category() ||
         ec.category() == asio::error::get_addrinfo_category() ||
         ec.category() == asio::error::get_misc_category();
}

management_command::management_command(asio::io_context& ctx,
                                       std::shared_ptr<io::http_transport> transport,
                                       endpoint_address endpoint,
                                       io::http_request request,
                                       bool auto_retry,
                                       retry_policy policy,
                                       std::shared_ptr<cancellation_token> token)
  : strand_{ asio::make_strand(ctx) }
  , backoff_{ strand_ }
  , transport_{ std::move(transport) }
  , endpoint_{ std::move(endpoint) }
  , request_{ std::move(request) }
  , auto_retry_{ auto_retry }
  , policy_{ policy }
  , token_{ std::move(token) }
{
  if (policy_.max_attempts == 0) {
    policy_.max_attempts = 1;
  }
}

void
management_command::start(handler_type&& handler)
{
  handler_ = std::move(handler);
  if (token_) {
    subscription_ = token_->subscribe([weak = weak_from_this()]() {
      if (auto self = weak.lock(); self) {
        asio::post(self->strand_, [self]() {
          self->backoff_.cancel();
        });
      }
    });
  }
  asio::post(strand_, [self = shared_from_this()]() {
    self->send();
  });
}

void
management_command::send()
{
  if (!handler_) {
    return;
  }
  if (token_ && token_->is_cancelled()) {
    return invoke_handler(errc::common::request_canceled, {});
  }
  ++attempts_;
  CBINIT_LOG_TRACE(R"(management request: {} {}:{} method={}, path="{}", attempt={}/{})",
                   endpoint_.tls ? "https" : "http",
                   endpoint_.host,
                   endpoint_.port,
                   request_.method,
                   request_.path,
                   attempts_,
                   policy_.max_attempts);
  transport_->send(endpoint_,
                   request_,
                   token_,
                   [self = shared_from_this()](std::error_code ec, io::http_response msg) {
                     asio::post(self->strand_, [self, ec, msg = std::move(msg)]() mutable {
                       self->on_response(ec, std::move(msg));
                     });
                   });
}

void
management_command::on_response(std::error_code ec, io::http_response&& msg)
{
  if (ec == errc::common::request_canceled || (token_ && token_->is_cancelled())) {
    return invoke_handler(errc::common::request_canceled, std::move(msg));
  }

  const bool transient =
    ec ? is_retriable_transport_error(ec) : is_retriable_status(msg.status_code);
  if (!transient) {
    return invoke_handler(ec, std::move(msg));
  }

  if (auto_retry_ && attempts_ < policy_.max_attempts) {
    CBINIT_LOG_DEBUG(R"(management request failed, retrying in {}ms: {}:{} method={}, path="{}", attempt={}/{}, ec={}, status={})",
                     policy_.backoff.count(),
                     endpoint_.host,
                     endpoint_.port,
                     request_.method,
                     request_.path,
                     attempts_,
                     policy_.max_attempts,
                     ec.message(),
                     msg.status_code);
    return backoff_and_send();
  }

  if (!ec) {
    if (msg.status_code >= 500) {
      ec = errc::common::internal_server_failure;
    } else if (msg.status_code == 408) {
      ec = errc::common::temporary_failure;
    } else {
      ec = errc::common::rate_limited;
    }
  }
  return invoke_handler(ec, std::move(msg));
}

void
management_command::backoff_and_send()
{
  backoff_.expires_after(policy_.backoff);
  backoff_.async_wait([self = shared_from_this()](std::error_code ec) {
    if (ec == asio::error::operation_aborted ||
        (self->token_ && self->token_->is_cancelled())) {
      return self->invoke_handler(errc::common::request_canceled, {});
    }
    self->send();
  });
}

void
management_command::invoke_handler(std::error_code ec, io::http_response&& msg)
{
  if (handler_type handler = std::move(handler_); handler) {
    handler_ = nullptr;
    if (token_ && subscription_ != 0) {
      token_->unsubscribe(subscription_);
      subscription_ = 0;
    }
    error_context::http ctx{};
    ctx.ec = ec;
    ctx.method = request_.method;
    ctx.path = request_.path;
    ctx.http_status = msg.status_code;
    ctx.http_body = msg.body;
    ctx.hostname = endpoint_.host;
    ctx.port = endpoint_.port;
    ctx.attempts = attempts_;
    handler(std::move(ctx), std::move(msg));
  }
}
} // namespace cbinit::core
