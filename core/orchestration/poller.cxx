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

#include "poller.hxx"

#include <cbinit/error_codes.hxx>

#include <asio/error.hpp>
#include <asio/post.hpp>

#include <utility>

namespace cbinit::core::orchestration
{
poller::poller(asio::io_context& ctx,
               std::chrono::milliseconds interval,
               std::shared_ptr<cancellation_token> token)
  : strand_{ asio::make_strand(ctx) }
  , timer_{ strand_ }
  , interval_{ interval }
  , token_{ std::move(token) }
{
}

auto
poller::create(asio::io_context& ctx,
               std::chrono::milliseconds interval,
               std::shared_ptr<cancellation_token> token) -> std::shared_ptr<poller>
{
  return std::make_shared<poller>(ctx, interval, std::move(token));
}

void
poller::start(step_type&& step, handler_type&& handler)
{
  step_ = std::move(step);
  handler_ = std::move(handler);
  if (token_) {
    subscription_ = token_->subscribe([weak = weak_from_this()]() {
      if (auto self = weak.lock(); self) {
        asio::post(self->strand_, [self]() {
          self->timer_.cancel();
        });
      }
    });
  }
  asio::post(strand_, [self = shared_from_this()]() {
    self->run_step();
  });
}

auto
poller::iterations() const -> std::size_t
{
  return iterations_;
}

void
poller::run_step()
{
  if (token_ && token_->is_cancelled()) {
    return finish({ errc::common::request_canceled });
  }
  ++iterations_;
  step_([self = shared_from_this()](cbinit::error err, bool done) {
    asio::post(self->strand_, [self, err = std::move(err), done]() mutable {
      self->on_step(std::move(err), done);
    });
  });
}

void
poller::on_step(cbinit::error err, bool done)
{
  if (err || done) {
    return finish(std::move(err));
  }
  timer_.expires_after(interval_);
  timer_.async_wait([self = shared_from_this()](std::error_code ec) {
    if (ec == asio::error::operation_aborted) {
      return self->finish({ errc::common::request_canceled });
    }
    self->run_step();
  });
}

void
poller::finish(cbinit::error err)
{
  if (handler_type handler = std::move(handler_); handler) {
    handler_ = nullptr;
    step_ = nullptr;
    if (token_ && subscription_ != 0) {
      token_->unsubscribe(subscription_);
      subscription_ = 0;
    }
    handler(std::move(err));
  }
}
} // namespace cbinit::core::orchestration
