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

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace cbinit::core::orchestration
{
/**
 * Repeats asynchronous step with fixed interval until the step reports completion or failure.
 */
class poller : public std::enable_shared_from_this<poller>
{
public:
  /**
   * Arguments of the step callback: error that aborts polling, or true when done.
   */
  using step_callback = std::function<void(cbinit::error, bool)>;
  using step_type = std::function<void(step_callback&&)>;
  using handler_type = std::function<void(cbinit::error)>;

  poller(asio::io_context& ctx,
         std::chrono::milliseconds interval,
         std::shared_ptr<cancellation_token> token);

  static auto create(asio::io_context& ctx,
                     std::chrono::milliseconds interval,
                     std::shared_ptr<cancellation_token> token) -> std::shared_ptr<poller>;

  void start(step_type&& step, handler_type&& handler);

  /**
   * Number of times the step has been invoked.
   */
  [[nodiscard]] auto iterations() const -> std::size_t;

private:
  void run_step();
  void on_step(cbinit::error err, bool done);
  void finish(cbinit::error err);

  asio::strand<asio::io_context::executor_type> strand_;
  asio::steady_timer timer_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<cancellation_token> token_;
  cancellation_token::subscription_id subscription_{ 0 };
  std::size_t iterations_{ 0 };
  step_type step_{};
  handler_type handler_{};
};
} // namespace cbinit::core::orchestration
