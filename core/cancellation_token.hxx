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

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace cbinit::core
{
/**
 * Shared cancellation signal of a background task. Every suspension point (request, backoff,
 * poll, wait) subscribes to the token of its task.
 */
class cancellation_token
{
public:
  using subscription_id = std::uint64_t;

  cancellation_token() = default;
  ~cancellation_token();

  cancellation_token(const cancellation_token&) = delete;
  auto operator=(const cancellation_token&) -> cancellation_token& = delete;
  cancellation_token(cancellation_token&&) = delete;
  auto operator=(cancellation_token&&) -> cancellation_token& = delete;

  static auto create() -> std::shared_ptr<cancellation_token>;

  /**
   * Creates token that is cancelled together with @p parent, but can also be cancelled on its
   * own.
   */
  static auto linked(const std::shared_ptr<cancellation_token>& parent)
    -> std::shared_ptr<cancellation_token>;

  /**
   * Registers callback to be invoked on cancellation. If the token is already cancelled, the
   * callback is invoked immediately and zero is returned.
   */
  auto subscribe(std::function<void()> callback) -> subscription_id;

  void unsubscribe(subscription_id id);

  /**
   * Invokes all callbacks once, later calls do nothing.
   */
  void cancel();

  [[nodiscard]] auto is_cancelled() const -> bool;

private:
  mutable std::mutex mutex_{};
  bool cancelled_{ false };
  subscription_id next_id_{ 1 };
  std::map<subscription_id, std::function<void()>> callbacks_{};

  std::shared_ptr<cancellation_token> parent_{};
  subscription_id parent_subscription_{ 0 };
};
} // namespace cbinit::core
