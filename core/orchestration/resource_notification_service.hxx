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

#include <cbinit/resource_state.hxx>

#include <asio/io_context.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace cbinit::core::orchestration
{
/**
 * Holds the current snapshot of every resource and notifies the watchers about changes.
 */
class resource_notification_service
  : public std::enable_shared_from_this<resource_notification_service>
{
public:
  using watch_id = std::uint64_t;
  using watcher_type = std::function<void(const resource_snapshot&)>;
  using predicate_type = std::function<bool(const resource_snapshot&)>;
  using wait_handler = std::function<void(std::error_code, resource_snapshot)>;

  explicit resource_notification_service(asio::io_context& ctx);

  /**
   * Registers the resource with its initial snapshot. Registering the same name twice replaces
   * the snapshot.
   */
  void register_resource(resource_snapshot snapshot);

  /**
   * Applies @p transform to the current snapshot of the resource and notifies the watchers.
   *
   * @return false if the resource is not registered
   */
  auto publish(const std::string& name, const std::function<void(resource_snapshot&)>& transform)
    -> bool;

  /**
   * The watcher is invoked on the publishing thread, after the snapshot has been updated.
   */
  auto watch(watcher_type watcher) -> watch_id;
  void unwatch(watch_id id);

  [[nodiscard]] auto current(const std::string& name) const -> std::optional<resource_snapshot>;
  [[nodiscard]] auto children_of(const std::string& name) const -> std::vector<resource_snapshot>;
  [[nodiscard]] auto snapshots() const -> std::vector<resource_snapshot>;

  /**
   * Completes once the snapshot of the resource satisfies the predicate, immediately if it
   * already does. Completes with errc::common::request_canceled when the token is cancelled and
   * with errc::orchestration::resource_not_found for unknown resources. The handler is always
   * invoked through the io_context.
   */
  void wait_for(const std::string& name,
                predicate_type predicate,
                const std::shared_ptr<cancellation_token>& token,
                wait_handler&& handler);

  void wait_for(const std::string& name,
                std::vector<resource_state> states,
                const std::shared_ptr<cancellation_token>& token,
                wait_handler&& handler);

private:
  struct waiter {
    std::string name{};
    predicate_type predicate{};
    wait_handler handler{};
    std::shared_ptr<cancellation_token> token{};
    cancellation_token::subscription_id subscription{ 0 };
  };

  void complete(waiter&& w, std::error_code ec, resource_snapshot snapshot);
  void cancel_waiter(std::uint64_t id);

  asio::io_context& ctx_;
  mutable std::mutex mutex_{};
  std::vector<std::string> order_{};
  std::map<std::string, resource_snapshot> resources_{};
  std::map<watch_id, watcher_type> watchers_{};
  watch_id next_watch_id_{ 1 };
  std::map<std::uint64_t, waiter> waiters_{};
  std::uint64_t next_waiter_id_{ 1 };
};
} // namespace cbinit::core::orchestration
