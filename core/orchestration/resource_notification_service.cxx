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

#include "resource_notification_service.hxx"

#include "core/logger/logger.hxx"

#include <cbinit/error_codes.hxx>
#include <cbinit/fmt/resource_state.hxx>

#include <asio/post.hpp>

#include <algorithm>
#include <utility>

namespace cbinit::core::orchestration
{
resource_notification_service::resource_notification_service(asio::io_context& ctx)
  : ctx_{ ctx }
{
}

void
resource_notification_service::register_resource(resource_snapshot snapshot)
{
  const std::scoped_lock lock(mutex_);
  if (resources_.count(snapshot.name) == 0) {
    order_.push_back(snapshot.name);
  }
  auto name = snapshot.name;
  resources_[name] = std::move(snapshot);
}

auto
resource_notification_service::publish(const std::string& name,
                                       const std::function<void(resource_snapshot&)>& transform)
  -> bool
{
  resource_snapshot updated{};
  std::vector<watcher_type> watchers{};
  std::vector<waiter> satisfied{};
  {
    const std::scoped_lock lock(mutex_);
    auto it = resources_.find(name);
    if (it == resources_.end()) {
      return false;
    }
    transform(it->second);
    updated = it->second;

    watchers.reserve(watchers_.size());
    for (const auto& [id, watcher] : watchers_) {
      watchers.push_back(watcher);
    }
    for (auto w = waiters_.begin(); w != waiters_.end();) {
      if (w->second.name == name && w->second.predicate(updated)) {
        satisfied.emplace_back(std::move(w->second));
        w = waiters_.erase(w);
      } else {
        ++w;
      }
    }
  }

  CBINIT_LOG_TRACE(R"(resource "{}" ({}) is {} "{}")",
                   updated.name,
                   updated.kind,
                   updated.state,
                   updated.state_text);
  for (const auto& watcher : watchers) {
    watcher(updated);
  }
  for (auto& w : satisfied) {
    complete(std::move(w), {}, updated);
  }
  return true;
}

auto
resource_notification_service::watch(watcher_type watcher) -> watch_id
{
  const std::scoped_lock lock(mutex_);
  auto id = next_watch_id_++;
  watchers_.emplace(id, std::move(watcher));
  return id;
}

void
resource_notification_service::unwatch(watch_id id)
{
  const std::scoped_lock lock(mutex_);
  watchers_.erase(id);
}

auto
resource_notification_service::current(const std::string& name) const
  -> std::optional<resource_snapshot>
{
  const std::scoped_lock lock(mutex_);
  if (auto it = resources_.find(name); it != resources_.end()) {
    return it->second;
  }
  return {};
}

auto
resource_notification_service::children_of(const std::string& name) const
  -> std::vector<resource_snapshot>
{
  const std::scoped_lock lock(mutex_);
  std::vector<resource_snapshot> children{};
  for (const auto& resource_name : order_) {
    const auto& snapshot = resources_.at(resource_name);
    if (snapshot.parent == name) {
      children.push_back(snapshot);
    }
  }
  return children;
}

auto
resource_notification_service::snapshots() const -> std::vector<resource_snapshot>
{
  const std::scoped_lock lock(mutex_);
  std::vector<resource_snapshot> result{};
  result.reserve(order_.size());
  for (const auto& resource_name : order_) {
    result.push_back(resources_.at(resource_name));
  }
  return result;
}

void
resource_notification_service::wait_for(const std::string& name,
                                        predicate_type predicate,
                                        const std::shared_ptr<cancellation_token>& token,
                                        wait_handler&& handler)
{
  waiter w{ name, std::move(predicate), std::move(handler), token };
  std::uint64_t id{};
  {
    const std::scoped_lock lock(mutex_);
    auto it = resources_.find(name);
    if (it == resources_.end()) {
      return complete(std::move(w), errc::orchestration::resource_not_found, {});
    }
    if (w.predicate(it->second)) {
      auto snapshot = it->second;
      return complete(std::move(w), {}, std::move(snapshot));
    }
    if (token && token->is_cancelled()) {
      return complete(std::move(w), errc::common::request_canceled, {});
    }
    id = next_waiter_id_++;
    waiters_.emplace(id, std::move(w));
  }

  if (token) {
    auto subscription = token->subscribe([weak = weak_from_this(), id]() {
      if (auto self = weak.lock(); self) {
        self->cancel_waiter(id);
      }
    });
    const std::scoped_lock lock(mutex_);
    if (auto it = waiters_.find(id); it != waiters_.end()) {
      it->second.subscription = subscription;
    } else if (subscription != 0) {
      token->unsubscribe(subscription);
    }
  }
}

void
resource_notification_service::wait_for(const std::string& name,
                                        std::vector<resource_state> states,
                                        const std::shared_ptr<cancellation_token>& token,
                                        wait_handler&& handler)
{
  wait_for(
    name,
    [states = std::move(states)](const resource_snapshot& snapshot) {
      return std::find(states.begin(), states.end(), snapshot.state) != states.end();
    },
    token,
    std::move(handler));
}

void
resource_notification_service::complete(waiter&& w, std::error_code ec, resource_snapshot snapshot)
{
  if (w.token && w.subscription != 0) {
    w.token->unsubscribe(w.subscription);
  }
  asio::post(ctx_,
             [handler = std::move(w.handler), ec, snapshot = std::move(snapshot)]() mutable {
               handler(ec, std::move(snapshot));
             });
}

void
resource_notification_service::cancel_waiter(std::uint64_t id)
{
  waiter w{};
  {
    const std::scoped_lock lock(mutex_);
    auto it = waiters_.find(id);
    if (it == waiters_.end()) {
      return;
    }
    w = std::move(it->second);
    waiters_.erase(it);
  }
  w.subscription = 0;
  complete(std::move(w), errc::common::request_canceled, {});
}
} // namespace cbinit::core::orchestration
