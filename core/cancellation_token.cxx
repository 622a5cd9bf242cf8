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

#include "cancellation_token.hxx"

namespace cbinit::core
{
cancellation_token::~cancellation_token()
{
  if (parent_ && parent_subscription_ != 0) {
    parent_->unsubscribe(parent_subscription_);
  }
}

auto
cancellation_token::create() -> std::shared_ptr<cancellation_token>
{
  return std::make_shared<cancellation_token>();
}

auto
cancellation_token::linked(const std::shared_ptr<cancellation_token>& parent)
  -> std::shared_ptr<cancellation_token>
{
  auto child = create();
  if (!parent) {
    return child;
  }
  child->parent_ = parent;
  child->parent_subscription_ =
    parent->subscribe([weak = std::weak_ptr<cancellation_token>(child)]() {
      if (auto token = weak.lock(); token) {
        token->cancel();
      }
    });
  return child;
}

auto
cancellation_token::subscribe(std::function<void()> callback) -> subscription_id
{
  {
    const std::scoped_lock lock(mutex_);
    if (!cancelled_) {
      auto id = next_id_++;
      callbacks_.emplace(id, std::move(callback));
      return id;
    }
  }
  callback();
  return 0;
}

void
cancellation_token::unsubscribe(subscription_id id)
{
  const std::scoped_lock lock(mutex_);
  callbacks_.erase(id);
}

void
cancellation_token::cancel()
{
  std::map<subscription_id, std::function<void()>> callbacks{};
  {
    const std::scoped_lock lock(mutex_);
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
    std::swap(callbacks, callbacks_);
  }
  for (auto& [id, callback] : callbacks) {
    callback();
  }
}

auto
cancellation_token::is_cancelled() const -> bool
{
  const std::scoped_lock lock(mutex_);
  return cancelled_;
}
} // namespace cbinit::core
