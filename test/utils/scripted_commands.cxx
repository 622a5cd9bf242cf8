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

#include "scripted_commands.hxx"

#include "core/orchestration/resource_notification_service.hxx"

#include <asio/post.hpp>

#include <optional>

namespace test::utils
{
using cbinit::core::orchestration::resource_command;

namespace
{
void
publish(cbinit::core::orchestration::resource_notification_service& notifications,
        const std::string& name,
        cbinit::resource_state state,
        std::string state_text,
        std::optional<int> exit_code = {})
{
  notifications.publish(name, [state, &state_text, exit_code](cbinit::resource_snapshot& s) {
    s.state = state;
    s.state_text = state_text;
    s.exit_code = exit_code;
  });
}
} // namespace

scripted_commands::scripted_commands(
  asio::io_context& ctx,
  std::shared_ptr<cbinit::core::orchestration::resource_notification_service> notifications)
  : ctx_{ ctx }
  , notifications_{ std::move(notifications) }
{
}

void
scripted_commands::execute(const std::string& resource_name,
                           resource_command command,
                           handler_type&& handler)
{
  std::optional<int> failure{};
  {
    const std::scoped_lock lock(mutex_);
    history_.emplace_back(resource_name, command);
    if (auto it = failures_.find(resource_name); it != failures_.end()) {
      failure = it->second;
    }
  }
  asio::post(ctx_,
             [notifications = notifications_,
              resource_name,
              command,
              failure,
              handler = std::move(handler)]() {
               if (command == resource_command::start) {
                 publish(*notifications, resource_name, cbinit::resource_state::starting, "Starting");
                 if (failure) {
                   publish(*notifications,
                           resource_name,
                           cbinit::resource_state::exited,
                           "Exited",
                           failure.value());
                 } else {
                   publish(*notifications, resource_name, cbinit::resource_state::running, "Running");
                 }
               } else {
                 publish(*notifications, resource_name, cbinit::resource_state::stopping, "Stopping");
                 publish(*notifications, resource_name, cbinit::resource_state::exited, "Exited", 0);
               }
               handler({});
             });
}

void
scripted_commands::fail_on_start(const std::string& name, int exit_code)
{
  const std::scoped_lock lock(mutex_);
  failures_[name] = exit_code;
}

auto
scripted_commands::history() const -> std::vector<std::pair<std::string, resource_command>>
{
  const std::scoped_lock lock(mutex_);
  return history_;
}
} // namespace test::utils
