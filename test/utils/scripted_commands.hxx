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

#include "core/orchestration/resource_command_service.hxx"

#include <cbinit/resource_state.hxx>

#include <asio/io_context.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace cbinit::core::orchestration
{
class resource_notification_service;
} // namespace cbinit::core::orchestration

namespace test::utils
{
/**
 * Servers that come up immediately. A started server is published as running, a stopped one as
 * exited with code zero.
 */
class scripted_commands : public cbinit::core::orchestration::resource_command_service
{
public:
  scripted_commands(
    asio::io_context& ctx,
    std::shared_ptr<cbinit::core::orchestration::resource_notification_service> notifications);

  void execute(const std::string& resource_name,
               cbinit::core::orchestration::resource_command command,
               handler_type&& handler) override;

  /**
   * The server will exit with @p exit_code instead of reaching running state.
   */
  void fail_on_start(const std::string& name, int exit_code);

  [[nodiscard]] auto history() const
    -> std::vector<std::pair<std::string, cbinit::core::orchestration::resource_command>>;

private:
  asio::io_context& ctx_;
  std::shared_ptr<cbinit::core::orchestration::resource_notification_service> notifications_;
  mutable std::mutex mutex_{};
  std::map<std::string, int> failures_{};
  std::vector<std::pair<std::string, cbinit::core::orchestration::resource_command>> history_{};
};
} // namespace test::utils
