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

#include <cbinit/error.hxx>

#include <functional>
#include <string>
#include <string_view>

namespace cbinit::core::orchestration
{
enum class resource_command { start, stop };

constexpr auto
to_string(resource_command command) -> std::string_view
{
  return command == resource_command::start ? "start" : "stop";
}

/**
 * Starts and stops the processes behind the resources. The outcome of the command is observed
 * through the published state of the resource, the handler only reports whether the command has
 * been accepted.
 */
class resource_command_service
{
public:
  using handler_type = std::function<void(cbinit::error)>;

  virtual ~resource_command_service() = default;

  virtual void execute(const std::string& resource_name,
                       resource_command command,
                       handler_type&& handler) = 0;
};
} // namespace cbinit::core::orchestration
