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

#include <string>
#include <system_error>

namespace cbinit
{
/**
 * Outcome of a bootstrap step: the error code and a human readable description.
 *
 * A default constructed error represents success.
 */
class error
{
public:
  error() = default;
  error(std::error_code ec, std::string message = {});

  [[nodiscard]] auto ec() const -> std::error_code;
  [[nodiscard]] auto message() const -> const std::string&;

  /**
   * @return true if the error represents cancellation of the step
   */
  [[nodiscard]] auto is_cancellation() const -> bool;

  explicit operator bool() const;
  auto operator==(const error& other) const -> bool;

private:
  std::error_code ec_{};
  std::string message_{};
};
} // namespace cbinit
