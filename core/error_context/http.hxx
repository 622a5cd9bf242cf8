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

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

namespace cbinit::core::error_context
{
/**
 * Details of a management request, available on every response.
 */
struct http {
  std::error_code ec{};
  std::string method{};
  std::string path{};
  std::uint32_t http_status{};
  std::string http_body{};
  std::string hostname{};
  std::uint16_t port{};

  /**
   * Number of times the request has been sent, including the first attempt.
   */
  std::size_t attempts{};

  /**
   * Human readable description of the failure, built from the status code and response body.
   */
  std::string error_message{};

  [[nodiscard]] auto to_error() const -> cbinit::error
  {
    if (!ec) {
      return {};
    }
    return { ec, error_message.empty() ? ec.message() : error_message };
  }
};
} // namespace cbinit::core::error_context
