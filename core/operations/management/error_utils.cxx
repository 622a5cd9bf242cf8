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

#include "error_utils.hxx"

#include <cbinit/error_codes.hxx>

#include <fmt/core.h>

namespace cbinit::core::operations::management
{
auto
extract_common_error_code(std::uint32_t status_code, const std::string& response_body)
  -> std::error_code
{
  switch (status_code) {
    case 401:
    case 403:
      return errc::common::authentication_failure;
    case 429:
      if (response_body.find("Limit(s) exceeded") != std::string::npos) {
        return errc::common::rate_limited;
      }
      break;
    default:
      break;
  }
  return errc::management::request_failed;
}

auto
failure_message(std::uint32_t status_code, const std::string& response_body) -> std::string
{
  if (response_body.empty()) {
    return fmt::format("Request failed with status code {}.", status_code);
  }
  return fmt::format("{}: {}", status_code, response_body);
}
} // namespace cbinit::core::operations::management
