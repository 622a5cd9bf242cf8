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
#include <string>
#include <system_error>

namespace cbinit::core::operations::management
{
/**
 * Error code for a status code that the operation does not expect.
 */
auto
extract_common_error_code(std::uint32_t status_code, const std::string& response_body)
  -> std::error_code;

/**
 * "{status}: {body}", or "Request failed with status code {status}." when the body is empty.
 */
auto
failure_message(std::uint32_t status_code, const std::string& response_body) -> std::string;

constexpr auto
is_success_status(std::uint32_t status_code) -> bool
{
  return status_code >= 200 && status_code < 300;
}
} // namespace cbinit::core::operations::management
