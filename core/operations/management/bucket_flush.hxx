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

#include "core/error_context/http.hxx"
#include "core/io/http_message.hxx"

#include <chrono>
#include <optional>
#include <string>
#include <system_error>

namespace cbinit::core::operations::management
{
struct bucket_flush_response {
  error_context::http ctx;
};

struct bucket_flush_request {
  using response_type = bucket_flush_response;
  using encoded_request_type = io::http_request;
  using encoded_response_type = io::http_response;
  using error_context_type = error_context::http;

  static constexpr bool authenticated{ true };
  static constexpr bool prefer_insecure{ false };
  static constexpr bool auto_retry{ true };

  std::string name{};

  std::optional<std::chrono::milliseconds> timeout{};

  [[nodiscard]] auto encode_to(encoded_request_type& encoded) const -> std::error_code;

  [[nodiscard]] auto make_response(error_context::http&& ctx,
                                   const encoded_response_type& encoded) const
    -> bucket_flush_response;
};
} // namespace cbinit::core::operations::management
