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
#include <system_error>

namespace cbinit::core::operations::management
{
struct certificate_reload_response {
  error_context::http ctx;
};

/**
 * Reloads the node certificate from the inbox directory of the node.
 *
 * The node does not trust the certificate authority yet, so the request uses the plain port and
 * no credentials.
 */
struct certificate_reload_request {
  using response_type = certificate_reload_response;
  using encoded_request_type = io::http_request;
  using encoded_response_type = io::http_response;
  using error_context_type = error_context::http;

  static constexpr bool authenticated{ false };
  static constexpr bool prefer_insecure{ true };
  static constexpr bool auto_retry{ true };

  std::optional<std::chrono::milliseconds> timeout{};

  [[nodiscard]] auto encode_to(encoded_request_type& encoded) const -> std::error_code;

  [[nodiscard]] auto make_response(error_context::http&& ctx,
                                   const encoded_response_type& encoded) const
    -> certificate_reload_response;
};
} // namespace cbinit::core::operations::management
