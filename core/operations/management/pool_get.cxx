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

#include "pool_get.hxx"

#include "error_utils.hxx"

namespace cbinit::core::operations::management
{
auto
pool_get_request::encode_to(encoded_request_type& encoded) const -> std::error_code
{
  encoded.method = "GET";
  encoded.path = "/pools/default";
  return {};
}

auto
pool_get_request::make_response(error_context::http&& ctx,
                                const encoded_response_type& encoded) const -> pool_get_response
{
  pool_get_response response{ std::move(ctx) };
  if (!response.ctx.ec) {
    switch (encoded.status_code) {
      case 200:
        response.initialized = true;
        break;
      case 404:
        response.initialized = false;
        break;
      default:
        response.ctx.ec = extract_common_error_code(encoded.status_code, encoded.body);
        break;
    }
  }
  return response;
}
} // namespace cbinit::core::operations::management
