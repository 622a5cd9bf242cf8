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

#include "alternate_addresses_setup.hxx"

#include "core/utils/url_codec.hxx"
#include "error_utils.hxx"

#include <cbinit/error_codes.hxx>

#include <utility>
#include <vector>

namespace cbinit::core::operations::management
{
auto
alternate_addresses_setup_request::encode_to(encoded_request_type& encoded) const
  -> std::error_code
{
  if (hostname.empty()) {
    return errc::common::invalid_argument;
  }
  std::vector<std::pair<std::string, std::string>> values{ { "hostname", hostname } };
  for (const auto& [key, port] : ports) {
    values.emplace_back(key, std::to_string(port));
  }
  encoded.method = "PUT";
  encoded.path = "/node/controller/setupAlternateAddresses/external";
  encoded.headers["content-type"] = "application/x-www-form-urlencoded";
  encoded.body = utils::string_codec::form_encode(values);
  return {};
}

auto
alternate_addresses_setup_request::make_response(error_context::http&& ctx,
                                                 const encoded_response_type& encoded) const
  -> alternate_addresses_setup_response
{
  alternate_addresses_setup_response response{ std::move(ctx) };
  if (!response.ctx.ec && !is_success_status(encoded.status_code)) {
    if (encoded.status_code == 400) {
      response.ctx.ec = errc::common::invalid_argument;
    } else {
      response.ctx.ec = extract_common_error_code(encoded.status_code, encoded.body);
    }
  }
  return response;
}
} // namespace cbinit::core::operations::management
