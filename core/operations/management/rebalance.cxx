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

#include "rebalance.hxx"

#include "core/utils/url_codec.hxx"
#include "error_utils.hxx"

#include <cbinit/error_codes.hxx>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace cbinit::core::operations::management
{
auto
rebalance_request::encode_to(encoded_request_type& encoded) const -> std::error_code
{
  if (known_nodes.empty()) {
    return errc::common::invalid_argument;
  }
  std::vector<std::string> otp_nodes{};
  otp_nodes.reserve(known_nodes.size());
  for (const auto& hostname : known_nodes) {
    otp_nodes.emplace_back(fmt::format("ns_1@{}", hostname));
  }
  encoded.method = "POST";
  encoded.path = "/controller/rebalance";
  encoded.headers["content-type"] = "application/x-www-form-urlencoded";
  encoded.body = utils::string_codec::form_encode({
    { "knownNodes", fmt::format("{}", fmt::join(otp_nodes, ",")) },
  });
  return {};
}

auto
rebalance_request::make_response(error_context::http&& ctx,
                                 const encoded_response_type& encoded) const -> rebalance_response
{
  rebalance_response response{ std::move(ctx) };
  if (!response.ctx.ec && !is_success_status(encoded.status_code)) {
    response.ctx.ec = extract_common_error_code(encoded.status_code, encoded.body);
  }
  return response;
}
} // namespace cbinit::core::operations::management
