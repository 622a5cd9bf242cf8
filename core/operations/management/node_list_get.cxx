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

#include "node_list_get.hxx"

#include "core/management/cluster_node_json.hxx"
#include "core/utils/json.hxx"
#include "error_utils.hxx"

#include <cbinit/error_codes.hxx>

#include <tao/json/value.hpp>

#include <stdexcept>

namespace cbinit::core::operations::management
{
auto
node_list_get_request::encode_to(encoded_request_type& encoded) const -> std::error_code
{
  encoded.method = "GET";
  encoded.path = "/pools/nodes";
  return {};
}

auto
node_list_get_request::make_response(error_context::http&& ctx,
                                     const encoded_response_type& encoded) const
  -> node_list_get_response
{
  node_list_get_response response{ std::move(ctx) };
  if (!response.ctx.ec) {
    if (encoded.status_code != 200) {
      response.ctx.ec = extract_common_error_code(encoded.status_code, encoded.body);
      return response;
    }
    try {
      auto payload = utils::json::parse(encoded.body);
      for (const auto& entry : payload.at("nodes").get_array()) {
        response.nodes.emplace_back(entry.as<core::management::cluster_node>());
      }
    } catch (const tao::pegtl::parse_error&) {
      response.ctx.ec = errc::common::parsing_failure;
    } catch (const std::logic_error&) {
      response.ctx.ec = errc::common::parsing_failure;
    }
  }
  return response;
}
} // namespace cbinit::core::operations::management
