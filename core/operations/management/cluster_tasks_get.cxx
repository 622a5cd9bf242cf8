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

#include "cluster_tasks_get.hxx"

#include "core/management/cluster_task_json.hxx"
#include "core/utils/json.hxx"
#include "error_utils.hxx"

#include <cbinit/error_codes.hxx>

#include <tao/json/value.hpp>

#include <stdexcept>

namespace cbinit::core::operations::management
{
auto
cluster_tasks_get_request::encode_to(encoded_request_type& encoded) const -> std::error_code
{
  encoded.method = "GET";
  encoded.path = "/pools/default/tasks";
  return {};
}

auto
cluster_tasks_get_request::make_response(error_context::http&& ctx,
                                         const encoded_response_type& encoded) const
  -> cluster_tasks_get_response
{
  cluster_tasks_get_response response{ std::move(ctx) };
  if (!response.ctx.ec) {
    if (encoded.status_code != 200) {
      response.ctx.ec = extract_common_error_code(encoded.status_code, encoded.body);
      return response;
    }
    try {
      auto payload = utils::json::parse(encoded.body);
      if (payload.is_array()) {
        for (const auto& entry : payload.get_array()) {
          response.tasks.emplace_back(entry.as<core::management::cluster_task>());
        }
      } else if (!payload.is_null()) {
        response.ctx.ec = errc::common::parsing_failure;
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
