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

#include "sample_bucket_install.hxx"

#include "core/utils/json.hxx"
#include "error_utils.hxx"

#include <cbinit/error_codes.hxx>

#include <tao/json/value.hpp>

#include <stdexcept>

namespace cbinit::core::operations::management
{
auto
sample_bucket_install_request::encode_to(encoded_request_type& encoded) const -> std::error_code
{
  if (name.empty()) {
    return errc::common::invalid_argument;
  }
  encoded.method = "POST";
  encoded.path = "/sampleBuckets/install";
  encoded.headers["content-type"] = "application/json";
  encoded.body = utils::json::generate(tao::json::value::array({ name }));
  return {};
}

auto
sample_bucket_install_request::make_response(error_context::http&& ctx,
                                             const encoded_response_type& encoded) const
  -> sample_bucket_install_response
{
  sample_bucket_install_response response{ std::move(ctx) };
  if (!response.ctx.ec) {
    switch (encoded.status_code) {
      case 200:
      case 202:
        try {
          auto payload = utils::json::parse(encoded.body);
          // the loading task is optional, without it the bucket is ready
          const auto* tasks = payload.is_object() ? payload.find("tasks") : nullptr;
          if (tasks != nullptr && tasks->is_array() && !tasks->get_array().empty()) {
            const auto& task = tasks->get_array().front();
            if (const auto* task_id = task.is_object() ? task.find("taskId") : nullptr;
                task_id != nullptr && task_id->is_string()) {
              response.task_id = task_id->get_string();
            }
          }
        } catch (const tao::pegtl::parse_error&) {
          response.ctx.ec = errc::common::parsing_failure;
        } catch (const std::logic_error&) {
          response.ctx.ec = errc::common::parsing_failure;
        }
        break;
      case 400:
        if (encoded.body.find("already loaded") != std::string::npos) {
          response.ctx.ec = errc::management::bucket_exists;
        } else {
          response.ctx.ec = errc::common::invalid_argument;
        }
        break;
      default:
        response.ctx.ec = extract_common_error_code(encoded.status_code, encoded.body);
        break;
    }
  }
  return response;
}
} // namespace cbinit::core::operations::management
