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

#include "bucket_create.hxx"

#include "core/utils/url_codec.hxx"
#include "error_utils.hxx"

#include <cbinit/error_codes.hxx>

#include <string>
#include <utility>
#include <vector>

namespace cbinit::core::operations::management
{
auto
bucket_create_request::encode_to(encoded_request_type& encoded) const -> std::error_code
{
  if (name.empty()) {
    return errc::common::invalid_argument;
  }

  std::vector<std::pair<std::string, std::string>> values{
    { "name", name },
    { "bucketType", std::string{ to_string(settings.bucket_type) } },
    { "ramQuota", std::to_string(settings.effective_ram_quota_mb()) },
  };
  if (settings.num_replicas) {
    values.emplace_back("replicaNumber", std::to_string(settings.num_replicas.value()));
  }
  if (settings.flush_enabled) {
    values.emplace_back("flushEnabled", settings.flush_enabled.value() ? "1" : "0");
  }
  if (settings.storage_backend) {
    values.emplace_back("storageBackend",
                        std::string{ to_string(settings.storage_backend.value()) });
  }
  if (settings.compression_mode) {
    values.emplace_back("compressionMode",
                        std::string{ to_string(settings.compression_mode.value()) });
  }
  if (settings.conflict_resolution_type) {
    values.emplace_back("conflictResolutionType",
                        std::string{ to_string(settings.conflict_resolution_type.value()) });
  }
  if (settings.minimum_durability_level) {
    values.emplace_back("durabilityMinLevel",
                        std::string{ to_string(settings.minimum_durability_level.value()) });
  }
  if (settings.eviction_policy) {
    values.emplace_back("evictionPolicy",
                        std::string{ to_string(settings.eviction_policy.value()) });
  }
  if (settings.max_expiry) {
    values.emplace_back("maxTTL", std::to_string(settings.max_expiry.value()));
  }

  encoded.method = "POST";
  encoded.path = "/pools/default/buckets";
  encoded.headers["content-type"] = "application/x-www-form-urlencoded";
  encoded.body = utils::string_codec::form_encode(values);
  return {};
}

auto
bucket_create_request::make_response(error_context::http&& ctx,
                                     const encoded_response_type& encoded) const
  -> bucket_create_response
{
  bucket_create_response response{ std::move(ctx) };
  if (!response.ctx.ec) {
    switch (encoded.status_code) {
      case 200:
      case 202:
        break;
      case 400:
        if (encoded.body.find("Bucket with given name already exists") != std::string::npos) {
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
