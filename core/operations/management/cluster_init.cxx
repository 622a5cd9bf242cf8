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

#include "cluster_init.hxx"

#include "core/utils/url_codec.hxx"
#include "error_utils.hxx"

#include <cbinit/error_codes.hxx>

#include <string>
#include <utility>
#include <vector>

namespace cbinit::core::operations::management
{
auto
cluster_init_request::encode_to(encoded_request_type& encoded) const -> std::error_code
{
  if (hostname.empty() || settings.credentials.password.empty() || services == service::none) {
    return errc::common::invalid_argument;
  }

  const auto& quotas = settings.quotas;
  std::vector<std::pair<std::string, std::string>> values{
    { "username", settings.credentials.username },
    { "password", settings.credentials.password },
    { "clusterName", settings.cluster_name },
    { "hostname", hostname },
    { "memoryQuota", std::to_string(quotas.data_mb) },
    { "queryMemoryQuota", std::to_string(quotas.query_mb) },
    { "indexMemoryQuota", std::to_string(quotas.index_mb) },
    { "ftsMemoryQuota", std::to_string(quotas.search_mb) },
    { "indexerStorageMode", std::string{ to_string(settings.effective_index_storage_mode()) } },
    { "services", to_management_services(services) },
    { "port", settings.management_port },
  };
  if (settings.edition == edition::enterprise) {
    values.emplace_back("cbasMemoryQuota", std::to_string(quotas.analytics_mb));
    values.emplace_back("eventingMemoryQuota", std::to_string(quotas.eventing_mb));
    values.emplace_back("nodeEncryption", "on");
  }

  encoded.method = "POST";
  encoded.path = "/clusterInit";
  encoded.headers["content-type"] = "application/x-www-form-urlencoded";
  encoded.body = utils::string_codec::form_encode(values);
  return {};
}

auto
cluster_init_request::make_response(error_context::http&& ctx,
                                    const encoded_response_type& encoded) const
  -> cluster_init_response
{
  cluster_init_response response{ std::move(ctx) };
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
