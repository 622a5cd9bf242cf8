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

#include "management_api.hxx"

#include "core/logger/logger.hxx"

#include <cbinit/error_codes.hxx>

#include <openssl/evp.h>

#include <fmt/core.h>
#include <gsl/util>

#include <vector>

namespace cbinit::core
{
namespace
{
auto
base64_encode(const std::string& input) -> std::string
{
  if (input.empty()) {
    return {};
  }
  std::vector<unsigned char> output(4 * ((input.size() + 2) / 3) + 1);
  const auto written = EVP_EncodeBlock(output.data(),
                                       reinterpret_cast<const unsigned char*>(input.data()),
                                       gsl::narrow_cast<int>(input.size()));
  return { reinterpret_cast<const char*>(output.data()), gsl::narrow_cast<std::size_t>(written) };
}
} // namespace

management_api::management_api(asio::io_context& ctx,
                               std::shared_ptr<io::http_transport> transport,
                               credentials_provider credentials,
                               bool secure,
                               management_api_options options)
  : ctx_{ ctx }
  , transport_{ std::move(transport) }
  , credentials_{ std::move(credentials) }
  , secure_{ secure }
  , options_{ options }
{
}

auto
management_api::endpoint_for(const server_node& node, bool prefer_insecure) const
  -> endpoint_address
{
  return node.management_endpoint(secure_ && !prefer_insecure);
}

auto
management_api::authorization_header() -> const std::string&
{
  std::call_once(authorization_once_, [this]() {
    cluster_credentials credentials{};
    if (credentials_) {
      credentials = credentials_();
    }
    authorization_ = fmt::format(
      "Basic {}", base64_encode(fmt::format("{}:{}", credentials.username, credentials.password)));
  });
  return authorization_;
}

auto
management_api::options() const -> const management_api_options&
{
  return options_;
}

void
management_api::send_request(const server_node& node,
                             io::http_request request,
                             const request_options& options,
                             const std::shared_ptr<cancellation_token>& token,
                             raw_handler&& handler)
{
  if (options.authenticated) {
    request.headers["authorization"] = authorization_header();
  }
  request.timeout = options.timeout.value_or(options_.request_timeout);

  auto cmd = std::make_shared<management_command>(ctx_,
                                                  transport_,
                                                  endpoint_for(node, options.prefer_insecure),
                                                  std::move(request),
                                                  options.auto_retry,
                                                  options_.retry,
                                                  token);
  cmd->start([node_name = node.name, handler = std::move(handler)](
               error_context::http ctx, io::http_response msg) mutable {
    if (ctx.ec && ctx.ec != errc::common::request_canceled) {
      CBINIT_LOG_DEBUG(R"(management request to "{}" failed: method={}, path="{}", ec={}, status={}, attempts={})",
                       node_name,
                       ctx.method,
                       ctx.path,
                       ctx.ec.message(),
                       ctx.http_status,
                       ctx.attempts);
    }
    handler(std::move(ctx), std::move(msg));
  });
}

auto
management_api::describe_failure(const error_context::http& ctx) -> std::string
{
  if (ctx.http_status != 0 && !operations::management::is_success_status(ctx.http_status)) {
    return operations::management::failure_message(ctx.http_status, ctx.http_body);
  }
  return ctx.ec.message();
}
} // namespace cbinit::core
