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

#include "core/cancellation_token.hxx"
#include "core/error_context/http.hxx"
#include "core/io/http_message.hxx"
#include "core/io/http_transport.hxx"
#include "core/management_command.hxx"
#include "core/operations/management/error_utils.hxx"

#include <cbinit/cluster_settings.hxx>
#include <cbinit/topology.hxx>

#include <asio/io_context.hpp>
#include <asio/post.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace cbinit::core
{
struct management_api_options {
  core::retry_policy retry{};

  /**
   * Deadline of a single attempt.
   */
  std::chrono::milliseconds request_timeout{ std::chrono::seconds{ 75 } };
};

struct request_options {
  bool authenticated{ true };
  bool auto_retry{ true };

  /**
   * Use the plain management port even when the cluster is secured with certificate authority.
   */
  bool prefer_insecure{ false };
  std::optional<std::chrono::milliseconds> timeout{};
};

/**
 * Client of the management REST API of the cluster nodes. Selects the endpoint of the node,
 * authenticates requests and retries transient failures.
 */
class management_api
{
public:
  using credentials_provider = std::function<cluster_credentials()>;
  using raw_handler = std::function<void(error_context::http, io::http_response)>;

  management_api(asio::io_context& ctx,
                 std::shared_ptr<io::http_transport> transport,
                 credentials_provider credentials,
                 bool secure,
                 management_api_options options = {});

  /**
   * The management endpoint of the node that will receive the request.
   */
  [[nodiscard]] auto endpoint_for(const server_node& node, bool prefer_insecure) const
    -> endpoint_address;

  /**
   * "Basic" authorization header, computed on first use from the credentials provider.
   */
  [[nodiscard]] auto authorization_header() -> const std::string&;

  [[nodiscard]] auto options() const -> const management_api_options&;

  void send_request(const server_node& node,
                    io::http_request request,
                    const request_options& options,
                    const std::shared_ptr<cancellation_token>& token,
                    raw_handler&& handler);

  /**
   * Encodes the request, sends it to the node and decodes the response. Requests that fail to
   * encode are completed without touching the network.
   */
  template<typename Request, typename Handler>
  void execute(const server_node& node,
               Request request,
               const std::shared_ptr<cancellation_token>& token,
               Handler&& handler)
  {
    using encoded_response_type = typename Request::encoded_response_type;

    typename Request::encoded_request_type encoded{};
    if (auto ec = request.encode_to(encoded); ec) {
      error_context::http ctx{};
      ctx.ec = ec;
      ctx.method = encoded.method;
      ctx.path = encoded.path;
      ctx.hostname = node.hostname;
      auto response = request.make_response(std::move(ctx), encoded_response_type{});
      return asio::post(ctx_,
                        [handler = std::forward<Handler>(handler),
                         response = std::move(response)]() mutable {
                          handler(std::move(response));
                        });
    }

    request_options options{};
    options.authenticated = Request::authenticated;
    options.auto_retry = Request::auto_retry;
    options.prefer_insecure = Request::prefer_insecure;
    options.timeout = request.timeout;
    send_request(
      node,
      std::move(encoded),
      options,
      token,
      [request = std::move(request), handler = std::forward<Handler>(handler)](
        error_context::http ctx, io::http_response msg) mutable {
        auto response = request.make_response(std::move(ctx), msg);
        if (response.ctx.ec && response.ctx.error_message.empty()) {
          response.ctx.error_message = describe_failure(response.ctx);
        }
        handler(std::move(response));
      });
  }

  /**
   * Message of a failed management request: the status code and body of the response when the
   * node responded, the error otherwise.
   */
  static auto describe_failure(const error_context::http& ctx) -> std::string;

private:
  asio::io_context& ctx_;
  std::shared_ptr<io::http_transport> transport_;
  credentials_provider credentials_;
  bool secure_;
  management_api_options options_;

  std::once_flag authorization_once_{};
  std::string authorization_{};
};
} // namespace cbinit::core
