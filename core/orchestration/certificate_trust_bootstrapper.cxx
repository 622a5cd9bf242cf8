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

#include "certificate_trust_bootstrapper.hxx"

#include "core/logger/logger.hxx"
#include "core/management_api.hxx"
#include "core/operations/management/certificate_reload.hxx"
#include "core/operations/management/trusted_cas_load.hxx"

#include <asio/post.hpp>

#include <utility>

namespace cbinit::core::orchestration
{
certificate_trust_bootstrapper::certificate_trust_bootstrapper(asio::io_context& ctx,
                                                               std::shared_ptr<management_api> api,
                                                               bool enabled)
  : ctx_{ ctx }
  , api_{ std::move(api) }
  , enabled_{ enabled }
{
}

auto
certificate_trust_bootstrapper::enabled() const -> bool
{
  return enabled_;
}

void
certificate_trust_bootstrapper::load_and_trust(const server_node& node,
                                               const std::shared_ptr<cancellation_token>& token,
                                               std::function<void(cbinit::error)>&& handler)
{
  if (!enabled_) {
    return asio::post(ctx_, [handler = std::move(handler)]() {
      handler({});
    });
  }

  CBINIT_LOG_INFO(R"(loading certificates of node "{}")", node.name);
  api_->execute(
    node,
    operations::management::trusted_cas_load_request{},
    token,
    [self = shared_from_this(), node, token, handler = std::move(handler)](
      operations::management::trusted_cas_load_response&& resp) mutable {
      if (resp.ctx.ec) {
        return handler(resp.ctx.to_error());
      }
      self->api_->execute(
        node,
        operations::management::certificate_reload_request{},
        token,
        [node_name = node.name, handler = std::move(handler)](
          operations::management::certificate_reload_response&& resp) {
          if (!resp.ctx.ec) {
            CBINIT_LOG_DEBUG(R"(node "{}" uses certificate signed by the cluster authority)",
                             node_name);
          }
          handler(resp.ctx.to_error());
        });
    });
}
} // namespace cbinit::core::orchestration
