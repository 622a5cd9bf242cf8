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

#include "cluster_bootstrapper.hxx"

#include "core/logger/logger.hxx"
#include "core/management_api.hxx"
#include "core/operations/management/cluster_init.hxx"
#include "core/operations/management/pool_get.hxx"

#include <utility>

namespace cbinit::core::orchestration
{
cluster_bootstrapper::cluster_bootstrapper(std::shared_ptr<management_api> api,
                                           settings_provider settings)
  : api_{ std::move(api) }
  , settings_{ std::move(settings) }
{
}

void
cluster_bootstrapper::is_initialized(const server_node& node,
                                     const std::shared_ptr<cancellation_token>& token,
                                     std::function<void(cbinit::error, bool)>&& handler)
{
  api_->execute(node,
                operations::management::pool_get_request{},
                token,
                [handler = std::move(handler)](operations::management::pool_get_response&& resp) {
                  if (resp.ctx.ec) {
                    return handler(resp.ctx.to_error(), false);
                  }
                  handler({}, resp.initialized);
                });
}

void
cluster_bootstrapper::initialize(const server_node& node,
                                 const std::shared_ptr<cancellation_token>& token,
                                 std::function<void(cbinit::error)>&& handler)
{
  operations::management::cluster_init_request request{};
  request.settings = settings_ ? settings_() : cluster_settings{};
  request.hostname = node.hostname;
  request.services = node.services;
  CBINIT_LOG_INFO(R"(initializing cluster "{}" on node "{}" ({}), edition={})",
                  request.settings.cluster_name,
                  node.name,
                  node.hostname,
                  to_string(request.settings.edition));
  api_->execute(
    node,
    std::move(request),
    token,
    [handler = std::move(handler)](operations::management::cluster_init_response&& resp) {
      handler(resp.ctx.to_error());
    });
}

void
cluster_bootstrapper::ensure_initialized(const server_node& node,
                                         const std::shared_ptr<cancellation_token>& token,
                                         std::function<void(cbinit::error, bool)>&& handler)
{
  is_initialized(node,
                 token,
                 [self = shared_from_this(), node, token, handler = std::move(handler)](
                   cbinit::error err, bool initialized) mutable {
                   if (err) {
                     return handler(std::move(err), false);
                   }
                   if (initialized) {
                     CBINIT_LOG_DEBUG(R"(node "{}" already belongs to initialized cluster)",
                                      node.name);
                     return handler({}, false);
                   }
                   self->initialize(node, token, [handler = std::move(handler)](cbinit::error err) {
                     const bool initialized_now = !err;
                     handler(std::move(err), initialized_now);
                   });
                 });
}
} // namespace cbinit::core::orchestration
