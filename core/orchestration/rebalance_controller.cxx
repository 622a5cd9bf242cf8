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

#include "rebalance_controller.hxx"

#include "poller.hxx"

#include "core/logger/logger.hxx"
#include "core/management_api.hxx"
#include "core/operations/management/rebalance.hxx"
#include "core/operations/management/rebalance_progress_get.hxx"

#include <fmt/ranges.h>

#include <utility>

namespace cbinit::core::orchestration
{
rebalance_controller::rebalance_controller(asio::io_context& ctx,
                                           std::shared_ptr<management_api> api,
                                           std::chrono::milliseconds poll_interval)
  : ctx_{ ctx }
  , api_{ std::move(api) }
  , poll_interval_{ poll_interval }
{
}

void
rebalance_controller::trigger(const server_node& primary,
                              const std::vector<std::string>& known_hostnames,
                              const std::shared_ptr<cancellation_token>& token,
                              std::function<void(cbinit::error)>&& handler)
{
  CBINIT_LOG_INFO("rebalancing cluster with nodes [{}]", fmt::join(known_hostnames, ", "));
  operations::management::rebalance_request request{};
  request.known_nodes = known_hostnames;
  api_->execute(primary,
                std::move(request),
                token,
                [handler = std::move(handler)](operations::management::rebalance_response&& resp) {
                  handler(resp.ctx.to_error());
                });
}

void
rebalance_controller::await_completion(const server_node& primary,
                                       const std::shared_ptr<cancellation_token>& token,
                                       std::function<void(cbinit::error)>&& handler)
{
  auto progress = poller::create(ctx_, poll_interval_, token);
  progress->start(
    [api = api_, primary, token](poller::step_callback&& next) {
      api->execute(primary,
                   operations::management::rebalance_progress_get_request{},
                   token,
                   [next = std::move(next)](
                     operations::management::rebalance_progress_get_response&& resp) {
                     if (resp.ctx.ec) {
                       return next(resp.ctx.to_error(), false);
                     }
                     CBINIT_LOG_TRACE(R"(rebalance status: "{}")", resp.status);
                     next({}, resp.is_done());
                   });
    },
    [handler = std::move(handler)](cbinit::error err) {
      if (!err) {
        CBINIT_LOG_INFO("rebalance complete");
      }
      handler(std::move(err));
    });
}

void
rebalance_controller::rebalance(const server_node& primary,
                                const std::vector<std::string>& known_hostnames,
                                const std::shared_ptr<cancellation_token>& token,
                                std::function<void(cbinit::error)>&& handler)
{
  trigger(primary,
          known_hostnames,
          token,
          [self = shared_from_this(), primary, token, handler = std::move(handler)](
            cbinit::error err) mutable {
            if (err) {
              return handler(std::move(err));
            }
            self->await_completion(primary, token, std::move(handler));
          });
}
} // namespace cbinit::core::orchestration
