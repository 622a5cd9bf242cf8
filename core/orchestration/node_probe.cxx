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

#include "node_probe.hxx"

#include "poller.hxx"
#include "resource_notification_service.hxx"

#include "core/logger/logger.hxx"
#include "core/management_api.hxx"

#include <cbinit/error_codes.hxx>
#include <cbinit/fmt/error.hxx>

#include <asio/post.hpp>

#include <fmt/format.h>

#include <utility>

namespace cbinit::core::orchestration
{
node_probe::node_probe(asio::io_context& ctx,
                       std::shared_ptr<management_api> api,
                       std::shared_ptr<resource_notification_service> notifications,
                       cluster_topology topology,
                       node_probe_options options)
  : ctx_{ ctx }
  , api_{ std::move(api) }
  , notifications_{ std::move(notifications) }
  , topology_{ std::move(topology) }
  , options_{ options }
{
}

void
node_probe::execute(const std::string& resource_name,
                    resource_command command,
                    handler_type&& handler)
{
  auto node = topology_.find_server(resource_name);
  if (!node) {
    return asio::post(ctx_, [resource_name, command, handler = std::move(handler)]() {
      handler({ errc::orchestration::unsupported_command,
                fmt::format(R"(unable to {} "{}", only servers are supported)",
                            to_string(command),
                            resource_name) });
    });
  }

  if (command == resource_command::start) {
    start(node.value());
  } else {
    stop(node.value());
  }
  asio::post(ctx_, [handler = std::move(handler)]() {
    handler({});
  });
}

void
node_probe::start_all()
{
  for (const auto& node : topology_.servers()) {
    start(node);
  }
}

void
node_probe::shutdown()
{
  std::map<std::string, std::shared_ptr<cancellation_token>> probes{};
  {
    const std::scoped_lock lock(probes_mutex_);
    std::swap(probes, probes_);
  }
  for (const auto& [name, token] : probes) {
    token->cancel();
  }
}

void
node_probe::start(const server_node& node)
{
  auto token = cancellation_token::create();
  {
    const std::scoped_lock lock(probes_mutex_);
    if (auto it = probes_.find(node.name); it != probes_.end()) {
      CBINIT_LOG_DEBUG(R"(node "{}" is already being probed)", node.name);
      return;
    }
    probes_[node.name] = token;
  }
  notifications_->publish(node.name, [](resource_snapshot& snapshot) {
    snapshot.state = resource_state::starting;
    snapshot.state_text = "Starting";
    snapshot.exit_code.reset();
  });
  probe(node, std::move(token));
}

void
node_probe::stop(const server_node& node)
{
  std::shared_ptr<cancellation_token> token{};
  {
    const std::scoped_lock lock(probes_mutex_);
    if (auto it = probes_.find(node.name); it != probes_.end()) {
      token = std::move(it->second);
      probes_.erase(it);
    }
  }
  if (token) {
    token->cancel();
  }
  CBINIT_LOG_INFO(R"(node "{}" stopped)", node.name);
  notifications_->publish(node.name, [](resource_snapshot& snapshot) {
    snapshot.state = resource_state::exited;
    snapshot.state_text = "Exited";
    snapshot.exit_code = 0;
  });
}

void
node_probe::probe(const server_node& node, std::shared_ptr<cancellation_token> token)
{
  CBINIT_LOG_DEBUG(R"(probing management endpoint of node "{}")", node.name);
  auto probe = poller::create(ctx_, options_.interval, token);
  probe->start(
    [api = api_, node, token, timeout = options_.request_timeout](poller::step_callback&& next) {
      io::http_request request{};
      request.method = "GET";
      request.path = "/pools";

      request_options options{};
      options.authenticated = false;
      options.auto_retry = false;
      options.prefer_insecure = true;
      options.timeout = timeout;
      api->send_request(node,
                        std::move(request),
                        options,
                        token,
                        [next = std::move(next)](error_context::http ctx, io::http_response msg) {
                          if (ctx.ec || msg.status_code != 200) {
                            CBINIT_LOG_TRACE("probe of {}:{} failed, ec={}, status={}",
                                             ctx.hostname,
                                             ctx.port,
                                             ctx.ec.message(),
                                             msg.status_code);
                            return next({}, false);
                          }
                          next({}, true);
                        });
    },
    [self = shared_from_this(), node, token](cbinit::error err) {
      if (err) {
        CBINIT_LOG_DEBUG(R"(probing of node "{}" stopped: {})", node.name, err);
        return;
      }
      {
        const std::scoped_lock lock(self->probes_mutex_);
        if (auto it = self->probes_.find(node.name);
            it == self->probes_.end() || it->second != token) {
          return;
        }
      }
      CBINIT_LOG_INFO(R"(node "{}" is running)", node.name);
      self->notifications_->publish(node.name, [](resource_snapshot& snapshot) {
        snapshot.state = resource_state::running;
        snapshot.state_text = "Running";
      });
    });
}
} // namespace cbinit::core::orchestration
