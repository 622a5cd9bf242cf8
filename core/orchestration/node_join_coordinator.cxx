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

#include "node_join_coordinator.hxx"

#include "certificate_trust_bootstrapper.hxx"
#include "resource_notification_service.hxx"

#include "core/logger/logger.hxx"
#include "core/management_api.hxx"
#include "core/operations/management/alternate_addresses_setup.hxx"
#include "core/operations/management/node_add.hxx"
#include "core/operations/management/node_services_get.hxx"

#include <cbinit/error_codes.hxx>
#include <cbinit/fmt/error.hxx>

#include <fmt/core.h>

#include <algorithm>
#include <mutex>
#include <utility>

namespace cbinit::core::orchestration
{
namespace
{
auto
make_alternate_addresses_request(const server_node& node)
  -> operations::management::alternate_addresses_setup_request
{
  operations::management::alternate_addresses_setup_request request{};
  request.hostname = node.external_hostname;
  for (const auto& [endpoint_name, port] : node.endpoints) {
    if (auto key = alternate_address_service_key(endpoint_name); key) {
      request.ports[key.value()] = port;
    }
  }
  return request;
}

struct join_barrier {
  std::mutex mutex{};
  std::size_t remaining{};
  std::vector<join_result> results{};
  node_join_coordinator::join_all_handler handler{};
};
} // namespace

node_join_coordinator::node_join_coordinator(
  std::shared_ptr<management_api> api,
  std::shared_ptr<resource_notification_service> notifications,
  std::shared_ptr<certificate_trust_bootstrapper> trust,
  credentials_provider credentials)
  : api_{ std::move(api) }
  , notifications_{ std::move(notifications) }
  , trust_{ std::move(trust) }
  , credentials_{ std::move(credentials) }
{
}

void
node_join_coordinator::join_all(const server_node& primary,
                                const std::vector<server_node>& nodes,
                                const std::vector<std::string>& existing_nodes,
                                const std::shared_ptr<cancellation_token>& token,
                                join_all_handler&& handler)
{
  if (nodes.empty()) {
    return handler({});
  }

  auto barrier = std::make_shared<join_barrier>();
  barrier->remaining = nodes.size();
  barrier->results.resize(nodes.size());
  barrier->handler = std::move(handler);

  for (std::size_t i = 0; i < nodes.size(); ++i) {
    const auto& node = nodes[i];
    const bool already_member =
      std::find(existing_nodes.begin(), existing_nodes.end(), node.cluster_node_address()) !=
      existing_nodes.end();
    join(primary, node, already_member, token, [barrier, i](join_result result) {
      join_all_handler done{};
      std::vector<join_result> results{};
      {
        const std::scoped_lock lock(barrier->mutex);
        barrier->results[i] = std::move(result);
        if (--barrier->remaining > 0) {
          return;
        }
        std::swap(done, barrier->handler);
        std::swap(results, barrier->results);
      }
      done(std::move(results));
    });
  }
}

void
node_join_coordinator::join(const server_node& primary,
                            const server_node& node,
                            bool already_member,
                            const std::shared_ptr<cancellation_token>& token,
                            std::function<void(join_result)>&& handler)
{
  CBINIT_LOG_INFO(R"(waiting for node "{}" to be running)", node.name);
  notifications_->wait_for(
    node.name,
    [](const resource_snapshot& snapshot) {
      return snapshot.state == resource_state::running || is_terminal(snapshot.state);
    },
    token,
    [self = shared_from_this(), primary, node, already_member, token, handler = std::move(handler)](
      std::error_code ec, const resource_snapshot& snapshot) mutable {
      if (ec) {
        return handler({ node.name, false, false, cbinit::error{ ec } });
      }
      if (snapshot.state != resource_state::running) {
        return handler({ node.name,
                         false,
                         already_member,
                         { errc::orchestration::server_not_initialized,
                           fmt::format(R"(node "{}" has stopped before joining the cluster ({}))",
                                       node.name,
                                       to_string(snapshot.state)) } });
      }

      auto advertise = [self, node, token, handler](bool added) mutable {
        self->set_alternate_addresses(
          node,
          !added,
          token,
          [self, node, added, handler = std::move(handler)](cbinit::error err) mutable {
            if (!err) {
              self->mark_initialized(node, true);
            }
            handler({ node.name, added, true, std::move(err) });
          });
      };

      if (already_member) {
        CBINIT_LOG_DEBUG(R"(node "{}" is already member of the cluster)", node.name);
        return advertise(false);
      }

      self->trust_->load_and_trust(
        node,
        token,
        [self, primary, node, token, handler, advertise](cbinit::error err) mutable {
          if (err) {
            return handler({ node.name, false, false, std::move(err) });
          }
          self->add_node(
            primary,
            node,
            token,
            [node, handler, advertise](cbinit::error err) mutable {
              if (err) {
                return handler({ node.name, false, false, std::move(err) });
              }
              advertise(true);
            });
        });
    });
}

void
node_join_coordinator::add_node(const server_node& primary,
                                const server_node& node,
                                const std::shared_ptr<cancellation_token>& token,
                                std::function<void(cbinit::error)>&& handler)
{
  CBINIT_LOG_INFO(R"(adding node "{}" ({}) to the cluster through "{}")",
                  node.name,
                  node.hostname,
                  primary.name);
  operations::management::node_add_request request{};
  request.credentials = credentials_ ? credentials_() : cluster_credentials{};
  request.hostname = node.hostname;
  request.services = node.services;
  api_->execute(primary,
                std::move(request),
                token,
                [handler = std::move(handler)](operations::management::node_add_response&& resp) {
                  handler(resp.ctx.to_error());
                });
}

void
node_join_coordinator::set_alternate_addresses(const server_node& node,
                                               bool skip_if_unchanged,
                                               const std::shared_ptr<cancellation_token>& token,
                                               std::function<void(cbinit::error)>&& handler)
{
  auto request = make_alternate_addresses_request(node);

  auto apply = [self = shared_from_this(), node, token, request, handler]() mutable {
    CBINIT_LOG_INFO(R"(setting alternate address of node "{}" to "{}" with {} port(s))",
                    node.name,
                    request.hostname,
                    request.ports.size());
    self->api_->execute(
      node,
      std::move(request),
      token,
      [handler](operations::management::alternate_addresses_setup_response&& resp) {
        handler(resp.ctx.to_error());
      });
  };

  if (!skip_if_unchanged) {
    return apply();
  }

  api_->execute(node,
                operations::management::node_services_get_request{},
                token,
                [node_name = node.name, request, handler, apply](
                  operations::management::node_services_get_response&& resp) mutable {
                  if (resp.ctx.ec) {
                    return handler(resp.ctx.to_error());
                  }
                  if (const auto& current = resp.node.external_address;
                      current && current->hostname == request.hostname &&
                      current->ports == request.ports) {
                    CBINIT_LOG_DEBUG(R"(alternate address of node "{}" is up to date)", node_name);
                    return handler({});
                  }
                  apply();
                });
}

void
node_join_coordinator::mark_initialized(const server_node& node, bool initialized)
{
  notifications_->publish(node.name, [initialized](resource_snapshot& snapshot) {
    if (initialized) {
      snapshot.properties[server_initialized_property] = "true";
    } else {
      snapshot.properties.erase(server_initialized_property);
    }
  });
}
} // namespace cbinit::core::orchestration
