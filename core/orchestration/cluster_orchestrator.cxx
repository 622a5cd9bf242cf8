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

#include "cluster_orchestrator.hxx"

#include "bucket_provisioner.hxx"
#include "certificate_trust_bootstrapper.hxx"
#include "cluster_bootstrapper.hxx"
#include "rebalance_controller.hxx"
#include "resource_notification_service.hxx"

#include "core/logger/logger.hxx"
#include "core/operations/management/node_list_get.hxx"

#include <cbinit/error_codes.hxx>
#include <cbinit/fmt/error.hxx>
#include <cbinit/fmt/resource_state.hxx>

#include <asio/post.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <utility>

namespace cbinit::core::orchestration
{
namespace
{
constexpr auto connection_string_property{ "connection_string" };

auto
is_active(resource_state state) -> bool
{
  return state == resource_state::starting || state == resource_state::running;
}

auto
can_start(resource_state state) -> bool
{
  return state == resource_state::not_started || is_terminal(state);
}
} // namespace

auto
cluster_orchestrator::create(asio::io_context& ctx,
                             cluster_topology topology,
                             orchestrator_dependencies dependencies,
                             orchestrator_options options) -> std::shared_ptr<cluster_orchestrator>
{
  auto orchestrator = std::make_shared<cluster_orchestrator>(
    ctx, std::move(topology), std::move(dependencies), std::move(options));
  orchestrator->watch_id_ =
    orchestrator->notifications_->watch([weak = orchestrator->weak_from_this()](
                                          const resource_snapshot& snapshot) {
      if (auto self = weak.lock(); self) {
        self->on_resource_changed(snapshot);
      }
    });
  return orchestrator;
}

cluster_orchestrator::cluster_orchestrator(asio::io_context& ctx,
                                           cluster_topology topology,
                                           orchestrator_dependencies dependencies,
                                           orchestrator_options options)
  : ctx_{ ctx }
  , topology_{ std::move(topology) }
  , options_{ std::move(options) }
  , api_{ std::move(dependencies.api) }
  , notifications_{ std::move(dependencies.notifications) }
  , commands_{ std::move(dependencies.commands) }
{
  bootstrapper_ = std::make_shared<cluster_bootstrapper>(api_, [topology = topology_]() {
    return topology.settings();
  });
  trust_ = std::make_shared<certificate_trust_bootstrapper>(
    ctx_, api_, topology_.has_certificate_authority());
  joiner_ = std::make_shared<node_join_coordinator>(
    api_, notifications_, trust_, [topology = topology_]() {
      return topology.credentials();
    });
  rebalancer_ =
    std::make_shared<rebalance_controller>(ctx_, api_, options_.rebalance_poll_interval);
  provisioner_ = std::make_shared<bucket_provisioner>(
    ctx_,
    api_,
    bucket_provisioner_options{ options_.bucket_health_poll_interval,
                                options_.sample_task_poll_interval });
  register_resources();
}

cluster_orchestrator::~cluster_orchestrator()
{
  if (watch_id_ != 0) {
    notifications_->unwatch(watch_id_);
  }
  root_token_->cancel();
}

auto
cluster_orchestrator::topology() const -> const cluster_topology&
{
  return topology_;
}

auto
cluster_orchestrator::notifications() const -> std::shared_ptr<resource_notification_service>
{
  return notifications_;
}

void
cluster_orchestrator::register_resources()
{
  notifications_->register_resource(
    { topology_.name(), resource_kind::cluster, {}, resource_state::not_started, "Not started" });
  for (const auto& group : topology_.groups()) {
    notifications_->register_resource({ group.name,
                                        resource_kind::server_group,
                                        topology_.name(),
                                        resource_state::not_started,
                                        "Not started" });
    for (const auto& server : group.servers) {
      notifications_->register_resource({ server.name,
                                          resource_kind::server,
                                          group.name,
                                          resource_state::not_started,
                                          "Not started" });
    }
  }
  for (const auto& bucket : topology_.buckets()) {
    notifications_->register_resource({ bucket.name,
                                        resource_kind::bucket,
                                        topology_.name(),
                                        resource_state::not_started,
                                        "Not started" });
  }
}

void
cluster_orchestrator::on_resource_changed(const resource_snapshot& snapshot)
{
  if (snapshot.kind == resource_kind::server && is_terminal(snapshot.state) &&
      snapshot.property(server_initialized_property)) {
    CBINIT_LOG_DEBUG(R"(node "{}" has exited and needs to be initialized again)", snapshot.name);
    notifications_->publish(snapshot.name, [](resource_snapshot& s) {
      s.properties.erase(server_initialized_property);
    });
    return;
  }

  if (snapshot.kind == resource_kind::bucket &&
      (snapshot.state == resource_state::stopping || is_terminal(snapshot.state))) {
    std::shared_ptr<cancellation_token> token{};
    {
      const std::scoped_lock lock(tasks_mutex_);
      if (auto it = bucket_tasks_.find(snapshot.name); it != bucket_tasks_.end()) {
        token = std::move(it->second);
        bucket_tasks_.erase(it);
      }
    }
    if (token) {
      token->cancel();
    }
  }
}

auto
cluster_orchestrator::state_of(const std::string& name) const -> std::optional<resource_state>
{
  if (auto snapshot = notifications_->current(name); snapshot) {
    return snapshot->state;
  }
  return {};
}

auto
cluster_orchestrator::cluster_token() const -> std::shared_ptr<cancellation_token>
{
  const std::scoped_lock lock(tasks_mutex_);
  return cluster_token_ ? cluster_token_ : root_token_;
}

void
cluster_orchestrator::publish_state(const std::string& name,
                                    resource_state state,
                                    std::string state_text,
                                    std::optional<int> exit_code,
                                    bool propagate,
                                    bool include_buckets)
{
  CBINIT_LOG_DEBUG(R"(resource "{}" is {} ({}))", name, state, state_text);
  notifications_->publish(name, [state, state_text, exit_code](resource_snapshot& snapshot) {
    snapshot.state = state;
    snapshot.state_text = state_text;
    snapshot.exit_code = exit_code;
  });
  if (!propagate) {
    return;
  }
  for (const auto& child : notifications_->children_of(name)) {
    if (child.kind == resource_kind::bucket && !include_buckets) {
      continue;
    }
    std::optional<int> child_exit_code{};
    if (exit_code) {
      child_exit_code = 0;
    }
    notifications_->publish(
      child.name, [state, state_text, child_exit_code](resource_snapshot& snapshot) {
        snapshot.state = state;
        snapshot.state_text = state_text;
        snapshot.exit_code = child_exit_code;
      });
  }
}

void
cluster_orchestrator::publish_state_text(const std::string& name, std::string state_text)
{
  notifications_->publish(name, [state_text = std::move(state_text)](resource_snapshot& snapshot) {
    snapshot.state_text = state_text;
  });
}

void
cluster_orchestrator::start()
{
  const auto& name = topology_.name();
  if (auto state = state_of(name); !state || !can_start(state.value())) {
    CBINIT_LOG_DEBUG(R"(cluster "{}" is already {}, ignoring start)",
                     name,
                     state.value_or(resource_state::not_started));
    return;
  }

  auto context = std::make_shared<bootstrap_context>();
  context->token = cancellation_token::linked(root_token_);
  {
    const std::scoped_lock lock(tasks_mutex_);
    if (cluster_token_) {
      cluster_token_->cancel();
    }
    cluster_token_ = context->token;
  }

  CBINIT_LOG_INFO(R"(starting cluster "{}")", name);
  publish_state(name, resource_state::starting, "Starting", {}, true);

  if (auto ec = topology_.validate(); ec) {
    return on_bootstrap_finished(context, { ec, "topology is not valid" });
  }
  context->primary = topology_.primary().value();
  for (const auto& server : topology_.servers()) {
    if (server.name != context->primary.name) {
      context->others.push_back(server);
    }
  }

  if (commands_) {
    for (const auto& server : topology_.servers()) {
      if (auto state = state_of(server.name); state && can_start(state.value())) {
        publish_state(server.name, resource_state::starting, "Starting");
        commands_->execute(
          server.name,
          resource_command::start,
          [self = shared_from_this(), name = server.name](cbinit::error err) {
            if (err) {
              CBINIT_LOG_WARNING(R"(unable to start node "{}": {})", name, err);
              self->publish_state(name, resource_state::failed_to_start, err.message(), 1);
            }
          });
      }
    }
  }

  for (const auto& bucket : topology_.buckets()) {
    start_bucket(bucket);
  }

  run_bootstrap(std::move(context), 0);
}

void
cluster_orchestrator::run_bootstrap(std::shared_ptr<bootstrap_context> context, std::size_t step)
{
  static const std::array<bootstrap_step, 5> steps{
    &cluster_orchestrator::wait_for_primary,   &cluster_orchestrator::initialize_primary,
    &cluster_orchestrator::join_nodes,         &cluster_orchestrator::rebalance_if_needed,
    &cluster_orchestrator::publish_running,
  };

  if (step >= steps.size()) {
    return on_bootstrap_finished(context, {});
  }
  if (context->token->is_cancelled()) {
    return on_bootstrap_finished(context, { errc::common::request_canceled });
  }
  (this->*steps.at(step))(
    context, [self = shared_from_this(), context, step](cbinit::error err) {
      if (err) {
        return self->on_bootstrap_finished(context, std::move(err));
      }
      self->run_bootstrap(context, step + 1);
    });
}

void
cluster_orchestrator::wait_for_primary(const std::shared_ptr<bootstrap_context>& context,
                                       handler_type&& next)
{
  CBINIT_LOG_INFO(R"(waiting for primary node "{}" of cluster "{}" to be running)",
                  context->primary.name,
                  topology_.name());
  notifications_->wait_for(
    context->primary.name,
    [](const resource_snapshot& snapshot) {
      return snapshot.state == resource_state::running || is_terminal(snapshot.state);
    },
    context->token,
    [next = std::move(next)](std::error_code ec, const resource_snapshot& snapshot) {
      if (ec) {
        return next({ ec });
      }
      if (snapshot.state != resource_state::running) {
        return next({ errc::orchestration::server_not_initialized,
                      fmt::format(R"(primary node "{}" has exited)", snapshot.name) });
      }
      next({});
    });
}

void
cluster_orchestrator::initialize_primary(const std::shared_ptr<bootstrap_context>& context,
                                         handler_type&& next)
{
  publish_state_text(topology_.name(), "Initializing");
  const auto& primary = context->primary;
  trust_->load_and_trust(
    primary,
    context->token,
    [self = shared_from_this(), context, next](cbinit::error err) mutable {
      if (err) {
        return next(std::move(err));
      }
      self->bootstrapper_->ensure_initialized(
        context->primary,
        context->token,
        [self, context, next](cbinit::error err, bool initialized_now) mutable {
          if (err) {
            return next(std::move(err));
          }
          context->initialized_now = initialized_now;
          self->joiner_->set_alternate_addresses(
            context->primary,
            !initialized_now,
            context->token,
            [self, context, next](cbinit::error err) mutable {
              if (err) {
                return next(std::move(err));
              }
              self->joiner_->mark_initialized(context->primary, true);
              next({});
            });
        });
    });
}

void
cluster_orchestrator::join_nodes(const std::shared_ptr<bootstrap_context>& context,
                                 handler_type&& next)
{
  if (context->others.empty()) {
    return next({});
  }
  api_->execute(
    context->primary,
    operations::management::node_list_get_request{},
    context->token,
    [self = shared_from_this(), context, next](
      operations::management::node_list_get_response&& resp) mutable {
      if (resp.ctx.ec) {
        return next(resp.ctx.to_error());
      }
      for (const auto& node : resp.nodes) {
        context->existing_nodes.push_back(node.hostname);
      }
      self->joiner_->join_all(
        context->primary,
        context->others,
        context->existing_nodes,
        context->token,
        [context, next](std::vector<join_result> results) mutable {
          for (const auto& result : results) {
            if (result.error.is_cancellation()) {
              return next(result.error);
            }
            if (result.error) {
              CBINIT_LOG_ERROR(R"(node "{}" failed to join the cluster: {})", result.name, result.error);
            }
          }
          context->joins = std::move(results);
          next({});
        });
    });
}

void
cluster_orchestrator::rebalance_if_needed(const std::shared_ptr<bootstrap_context>& context,
                                          handler_type&& next)
{
  const bool any_added =
    std::any_of(context->joins.begin(), context->joins.end(), [](const auto& r) {
      return r.added;
    });
  if (!any_added) {
    CBINIT_LOG_DEBUG(R"(no nodes were added to cluster "{}", skipping rebalance)", topology_.name());
    return next({});
  }

  std::vector<std::string> known_hostnames{ context->primary.hostname };
  for (const auto& result : context->joins) {
    if (!result.member) {
      continue;
    }
    if (auto server = topology_.find_server(result.name); server) {
      known_hostnames.push_back(server->hostname);
    }
  }

  publish_state_text(topology_.name(), "Rebalancing");
  CBINIT_LOG_INFO(R"(rebalancing cluster "{}" over {})", topology_.name(), fmt::join(known_hostnames, ", "));
  rebalancer_->rebalance(context->primary, known_hostnames, context->token, std::move(next));
}

void
cluster_orchestrator::publish_running(const std::shared_ptr<bootstrap_context>& /* context */,
                                      handler_type&& next)
{
  const auto& name = topology_.name();
  notifications_->publish(
    name, [connection_string = topology_.connection_string()](resource_snapshot& snapshot) {
      snapshot.properties[connection_string_property] = connection_string;
    });
  publish_state(name, resource_state::running, "Running", {}, true, false);
  CBINIT_LOG_INFO(R"(cluster "{}" is running)", name);
  next({});
}

void
cluster_orchestrator::on_bootstrap_finished(const std::shared_ptr<bootstrap_context>& context,
                                            cbinit::error err)
{
  if (!err) {
    return;
  }
  const auto& name = topology_.name();
  if (err.is_cancellation() || context->token->is_cancelled()) {
    CBINIT_LOG_DEBUG(R"(bootstrap of cluster "{}" has been cancelled)", name);
    return;
  }
  CBINIT_LOG_ERROR(R"(bootstrap of cluster "{}" failed: {})", name, err);
  publish_state(name, resource_state::exited, "Exited", 1, true);
}

void
cluster_orchestrator::start_bucket(const bucket_declaration& bucket)
{
  auto token = cancellation_token::linked(cluster_token());
  {
    const std::scoped_lock lock(tasks_mutex_);
    if (bucket_tasks_.count(bucket.name) > 0) {
      CBINIT_LOG_DEBUG(R"(bucket "{}" is already being provisioned)", bucket.name);
      return;
    }
    bucket_tasks_[bucket.name] = token;
  }

  publish_state(bucket.name, resource_state::starting, "Starting");
  notifications_->wait_for(
    topology_.name(),
    std::vector<resource_state>{ resource_state::running },
    token,
    [self = shared_from_this(), bucket, token](std::error_code ec,
                                               const resource_snapshot& /* cluster */) {
      auto finish = [self, name = bucket.name, token](cbinit::error err) {
        if (err.is_cancellation() || token->is_cancelled()) {
          CBINIT_LOG_DEBUG(R"(provisioning of bucket "{}" has been cancelled)", name);
          return;
        }
        if (err) {
          CBINIT_LOG_ERROR(R"(provisioning of bucket "{}" failed: {})", name, err);
          return self->publish_state(name, resource_state::exited, "Exited", 1);
        }
        self->notifications_->publish(
          name,
          [connection_string = self->topology_.connection_string(name)](resource_snapshot& s) {
            s.properties[connection_string_property] = connection_string;
          });
        self->publish_state(name, resource_state::running, "Running");
      };
      if (ec) {
        return finish({ ec });
      }
      auto primary = self->topology_.primary();
      if (!primary) {
        return finish({ errc::orchestration::no_data_service_node });
      }
      self->provisioner_->provision(
        primary.value(),
        bucket,
        token,
        [self, name = bucket.name](const std::string& state_text) {
          self->publish_state_text(name, state_text);
        },
        std::move(finish));
    });
}

void
cluster_orchestrator::stop_bucket(const std::string& name, handler_type&& handler)
{
  if (auto state = state_of(name); state && is_active(state.value())) {
    CBINIT_LOG_INFO(R"(stopping bucket "{}")", name);
    publish_state(name, resource_state::stopping, "Stopping");
    publish_state(name, resource_state::exited, "Exited", 0);
  }
  asio::post(ctx_, [handler = std::move(handler)]() {
    handler({});
  });
}

void
cluster_orchestrator::stop(handler_type&& handler)
{
  const auto& name = topology_.name();
  if (auto state = state_of(name); !state || !is_active(state.value())) {
    CBINIT_LOG_DEBUG(R"(cluster "{}" is not running, ignoring stop)", name);
    return asio::post(ctx_, [handler = std::move(handler)]() {
      handler({});
    });
  }

  CBINIT_LOG_INFO(R"(stopping cluster "{}")", name);
  publish_state(name, resource_state::stopping, "Stopping", {}, true);

  std::shared_ptr<cancellation_token> token{};
  {
    const std::scoped_lock lock(tasks_mutex_);
    std::swap(token, cluster_token_);
  }
  if (token) {
    token->cancel();
  }

  for (const auto& bucket : topology_.buckets()) {
    publish_state(bucket.name, resource_state::exited, "Exited", 0);
  }

  stop_servers([self = shared_from_this(), name, handler = std::move(handler)](cbinit::error err) {
    if (err) {
      CBINIT_LOG_WARNING(R"(some nodes of cluster "{}" did not stop: {})", name, err);
    }
    self->publish_state(name, resource_state::exited, "Exited", 0, true);
    CBINIT_LOG_INFO(R"(cluster "{}" has exited)", name);
    handler({});
  });
}

void
cluster_orchestrator::stop_servers(handler_type&& handler)
{
  auto servers = topology_.servers();
  if (!commands_ || servers.empty()) {
    return asio::post(ctx_, [handler = std::move(handler)]() {
      handler({});
    });
  }

  struct stop_barrier {
    std::mutex mutex{};
    std::size_t remaining{};
    cbinit::error first_error{};
    handler_type handler{};
  };
  auto barrier = std::make_shared<stop_barrier>();
  barrier->remaining = servers.size();
  barrier->handler = std::move(handler);

  auto done = [barrier](cbinit::error err) {
    handler_type handler{};
    cbinit::error result{};
    {
      const std::scoped_lock lock(barrier->mutex);
      if (err && !barrier->first_error) {
        barrier->first_error = std::move(err);
      }
      if (--barrier->remaining > 0) {
        return;
      }
      std::swap(handler, barrier->handler);
      result = barrier->first_error;
    }
    handler(std::move(result));
  };

  for (const auto& server : servers) {
    CBINIT_LOG_DEBUG(R"(stopping node "{}")", server.name);
    commands_->execute(
      server.name,
      resource_command::stop,
      [self = shared_from_this(), name = server.name, done](cbinit::error err) {
        if (err) {
          return done(std::move(err));
        }
        self->notifications_->wait_for(
          name,
          [](const resource_snapshot& snapshot) {
            return is_terminal(snapshot.state);
          },
          self->root_token_,
          [done](std::error_code ec, const resource_snapshot& /* snapshot */) {
            done({ ec });
          });
      });
  }
}

void
cluster_orchestrator::shutdown()
{
  CBINIT_LOG_DEBUG(R"(shutting down orchestrator of cluster "{}")", topology_.name());
  root_token_->cancel();
}

void
cluster_orchestrator::start_resource(const std::string& name, handler_type&& handler)
{
  auto snapshot = notifications_->current(name);
  if (!snapshot) {
    return asio::post(ctx_, [name, handler = std::move(handler)]() {
      handler({ errc::orchestration::resource_not_found, fmt::format(R"(unknown resource "{}")", name) });
    });
  }

  switch (snapshot->kind) {
    case resource_kind::cluster:
      start();
      break;

    case resource_kind::server:
      if (commands_) {
        return commands_->execute(name, resource_command::start, std::move(handler));
      }
      break;

    case resource_kind::bucket:
      if (can_start(snapshot->state)) {
        if (auto bucket = topology_.find_bucket(name); bucket) {
          start_bucket(bucket.value());
        }
      }
      break;

    case resource_kind::server_group:
      return asio::post(ctx_, [name, handler = std::move(handler)]() {
        handler({ errc::orchestration::unsupported_command,
                  fmt::format(R"(server group "{}" follows the state of the cluster)", name) });
      });
  }
  asio::post(ctx_, [handler = std::move(handler)]() {
    handler({});
  });
}

void
cluster_orchestrator::stop_resource(const std::string& name, handler_type&& handler)
{
  auto snapshot = notifications_->current(name);
  if (!snapshot) {
    return asio::post(ctx_, [name, handler = std::move(handler)]() {
      handler({ errc::orchestration::resource_not_found, fmt::format(R"(unknown resource "{}")", name) });
    });
  }

  switch (snapshot->kind) {
    case resource_kind::cluster:
      return stop(std::move(handler));

    case resource_kind::server:
      if (commands_) {
        return commands_->execute(name, resource_command::stop, std::move(handler));
      }
      break;

    case resource_kind::bucket:
      return stop_bucket(name, std::move(handler));

    case resource_kind::server_group:
      return asio::post(ctx_, [name, handler = std::move(handler)]() {
        handler({ errc::orchestration::unsupported_command,
                  fmt::format(R"(server group "{}" follows the state of the cluster)", name) });
      });
  }
  asio::post(ctx_, [handler = std::move(handler)]() {
    handler({});
  });
}

void
cluster_orchestrator::flush_bucket(const std::string& name, handler_type&& handler)
{
  auto primary = topology_.primary();
  if (!topology_.find_bucket(name) || !primary) {
    return asio::post(ctx_, [name, handler = std::move(handler)]() {
      handler({ errc::orchestration::resource_not_found, fmt::format(R"(unknown bucket "{}")", name) });
    });
  }
  provisioner_->flush(primary.value(), name, root_token_, std::move(handler));
}

void
cluster_orchestrator::wait_until_settled(const std::shared_ptr<cancellation_token>& token,
                                         handler_type&& handler)
{
  struct settle_state {
    std::mutex mutex{};
    bool completed{ false };
    resource_notification_service::watch_id watch{ 0 };
    cancellation_token::subscription_id subscription{ 0 };
    handler_type handler{};
  };
  auto state = std::make_shared<settle_state>();
  state->handler = std::move(handler);

  auto complete = [ctx = &ctx_, notifications = notifications_, token, state](cbinit::error err) {
    handler_type handler{};
    {
      const std::scoped_lock lock(state->mutex);
      if (state->completed) {
        return;
      }
      state->completed = true;
      std::swap(handler, state->handler);
    }
    if (state->watch != 0) {
      notifications->unwatch(state->watch);
    }
    if (token && state->subscription != 0) {
      token->unsubscribe(state->subscription);
    }
    asio::post(*ctx, [handler = std::move(handler), err = std::move(err)]() mutable {
      handler(std::move(err));
    });
  };

  auto evaluate = [self = shared_from_this(), complete]() {
    auto cluster = self->notifications_->current(self->topology_.name());
    if (!cluster) {
      return complete({ errc::orchestration::resource_not_found });
    }
    std::vector<std::string> failed{};
    if (is_terminal(cluster->state)) {
      if (cluster->exit_code.value_or(0) != 0) {
        failed.push_back(cluster->name);
      }
    } else if (cluster->state != resource_state::running) {
      return;
    }
    for (const auto& bucket : self->notifications_->children_of(cluster->name)) {
      if (bucket.kind != resource_kind::bucket) {
        continue;
      }
      if (!is_terminal(cluster->state) && !is_terminal(bucket.state) &&
          bucket.state != resource_state::running) {
        return;
      }
      if (bucket.exit_code.value_or(0) != 0) {
        failed.push_back(bucket.name);
      }
    }
    for (const auto& server : self->notifications_->snapshots()) {
      if (server.kind == resource_kind::server &&
          (server.state == resource_state::failed_to_start ||
           (is_terminal(server.state) && server.exit_code.value_or(0) != 0))) {
        failed.push_back(server.name);
      }
    }
    if (!failed.empty()) {
      return complete({ errc::orchestration::bootstrap_failed,
                        fmt::format("failed resources: {}", fmt::join(failed, ", ")) });
    }
    complete({});
  };

  {
    auto watch = notifications_->watch([evaluate](const resource_snapshot& /* snapshot */) {
      evaluate();
    });
    std::unique_lock lock(state->mutex);
    state->watch = watch;
    if (state->completed) {
      lock.unlock();
      notifications_->unwatch(watch);
    }
  }
  if (token) {
    auto subscription = token->subscribe([complete]() {
      complete({ errc::common::request_canceled });
    });
    const std::scoped_lock lock(state->mutex);
    state->subscription = subscription;
  }
  evaluate();
}
} // namespace cbinit::core::orchestration
