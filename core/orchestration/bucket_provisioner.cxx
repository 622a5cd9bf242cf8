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

#include "bucket_provisioner.hxx"

#include "poller.hxx"

#include "core/logger/logger.hxx"
#include "core/management_api.hxx"
#include "core/operations/management/bucket_create.hxx"
#include "core/operations/management/bucket_flush.hxx"
#include "core/operations/management/bucket_get.hxx"
#include "core/operations/management/cluster_tasks_get.hxx"
#include "core/operations/management/collection_create.hxx"
#include "core/operations/management/sample_bucket_install.hxx"
#include "core/operations/management/scope_create.hxx"
#include "core/operations/management/scope_get_all.hxx"

#include <cbinit/error_codes.hxx>
#include <cbinit/fmt/error.hxx>

#include <asio/post.hpp>

#include <utility>
#include <vector>

namespace cbinit::core::orchestration
{
namespace
{
using step_type = std::function<void(bucket_provisioner::handler_type&&)>;

/**
 * Runs the steps one after another, stops at the first failure.
 */
void
run_sequentially(std::shared_ptr<std::vector<step_type>> steps,
                 std::size_t index,
                 bucket_provisioner::handler_type&& handler)
{
  if (index >= steps->size()) {
    return handler({});
  }
  auto& step = steps->at(index);
  step([steps, index, handler = std::move(handler)](cbinit::error err) mutable {
    if (err) {
      return handler(std::move(err));
    }
    run_sequentially(steps, index + 1, std::move(handler));
  });
}
} // namespace

bucket_provisioner::bucket_provisioner(asio::io_context& ctx,
                                       std::shared_ptr<management_api> api,
                                       bucket_provisioner_options options)
  : ctx_{ ctx }
  , api_{ std::move(api) }
  , options_{ options }
{
}

void
bucket_provisioner::provision(const server_node& node,
                              const bucket_declaration& bucket,
                              const std::shared_ptr<cancellation_token>& token,
                              progress_handler&& progress,
                              handler_type&& handler)
{
  if (bucket.kind == bucket_kind::sample) {
    return provision_sample(node, bucket.name, token, std::move(progress), std::move(handler));
  }
  provision_standard(node, bucket, token, std::move(handler));
}

void
bucket_provisioner::provision_standard(const server_node& node,
                                       const bucket_declaration& bucket,
                                       const std::shared_ptr<cancellation_token>& token,
                                       handler_type&& handler)
{
  CBINIT_LOG_INFO(R"(creating bucket "{}")", bucket.name);

  auto after_create = [self = shared_from_this(), node, bucket, token, handler](
                        cbinit::error err) mutable {
    if (err) {
      return handler(std::move(err));
    }
    CBINIT_LOG_INFO(R"(waiting for bucket "{}" to be healthy)", bucket.name);
    self->wait_until_healthy(
      node, bucket.name, token, [self, node, bucket, token, handler](cbinit::error err) mutable {
        if (err) {
          return handler(std::move(err));
        }
        self->ensure_scopes(node, bucket, token, [name = bucket.name, handler](cbinit::error err) {
          if (!err) {
            CBINIT_LOG_INFO(R"(created bucket "{}")", name);
          }
          handler(std::move(err));
        });
      });
  };

  operations::management::bucket_get_request get{};
  get.name = bucket.name;
  api_->execute(
    node,
    std::move(get),
    token,
    [self = shared_from_this(), node, bucket, token, after_create](
      operations::management::bucket_get_response&& resp) mutable {
      if (!resp.ctx.ec) {
        CBINIT_LOG_INFO(R"(bucket "{}" already exists)", bucket.name);
        return after_create({});
      }
      if (resp.ctx.ec != errc::common::bucket_not_found) {
        return after_create(resp.ctx.to_error());
      }
      operations::management::bucket_create_request create{};
      create.name = bucket.name;
      create.settings = bucket.settings;
      self->api_->execute(
        node,
        std::move(create),
        token,
        [after_create](operations::management::bucket_create_response&& resp) mutable {
          if (resp.ctx.ec == errc::management::bucket_exists) {
            return after_create({});
          }
          after_create(resp.ctx.to_error());
        });
    });
}

void
bucket_provisioner::provision_sample(const server_node& node,
                                     const std::string& name,
                                     const std::shared_ptr<cancellation_token>& token,
                                     progress_handler&& progress,
                                     handler_type&& handler)
{
  CBINIT_LOG_INFO(R"(creating sample bucket "{}")", name);

  operations::management::bucket_get_request get{};
  get.name = name;
  api_->execute(
    node,
    std::move(get),
    token,
    [self = shared_from_this(), node, name, token, progress, handler](
      operations::management::bucket_get_response&& resp) mutable {
      if (!resp.ctx.ec) {
        CBINIT_LOG_INFO(R"(bucket "{}" already exists)", name);
        return handler({});
      }
      if (resp.ctx.ec != errc::common::bucket_not_found) {
        return handler(resp.ctx.to_error());
      }
      operations::management::sample_bucket_install_request install{};
      install.name = name;
      self->api_->execute(
        node,
        std::move(install),
        token,
        [self, node, name, token, progress, handler](
          operations::management::sample_bucket_install_response&& resp) mutable {
          if (resp.ctx.ec) {
            return handler(resp.ctx.to_error());
          }
          if (progress && !resp.task_id.empty()) {
            progress("Loading");
          }
          self->wait_for_task(
            node, resp.task_id, token, [name, handler](cbinit::error err) {
              if (!err) {
                CBINIT_LOG_INFO(R"(created sample bucket "{}")", name);
              }
              handler(std::move(err));
            });
        });
    });
}

void
bucket_provisioner::flush(const server_node& node,
                          const std::string& name,
                          const std::shared_ptr<cancellation_token>& token,
                          handler_type&& handler)
{
  CBINIT_LOG_INFO(R"(flushing bucket "{}")", name);
  operations::management::bucket_flush_request request{};
  request.name = name;
  api_->execute(node,
                std::move(request),
                token,
                [self = shared_from_this(), node, name, token, handler](
                  operations::management::bucket_flush_response&& resp) mutable {
                  if (resp.ctx.ec) {
                    return handler(resp.ctx.to_error());
                  }
                  self->wait_until_healthy(node, name, token, std::move(handler));
                });
}

void
bucket_provisioner::wait_until_healthy(const server_node& node,
                                       const std::string& name,
                                       const std::shared_ptr<cancellation_token>& token,
                                       handler_type&& handler)
{
  auto health = poller::create(ctx_, options_.health_poll_interval, token);
  health->start(
    [api = api_, node, name, token](poller::step_callback&& next) {
      operations::management::bucket_get_request request{};
      request.name = name;
      api->execute(node,
                   std::move(request),
                   token,
                   [next = std::move(next)](operations::management::bucket_get_response&& resp) {
                     if (resp.ctx.ec == errc::common::bucket_not_found) {
                       return next({}, false);
                     }
                     if (resp.ctx.ec) {
                       return next(resp.ctx.to_error(), false);
                     }
                     next({}, resp.bucket.is_healthy());
                   });
    },
    std::move(handler));
}

void
bucket_provisioner::wait_for_task(const server_node& node,
                                  const std::string& task_id,
                                  const std::shared_ptr<cancellation_token>& token,
                                  handler_type&& handler)
{
  if (task_id.empty()) {
    return asio::post(ctx_, [handler = std::move(handler)]() {
      handler({});
    });
  }
  auto tasks = poller::create(ctx_, options_.sample_task_poll_interval, token);
  tasks->start(
    [api = api_, node, task_id, token](poller::step_callback&& next) {
      api->execute(node,
                   operations::management::cluster_tasks_get_request{},
                   token,
                   [task_id, next = std::move(next)](
                     operations::management::cluster_tasks_get_response&& resp) {
                     if (resp.ctx.ec) {
                       return next(resp.ctx.to_error(), false);
                     }
                     next({}, !resp.has_task(task_id));
                   });
    },
    std::move(handler));
}

void
bucket_provisioner::ensure_scopes(const server_node& node,
                                  const bucket_declaration& bucket,
                                  const std::shared_ptr<cancellation_token>& token,
                                  handler_type&& handler)
{
  if (bucket.scopes.empty()) {
    return handler({});
  }

  operations::management::scope_get_all_request request{};
  request.bucket_name = bucket.name;
  api_->execute(
    node,
    std::move(request),
    token,
    [api = api_, node, bucket, token, handler](
      operations::management::scope_get_all_response&& resp) mutable {
      if (resp.ctx.ec) {
        return handler(resp.ctx.to_error());
      }

      auto steps = std::make_shared<std::vector<step_type>>();
      for (const auto& [scope_name, collections] : bucket.scopes) {
        const auto* existing = resp.manifest.find_scope(scope_name);
        if (existing == nullptr) {
          steps->emplace_back([api, node, token, bucket_name = bucket.name, scope_name](
                                bucket_provisioner::handler_type&& done) {
            CBINIT_LOG_DEBUG(R"(creating scope "{}" in bucket "{}")", scope_name, bucket_name);
            operations::management::scope_create_request create{};
            create.bucket_name = bucket_name;
            create.scope_name = scope_name;
            api->execute(node,
                         std::move(create),
                         token,
                         [done](operations::management::scope_create_response&& resp) {
                           if (resp.ctx.ec == errc::management::scope_exists) {
                             return done({});
                           }
                           done(resp.ctx.to_error());
                         });
          });
        }
        for (const auto& collection_name : collections) {
          if (existing != nullptr && existing->has_collection(collection_name)) {
            continue;
          }
          steps->emplace_back([api,
                               node,
                               token,
                               bucket_name = bucket.name,
                               scope_name = scope_name,
                               collection_name = collection_name](
                                bucket_provisioner::handler_type&& done) {
            CBINIT_LOG_DEBUG(R"(creating collection "{}.{}" in bucket "{}")",
                             scope_name,
                             collection_name,
                             bucket_name);
            operations::management::collection_create_request create{};
            create.bucket_name = bucket_name;
            create.scope_name = scope_name;
            create.collection_name = collection_name;
            api->execute(node,
                         std::move(create),
                         token,
                         [done](operations::management::collection_create_response&& resp) {
                           if (resp.ctx.ec == errc::management::collection_exists) {
                             return done({});
                           }
                           done(resp.ctx.to_error());
                         });
          });
        }
      }
      run_sequentially(steps, 0, std::move(handler));
    });
}
} // namespace cbinit::core::orchestration
