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

#include "bootstrap.hxx"

#include "environment.hxx"
#include "utils.hxx"

#include "core/logger/logger.hxx"
#include "core/orchestration/resource_notification_service.hxx"

#include <cbinit/fmt/error.hxx>
#include <cbinit/resource_state.hxx>

#include <fmt/core.h>

#include <atomic>
#include <cstdint>
#include <chrono>
#include <csignal>
#include <future>

namespace
{
std::atomic_bool running{ true };
static_assert(std::atomic_bool::is_always_lock_free, "the flag is written from signal handler");

void
sigint_handler(int /* signal */)
{
  running = false;
}

class bootstrap_app : public CLI::App
{
public:
  bootstrap_app()
    : CLI::App("Bring the cluster described by the topology to running state.", "bootstrap")
  {
    cbinit_tool::add_options(this, topology_options_);
    cbinit_tool::add_options(this, logger_options_);

    add_option("--io-threads", number_of_io_threads_, "Number of the IO threads.")
      ->default_val(1)
      ->check(CLI::PositiveNumber);
    add_option(
      "--max-attempts", max_attempts_, "Number of attempts of retriable management requests.")
      ->default_val(60)
      ->check(CLI::PositiveNumber);
    add_option("--retry-interval",
               retry_interval_ms_,
               "Milliseconds between attempts of management requests.")
      ->default_val(1'000);
    add_option("--request-timeout",
               request_timeout_ms_,
               "Deadline of single management request in milliseconds.")
      ->default_val(75'000);
    add_flag("--quiet", quiet_, "Do not print state changes of the resources.");
  }

  [[nodiscard]] auto execute() const -> int
  {
    cbinit_tool::apply_logger_options(logger_options_);
    auto topology = cbinit_tool::load_topology_or_fail(topology_options_);

    cbinit::core::orchestration::orchestrator_options options{};
    options.api.retry.max_attempts = max_attempts_;
    options.api.retry.backoff = std::chrono::milliseconds{ retry_interval_ms_ };
    options.api.request_timeout = std::chrono::milliseconds{ request_timeout_ms_ };

    cbinit_tool::cluster_environment environment{ topology, options, number_of_io_threads_ };
    auto orchestrator = environment.orchestrator();

    if (!quiet_) {
      environment.notifications()->watch([](const cbinit::resource_snapshot& snapshot) {
        fmt::print(stdout,
                   "{:<24} {:<12} {:<15} {}\n",
                   snapshot.name,
                   cbinit::to_string(snapshot.kind),
                   cbinit::to_string(snapshot.state),
                   snapshot.state_text);
      });
    }

    std::signal(SIGINT, sigint_handler);
    std::signal(SIGTERM, sigint_handler);

    auto token = cbinit::core::cancellation_token::create();
    auto barrier = std::make_shared<std::promise<cbinit::error>>();
    auto settled = barrier->get_future();
    orchestrator->wait_until_settled(token, [barrier](cbinit::error err) {
      barrier->set_value(std::move(err));
    });
    orchestrator->start();

    while (settled.wait_for(std::chrono::milliseconds{ 100 }) != std::future_status::ready) {
      if (!running) {
        CBINIT_LOG_INFO(R"(interrupted, stopping cluster "{}")", topology.name());
        auto stopped = std::make_shared<std::promise<void>>();
        auto f = stopped->get_future();
        orchestrator->stop([stopped](cbinit::error /* err */) {
          stopped->set_value();
        });
        f.get();
        token->cancel();
        return 1;
      }
    }

    if (auto err = settled.get(); err) {
      fmt::print(stderr, "ERROR: bootstrap of cluster \"{}\" failed: {}\n", topology.name(), err);
      return 1;
    }
    if (auto cluster = environment.notifications()->current(topology.name()); cluster) {
      fmt::print(stdout, "{}\n", cluster->property("connection_string").value_or(""));
    }
    return 0;
  }

private:
  cbinit_tool::topology_options topology_options_{};
  cbinit_tool::logger_options logger_options_{};
  std::size_t number_of_io_threads_{ 1 };
  std::size_t max_attempts_{ 60 };
  std::int64_t retry_interval_ms_{ 1'000 };
  std::int64_t request_timeout_ms_{ 75'000 };
  bool quiet_{ false };
};
} // namespace

namespace cbinit_tool
{
auto
make_bootstrap_command() -> std::shared_ptr<CLI::App>
{
  return std::make_shared<bootstrap_app>();
}

auto
execute_bootstrap_command(const CLI::App* app) -> int
{
  if (const auto* bootstrap = dynamic_cast<const bootstrap_app*>(app); bootstrap != nullptr) {
    return bootstrap->execute();
  }
  return 1;
}
} // namespace cbinit_tool
