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
#include "test_helper.hxx"

#include "utils/fake_transport.hxx"
#include "utils/io_context_runner.hxx"

#include "core/management_api.hxx"
#include "core/orchestration/node_probe.hxx"
#include "core/orchestration/resource_notification_service.hxx"

#include <cbinit/error_codes.hxx>
#include <cbinit/topology.hxx>

#include <future>
#include <thread>

using namespace std::chrono_literals;
using cbinit::resource_state;
using test::utils::fake_response;

namespace
{
constexpr auto probe_path{ "/pools" };

auto
make_topology() -> cbinit::cluster_topology
{
  cbinit::cluster_settings settings{};
  settings.credentials = { "Administrator", "password" };

  cbinit::server_group group{};
  group.name = "group1";
  for (std::uint16_t i = 0; i < 2; ++i) {
    cbinit::server_node node{};
    node.name = fmt::format("node{}", i);
    node.endpoints[cbinit::endpoint_names::management] = static_cast<std::uint16_t>(9000 + i);
    node.endpoints[cbinit::endpoint_names::management_secure] =
      static_cast<std::uint16_t>(19000 + i);
    group.servers.push_back(node);
  }
  return { "cluster", settings, { group } };
}

class node_probe_harness
{
public:
  node_probe_harness()
  {
    test::utils::init_logger();
    transport = std::make_shared<test::utils::fake_transport>(io.ctx());
    notifications =
      std::make_shared<cbinit::core::orchestration::resource_notification_service>(io.ctx());
    for (const auto& node : topology.servers()) {
      cbinit::resource_snapshot snapshot{};
      snapshot.name = node.name;
      snapshot.kind = cbinit::resource_kind::server;
      snapshot.parent = "group1";
      notifications->register_resource(snapshot);
    }

    cbinit::core::management_api_options api_options{};
    api_options.retry.max_attempts = 1;
    // the secure endpoint must not be used for probing
    auto api = std::make_shared<cbinit::core::management_api>(
      io.ctx(),
      transport,
      [credentials = topology.credentials()]() {
        return credentials;
      },
      true,
      api_options);

    cbinit::core::orchestration::node_probe_options options{};
    options.interval = 1ms;
    options.request_timeout = 1s;
    probe = std::make_shared<cbinit::core::orchestration::node_probe>(
      io.ctx(), api, notifications, topology, options);
  }

  ~node_probe_harness()
  {
    probe->shutdown();
  }

  node_probe_harness(const node_probe_harness&) = delete;
  node_probe_harness(node_probe_harness&&) = delete;
  auto operator=(const node_probe_harness&) -> node_probe_harness& = delete;
  auto operator=(node_probe_harness&&) -> node_probe_harness& = delete;

  auto execute(const std::string& name, cbinit::core::orchestration::resource_command command)
    -> cbinit::error
  {
    auto barrier = std::make_shared<std::promise<cbinit::error>>();
    auto future = barrier->get_future();
    probe->execute(name, command, [barrier](cbinit::error err) {
      barrier->set_value(std::move(err));
    });
    return future.get();
  }

  auto state_of(const std::string& name) const -> resource_state
  {
    return notifications->current(name).value().state;
  }

  cbinit::cluster_topology topology{ make_topology() };
  test::utils::io_context_runner io{};
  std::shared_ptr<test::utils::fake_transport> transport{};
  std::shared_ptr<cbinit::core::orchestration::resource_notification_service> notifications{};
  std::shared_ptr<cbinit::core::orchestration::node_probe> probe{};
};
} // namespace

TEST_CASE("unit: node is running once its management endpoint answers", "[unit]")
{
  node_probe_harness harness{};
  harness.transport->route("GET",
                           probe_path,
                           {
                             fake_response::with_status(503),
                             fake_response::with_status(503),
                             fake_response::ok(),
                           },
                           9000);

  auto err = harness.execute("node0", cbinit::core::orchestration::resource_command::start);
  REQUIRE_NO_ERROR(err);

  REQUIRE(test::utils::wait_until([&harness]() {
    return harness.state_of("node0") == resource_state::running;
  }));
  auto snapshot = harness.notifications->current("node0").value();
  CHECK(snapshot.state_text == "Running");
  CHECK(harness.transport->count("GET", probe_path, 9000) == 3);
  CHECK(harness.transport->count("GET", probe_path, 9001) == 0);

  for (const auto& recorded : harness.transport->requests()) {
    CHECK(recorded.endpoint.port == 9000);
    CHECK_FALSE(recorded.endpoint.tls);
    CHECK(recorded.request.headers.count("authorization") == 0);
  }
}

TEST_CASE("unit: node stays starting while its management endpoint fails", "[unit]")
{
  node_probe_harness harness{};
  harness.transport->route("GET", probe_path, { fake_response::with_status(503) });

  auto err = harness.execute("node1", cbinit::core::orchestration::resource_command::start);
  REQUIRE_NO_ERROR(err);

  REQUIRE(test::utils::wait_until([&harness]() {
    return harness.transport->count("GET", probe_path, 9001) >= 5;
  }));
  CHECK(harness.state_of("node1") == resource_state::starting);
  CHECK(harness.notifications->current("node1").value().state_text == "Starting");

  err = harness.execute("node1", cbinit::core::orchestration::resource_command::stop);
  REQUIRE_NO_ERROR(err);
  auto snapshot = harness.notifications->current("node1").value();
  CHECK(snapshot.state == resource_state::exited);
  CHECK(snapshot.exit_code == 0);

  // probing is cancelled with the stop command
  const auto probes = harness.transport->count("GET", probe_path, 9001);
  std::this_thread::sleep_for(50ms);
  CHECK(harness.transport->count("GET", probe_path, 9001) <= probes + 1);
  CHECK(harness.state_of("node1") == resource_state::exited);
}

TEST_CASE("unit: node probe accepts only servers", "[unit]")
{
  node_probe_harness harness{};

  auto err = harness.execute("group1", cbinit::core::orchestration::resource_command::start);
  CHECK(err.ec() == cbinit::errc::orchestration::unsupported_command);

  err = harness.execute("unknown", cbinit::core::orchestration::resource_command::stop);
  CHECK(err.ec() == cbinit::errc::orchestration::unsupported_command);
  CHECK(harness.transport->requests().empty());
}
