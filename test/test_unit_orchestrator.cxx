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
#include "utils/scripted_commands.hxx"

#include "core/management_api.hxx"
#include "core/orchestration/cluster_orchestrator.hxx"
#include "core/orchestration/resource_notification_service.hxx"

#include <cbinit/error_codes.hxx>
#include <cbinit/topology.hxx>

#include <catch2/matchers/catch_matchers_string.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <future>
#include <mutex>
#include <optional>

using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using test::utils::fake_response;

namespace
{
constexpr auto pool_path{ "/pools/default" };
constexpr auto cluster_init_path{ "/clusterInit" };
constexpr auto alternate_addresses_path{ "/node/controller/setupAlternateAddresses/external" };
constexpr auto node_services_path{ "/pools/default/nodeServices" };
constexpr auto node_list_path{ "/pools/nodes" };
constexpr auto add_node_path{ "/controller/addNode" };
constexpr auto rebalance_path{ "/controller/rebalance" };
constexpr auto rebalance_progress_path{ "/pools/default/rebalanceProgress" };
constexpr auto buckets_path{ "/pools/default/buckets" };
constexpr auto tasks_path{ "/pools/default/tasks" };
constexpr auto sample_install_path{ "/sampleBuckets/install" };

constexpr auto trusted_cas_path{ "/node/controller/loadTrustedCAs" };
constexpr auto certificate_reload_path{ "/node/controller/reloadCertificate" };

constexpr auto
management_port(std::size_t index) -> std::uint16_t
{
  return static_cast<std::uint16_t>(9000 + index);
}

constexpr auto
secure_management_port(std::size_t index) -> std::uint16_t
{
  return static_cast<std::uint16_t>(19000 + index);
}

auto
make_topology(std::size_t number_of_nodes,
              std::vector<cbinit::bucket_declaration> buckets = {},
              std::optional<cbinit::certificate_authority> authority = {})
  -> cbinit::cluster_topology
{
  cbinit::cluster_settings settings{};
  settings.cluster_name = "test";
  settings.credentials = { "Administrator", "password" };

  cbinit::server_group group{};
  group.name = "group1";
  for (std::size_t i = 0; i < number_of_nodes; ++i) {
    cbinit::server_node node{};
    node.name = fmt::format("node{}", i);
    node.endpoints[cbinit::endpoint_names::management] = management_port(i);
    node.endpoints[cbinit::endpoint_names::management_secure] = secure_management_port(i);
    group.servers.push_back(node);
  }
  return { "cluster", settings, { group }, std::move(buckets), std::move(authority) };
}

auto
node_list_body(const std::vector<std::size_t>& members) -> std::string
{
  std::string nodes{};
  for (auto index : members) {
    if (!nodes.empty()) {
      nodes += ",";
    }
    nodes += fmt::format(
      R"({{"hostname":"node{}.dev.internal:8091","status":"healthy","clusterMembership":"active"}})",
      index);
  }
  return fmt::format(R"({{"nodes":[{}]}})", nodes);
}

auto
node_services_body(std::size_t index) -> std::string
{
  return fmt::format(
    R"({{"nodesExt":[{{"thisNode":true,"hostname":"node{0}.dev.internal","services":{{"mgmt":8091}},)"
    R"("alternateAddresses":{{"external":{{"hostname":"localhost","ports":{{"mgmt":{1}}}}}}}}}]}})",
    index,
    management_port(index));
}

auto
bucket_body(const std::string& name, const std::string& status) -> std::string
{
  return fmt::format(
    R"({{"name":"{}","bucketType":"membase","nodes":[{{"hostname":"node0.dev.internal:8091","status":"{}"}}]}})",
    name,
    status);
}

/**
 * Routes of a cluster where every node is already member and advertises its alternate address.
 */
void
route_initialized_cluster(test::utils::fake_transport& transport, std::size_t number_of_nodes)
{
  std::vector<std::size_t> members{};
  for (std::size_t i = 0; i < number_of_nodes; ++i) {
    members.push_back(i);
    transport.route("GET",
                    node_services_path,
                    { fake_response::ok(node_services_body(i)) },
                    management_port(i));
  }
  transport.route("GET", pool_path, { fake_response::ok() });
  transport.route("GET", node_list_path, { fake_response::ok(node_list_body(members)) });
}

class orchestrator_harness
{
public:
  explicit orchestrator_harness(const cbinit::cluster_topology& topology)
  {
    test::utils::init_logger();
    transport = std::make_shared<test::utils::fake_transport>(io.ctx());
    notifications =
      std::make_shared<cbinit::core::orchestration::resource_notification_service>(io.ctx());
    commands = std::make_shared<test::utils::scripted_commands>(io.ctx(), notifications);

    cbinit::core::orchestration::orchestrator_options options{};
    options.api.retry.max_attempts = 3;
    options.api.retry.backoff = 1ms;
    options.rebalance_poll_interval = 1ms;
    options.bucket_health_poll_interval = 1ms;
    options.sample_task_poll_interval = 1ms;
    auto api = std::make_shared<cbinit::core::management_api>(
      io.ctx(),
      transport,
      [topology]() {
        return topology.credentials();
      },
      topology.has_certificate_authority(),
      options.api);
    orchestrator = cbinit::core::orchestration::cluster_orchestrator::create(
      io.ctx(), topology, { api, notifications, commands }, options);
  }

  ~orchestrator_harness()
  {
    orchestrator->shutdown();
  }

  orchestrator_harness(const orchestrator_harness&) = delete;
  orchestrator_harness(orchestrator_harness&&) = delete;
  auto operator=(const orchestrator_harness&) -> orchestrator_harness& = delete;
  auto operator=(orchestrator_harness&&) -> orchestrator_harness& = delete;

  /**
   * Starts the cluster and waits until it and its buckets are settled.
   */
  auto start_and_settle() -> cbinit::error
  {
    orchestrator->start();
    return wait(settled());
  }

  auto settled() -> std::future<cbinit::error>
  {
    auto barrier = std::make_shared<std::promise<cbinit::error>>();
    auto future = barrier->get_future();
    orchestrator->wait_until_settled(nullptr, [barrier](cbinit::error err) {
      barrier->set_value(std::move(err));
    });
    return future;
  }

  static auto wait(std::future<cbinit::error> future) -> cbinit::error
  {
    if (future.wait_for(10s) != std::future_status::ready) {
      return { cbinit::errc::common::unambiguous_timeout, "the cluster did not settle in time" };
    }
    return future.get();
  }

  auto snapshot(const std::string& name) const -> cbinit::resource_snapshot
  {
    return notifications->current(name).value();
  }

  test::utils::io_context_runner io{};
  std::shared_ptr<test::utils::fake_transport> transport{};
  std::shared_ptr<cbinit::core::orchestration::resource_notification_service> notifications{};
  std::shared_ptr<test::utils::scripted_commands> commands{};
  std::shared_ptr<cbinit::core::orchestration::cluster_orchestrator> orchestrator{};
};
} // namespace

TEST_CASE("unit: single node cluster is initialized once", "[unit]")
{
  orchestrator_harness harness{ make_topology(1) };
  harness.transport->route("GET", pool_path, { fake_response::with_status(404) });
  harness.transport->route("POST", cluster_init_path, { fake_response::ok() });
  harness.transport->route("PUT", alternate_addresses_path, { fake_response::ok() });

  auto err = harness.start_and_settle();
  REQUIRE_NO_ERROR(err);

  auto cluster = harness.snapshot("cluster");
  CHECK(cluster.state == cbinit::resource_state::running);
  CHECK(cluster.property("connection_string") == "couchbase://localhost:11210");
  CHECK(harness.snapshot("group1").state == cbinit::resource_state::running);
  CHECK(harness.snapshot("node0").property("initialized") == "true");

  CHECK(harness.transport->count("GET", pool_path) == 1);
  CHECK(harness.transport->count("POST", cluster_init_path) == 1);
  CHECK(harness.transport->count("PUT", alternate_addresses_path) == 1);
  CHECK(harness.transport->count("GET", node_services_path) == 0);
  CHECK(harness.transport->count("POST", add_node_path) == 0);
  CHECK(harness.transport->count("POST", rebalance_path) == 0);

  for (const auto& recorded : harness.transport->requests()) {
    CHECK(recorded.endpoint.port == management_port(0));
    if (recorded.request.path != cluster_init_path) {
      CHECK(recorded.request.headers.at("authorization") ==
            "Basic QWRtaW5pc3RyYXRvcjpwYXNzd29yZA==");
    } else {
      CHECK(recorded.request.headers.count("authorization") == 0);
      CHECK_THAT(recorded.request.body, ContainsSubstring("clusterName=test"));
      CHECK_THAT(recorded.request.body, ContainsSubstring("username=Administrator"));
      CHECK_THAT(recorded.request.body, ContainsSubstring("services=kv%2Cn1ql%2Cindex"));
    }
    if (recorded.request.path == alternate_addresses_path) {
      CHECK_THAT(recorded.request.body, ContainsSubstring("hostname=localhost"));
      CHECK_THAT(recorded.request.body, ContainsSubstring("mgmt=9000"));
    }
  }
}

TEST_CASE("unit: nodes are joined concurrently and rebalanced once", "[unit]")
{
  orchestrator_harness harness{ make_topology(3) };
  harness.transport->route("GET", pool_path, { fake_response::with_status(404) });
  harness.transport->route("POST", cluster_init_path, { fake_response::ok() });
  harness.transport->route("PUT", alternate_addresses_path, { fake_response::ok() });
  harness.transport->route("GET", node_list_path, { fake_response::ok(node_list_body({ 0 })) });
  harness.transport->route("POST", add_node_path, { fake_response::ok() });
  harness.transport->hold("POST", add_node_path, 2);
  harness.transport->route("POST", rebalance_path, { fake_response::ok() });
  harness.transport->route("GET",
                           rebalance_progress_path,
                           {
                             fake_response::ok(R"({"status":"running"})"),
                             fake_response::ok(R"({"status":"running"})"),
                             fake_response::ok(R"({"status":"none"})"),
                           });

  auto err = harness.start_and_settle();
  REQUIRE_NO_ERROR(err);
  CHECK(harness.snapshot("cluster").state == cbinit::resource_state::running);

  CHECK(harness.transport->count("POST", add_node_path) == 2);
  CHECK(harness.transport->max_held() == 2);
  CHECK(harness.transport->count("POST", rebalance_path) == 1);
  CHECK(harness.transport->count("GET", rebalance_progress_path) == 3);
  CHECK(harness.transport->count("PUT", alternate_addresses_path) == 3);
  for (std::size_t i = 0; i < 3; ++i) {
    CHECK(harness.transport->count("PUT", alternate_addresses_path, management_port(i)) == 1);
    CHECK(harness.snapshot(fmt::format("node{}", i)).property("initialized") == "true");
  }

  for (const auto& recorded : harness.transport->requests()) {
    if (recorded.request.path == add_node_path) {
      CHECK(recorded.endpoint.port == management_port(0));
      CHECK_THAT(recorded.request.body, ContainsSubstring("user=Administrator"));
    }
    if (recorded.request.path == rebalance_path) {
      CHECK(recorded.endpoint.port == management_port(0));
      CHECK_THAT(recorded.request.body, ContainsSubstring("ns_1%40node0.dev.internal"));
      CHECK_THAT(recorded.request.body, ContainsSubstring("ns_1%40node1.dev.internal"));
      CHECK_THAT(recorded.request.body, ContainsSubstring("ns_1%40node2.dev.internal"));
    }
  }
}

TEST_CASE("unit: nodes trust the certificate authority before they are joined", "[unit]")
{
  orchestrator_harness harness{ make_topology(
    2, {}, cbinit::certificate_authority{ "-----BEGIN CERTIFICATE-----", {} }) };
  harness.transport->route("GET", pool_path, { fake_response::with_status(404) });
  harness.transport->route("POST", cluster_init_path, { fake_response::ok() });
  harness.transport->route("PUT", alternate_addresses_path, { fake_response::ok() });
  harness.transport->route("GET", node_list_path, { fake_response::ok(node_list_body({ 0 })) });
  harness.transport->route("POST", trusted_cas_path, { fake_response::ok() });
  harness.transport->route("POST", certificate_reload_path, { fake_response::ok() });
  harness.transport->route("POST", add_node_path, { fake_response::ok() });
  harness.transport->route("POST", rebalance_path, { fake_response::ok() });
  harness.transport->route(
    "GET", rebalance_progress_path, { fake_response::ok(R"({"status":"none"})") });

  auto err = harness.start_and_settle();
  REQUIRE_NO_ERROR(err);
  CHECK(harness.snapshot("cluster").state == cbinit::resource_state::running);

  for (std::size_t i = 0; i < 2; ++i) {
    CHECK(harness.transport->count("POST", trusted_cas_path, management_port(i)) == 1);
    CHECK(harness.transport->count("POST", certificate_reload_path, management_port(i)) == 1);
    CHECK(harness.transport->count("PUT", alternate_addresses_path, secure_management_port(i)) ==
          1);
  }
  CHECK(harness.transport->count("POST", add_node_path, secure_management_port(0)) == 1);

  // positions of the requests of the joined node, the add-node call is sent to the primary
  std::optional<std::size_t> trusted{};
  std::optional<std::size_t> reloaded{};
  std::optional<std::size_t> added{};
  std::optional<std::size_t> advertised{};
  const auto requests = harness.transport->requests();
  for (std::size_t position = 0; position < requests.size(); ++position) {
    const auto& recorded = requests[position];
    const auto& path = recorded.request.path;
    if (path == trusted_cas_path || path == certificate_reload_path) {
      CHECK_FALSE(recorded.endpoint.tls);
      CHECK(recorded.request.headers.count("authorization") == 0);
      if (recorded.endpoint.port == management_port(1)) {
        (path == trusted_cas_path ? trusted : reloaded) = position;
      }
      continue;
    }
    if (path == pool_path || path == cluster_init_path) {
      continue;
    }
    CHECK(recorded.endpoint.tls);
    CHECK(recorded.request.headers.count("authorization") == 1);
    if (path == add_node_path) {
      added = position;
    }
    if (path == alternate_addresses_path && recorded.endpoint.port == secure_management_port(1)) {
      advertised = position;
    }
  }
  REQUIRE(trusted.has_value());
  REQUIRE(reloaded.has_value());
  REQUIRE(added.has_value());
  REQUIRE(advertised.has_value());
  CHECK(trusted.value() < reloaded.value());
  CHECK(reloaded.value() < added.value());
  CHECK(added.value() < advertised.value());
}

TEST_CASE("unit: members of the cluster are not added again", "[unit]")
{
  orchestrator_harness harness{ make_topology(3) };
  route_initialized_cluster(*harness.transport, 2);
  harness.transport->route("GET", node_list_path, { fake_response::ok(node_list_body({ 0, 1 })) });
  harness.transport->route("POST", add_node_path, { fake_response::ok() });
  harness.transport->route("PUT", alternate_addresses_path, { fake_response::ok() });
  harness.transport->route("POST", rebalance_path, { fake_response::ok() });
  harness.transport->route(
    "GET", rebalance_progress_path, { fake_response::ok(R"({"status":"none"})") });

  auto err = harness.start_and_settle();
  REQUIRE_NO_ERROR(err);

  CHECK(harness.transport->count("POST", cluster_init_path) == 0);
  CHECK(harness.transport->count("POST", add_node_path) == 1);
  CHECK(harness.transport->count("PUT", alternate_addresses_path) == 1);
  CHECK(harness.transport->count("PUT", alternate_addresses_path, management_port(2)) == 1);
  CHECK(harness.transport->count("POST", rebalance_path) == 1);

  for (const auto& recorded : harness.transport->requests()) {
    if (recorded.request.path == add_node_path) {
      CHECK_THAT(recorded.request.body, ContainsSubstring("hostname=node2.dev.internal"));
    }
    if (recorded.request.path == rebalance_path) {
      CHECK_THAT(recorded.request.body, ContainsSubstring("ns_1%40node1.dev.internal"));
      CHECK_THAT(recorded.request.body, ContainsSubstring("ns_1%40node2.dev.internal"));
    }
  }
}

TEST_CASE("unit: stale alternate address of a member is updated", "[unit]")
{
  orchestrator_harness harness{ make_topology(2) };
  harness.transport->route("GET", pool_path, { fake_response::ok() });
  harness.transport->route("GET", node_list_path, { fake_response::ok(node_list_body({ 0, 1 })) });
  harness.transport->route(
    "GET", node_services_path, { fake_response::ok(node_services_body(0)) }, management_port(0));
  harness.transport->route(
    "GET", node_services_path, { fake_response::ok(node_services_body(7)) }, management_port(1));
  harness.transport->route("PUT", alternate_addresses_path, { fake_response::ok() });

  REQUIRE_NO_ERROR(harness.start_and_settle());

  CHECK(harness.transport->count("POST", add_node_path) == 0);
  CHECK(harness.transport->count("POST", rebalance_path) == 0);
  CHECK(harness.transport->count("GET", node_services_path, management_port(1)) == 1);
  CHECK(harness.transport->count("PUT", alternate_addresses_path, management_port(0)) == 0);
  CHECK(harness.transport->count("PUT", alternate_addresses_path, management_port(1)) == 1);
  CHECK(harness.snapshot("node1").property("initialized") == "true");
  for (const auto& recorded : harness.transport->requests()) {
    if (recorded.request.path == alternate_addresses_path) {
      CHECK_THAT(recorded.request.body, ContainsSubstring("mgmt=9001"));
    }
  }
}

TEST_CASE("unit: bootstrap of initialized cluster does not change anything", "[unit]")
{
  orchestrator_harness harness{ make_topology(3) };
  route_initialized_cluster(*harness.transport, 3);

  auto err = harness.start_and_settle();
  REQUIRE_NO_ERROR(err);

  CHECK(harness.snapshot("cluster").state == cbinit::resource_state::running);
  CHECK(harness.transport->mutations().empty());
  CHECK(harness.transport->count("GET", node_services_path) == 3);
  CHECK(harness.transport->count("GET", rebalance_progress_path) == 0);
}

TEST_CASE("unit: bucket is created and polled until healthy", "[unit]")
{
  cbinit::bucket_declaration bucket{};
  bucket.name = "default";
  bucket.settings.ram_quota_mb = 256;
  bucket.settings.flush_enabled = true;

  orchestrator_harness harness{ make_topology(1, { bucket }) };
  route_initialized_cluster(*harness.transport, 1);
  harness.transport->route("GET",
                           "/pools/default/buckets/default",
                           {
                             fake_response::with_status(404),
                             fake_response::ok(bucket_body("default", "warmup")),
                             fake_response::ok(bucket_body("default", "warmup")),
                             fake_response::ok(bucket_body("default", "healthy")),
                           });
  harness.transport->route("POST", buckets_path, { fake_response::with_status(202) });

  auto err = harness.start_and_settle();
  REQUIRE_NO_ERROR(err);

  auto snapshot = harness.snapshot("default");
  CHECK(snapshot.state == cbinit::resource_state::running);
  CHECK(snapshot.property("connection_string") == "couchbase://localhost:11210/default");
  CHECK(harness.transport->count("POST", buckets_path) == 1);
  CHECK(harness.transport->count("GET", "/pools/default/buckets/default") == 4);

  for (const auto& recorded : harness.transport->requests()) {
    if (recorded.request.method == "POST" && recorded.request.path == buckets_path) {
      CHECK_THAT(recorded.request.body, ContainsSubstring("name=default"));
      CHECK_THAT(recorded.request.body, ContainsSubstring("ramQuota=256"));
      CHECK_THAT(recorded.request.body, ContainsSubstring("flushEnabled=1"));
    }
  }
}

TEST_CASE("unit: bucket without nodes is not considered healthy", "[unit]")
{
  cbinit::bucket_declaration bucket{};
  bucket.name = "default";

  orchestrator_harness harness{ make_topology(1, { bucket }) };
  route_initialized_cluster(*harness.transport, 1);
  harness.transport->route("GET",
                           "/pools/default/buckets/default",
                           {
                             fake_response::with_status(404),
                             fake_response::ok(R"({"name":"default","nodes":[]})"),
                             fake_response::ok(bucket_body("default", "healthy")),
                           });
  harness.transport->route("POST", buckets_path, { fake_response::with_status(202) });

  REQUIRE_NO_ERROR(harness.start_and_settle());

  CHECK(harness.snapshot("default").state == cbinit::resource_state::running);
  CHECK(harness.transport->count("GET", "/pools/default/buckets/default") == 3);
}

TEST_CASE("unit: existing bucket is not created again", "[unit]")
{
  cbinit::bucket_declaration bucket{};
  bucket.name = "default";

  orchestrator_harness harness{ make_topology(1, { bucket }) };
  route_initialized_cluster(*harness.transport, 1);
  harness.transport->route(
    "GET", "/pools/default/buckets/default", { fake_response::ok(bucket_body("default", "healthy")) });

  auto err = harness.start_and_settle();
  REQUIRE_NO_ERROR(err);

  CHECK(harness.snapshot("default").state == cbinit::resource_state::running);
  CHECK(harness.transport->mutations().empty());
}

TEST_CASE("unit: missing scopes and collections are created", "[unit]")
{
  cbinit::bucket_declaration bucket{};
  bucket.name = "default";
  bucket.scopes["inventory"] = { "airline", "hotel" };
  bucket.scopes["tenant"] = { "users" };

  orchestrator_harness harness{ make_topology(1, { bucket }) };
  route_initialized_cluster(*harness.transport, 1);
  harness.transport->route(
    "GET", "/pools/default/buckets/default", { fake_response::ok(bucket_body("default", "healthy")) });
  harness.transport->route(
    "GET",
    "/pools/default/buckets/default/scopes",
    { fake_response::ok(
      R"({"uid":"3","scopes":[{"name":"_default","uid":"0","collections":[{"name":"_default","uid":"0"}]},)"
      R"({"name":"inventory","uid":"8","collections":[{"name":"airline","uid":"9"}]}]})") });
  harness.transport->route("POST", "/pools/default/buckets/default/scopes", { fake_response::ok() });

  auto err = harness.start_and_settle();
  REQUIRE_NO_ERROR(err);

  CHECK(harness.transport->count("POST", "/pools/default/buckets/default/scopes/inventory/collections") == 1);
  CHECK(harness.transport->count("POST", "/pools/default/buckets/default/scopes/tenant/collections") == 1);
  CHECK(harness.transport->mutations().size() == 3);
}

TEST_CASE("unit: sample bucket is installed and loading task is polled", "[unit]")
{
  cbinit::bucket_declaration bucket{};
  bucket.name = "travel-sample";
  bucket.kind = cbinit::bucket_kind::sample;

  orchestrator_harness harness{ make_topology(1, { bucket }) };
  route_initialized_cluster(*harness.transport, 1);
  harness.transport->route(
    "GET", "/pools/default/buckets/travel-sample", { fake_response::with_status(404) });
  harness.transport->route("POST",
                           sample_install_path,
                           { fake_response::with_status(
                             202, R"({"tasks":[{"taskId":"439b29de","sample":"travel-sample"}]})") });
  const std::string running_task{
    R"([{"task_id":"439b29de","status":"running","type":"loadingSampleBucket","bucket":"travel-sample"}])"
  };
  harness.transport->route("GET",
                           tasks_path,
                           {
                             fake_response::ok(running_task),
                             fake_response::ok(running_task),
                             fake_response::ok(R"([{"type":"rebalance","status":"notRunning"}])"),
                           });

  std::mutex mutex{};
  std::vector<std::string> state_texts{};
  harness.notifications->watch([&mutex, &state_texts](const cbinit::resource_snapshot& snapshot) {
    if (snapshot.name == "travel-sample") {
      const std::scoped_lock lock(mutex);
      state_texts.push_back(snapshot.state_text);
    }
  });

  auto err = harness.start_and_settle();
  REQUIRE_NO_ERROR(err);

  CHECK(harness.snapshot("travel-sample").state == cbinit::resource_state::running);
  CHECK(harness.transport->count("POST", sample_install_path) == 1);
  CHECK(harness.transport->count("GET", tasks_path) == 3);
  CHECK(harness.transport->count("POST", buckets_path) == 0);
  for (const auto& recorded : harness.transport->requests()) {
    if (recorded.request.path == sample_install_path) {
      CHECK(recorded.request.body == R"(["travel-sample"])");
    }
  }

  const std::scoped_lock lock(mutex);
  CHECK(std::find(state_texts.begin(), state_texts.end(), "Loading") != state_texts.end());
}

TEST_CASE("unit: sample bucket without loading task is ready", "[unit]")
{
  cbinit::bucket_declaration bucket{};
  bucket.name = "beer-sample";
  bucket.kind = cbinit::bucket_kind::sample;

  orchestrator_harness harness{ make_topology(1, { bucket }) };
  route_initialized_cluster(*harness.transport, 1);
  harness.transport->route(
    "GET", "/pools/default/buckets/beer-sample", { fake_response::with_status(404) });
  harness.transport->route(
    "POST", sample_install_path, { fake_response::with_status(202, R"({"tasks":[]})") });

  std::mutex mutex{};
  std::vector<std::string> state_texts{};
  harness.notifications->watch([&mutex, &state_texts](const cbinit::resource_snapshot& snapshot) {
    if (snapshot.name == "beer-sample") {
      const std::scoped_lock lock(mutex);
      state_texts.push_back(snapshot.state_text);
    }
  });

  REQUIRE_NO_ERROR(harness.start_and_settle());

  CHECK(harness.snapshot("beer-sample").state == cbinit::resource_state::running);
  CHECK(harness.transport->count("POST", sample_install_path) == 1);
  CHECK(harness.transport->count("GET", tasks_path) == 0);

  const std::scoped_lock lock(mutex);
  CHECK(std::find(state_texts.begin(), state_texts.end(), "Loading") == state_texts.end());
}

TEST_CASE("unit: failed bucket does not affect the cluster", "[unit]")
{
  cbinit::bucket_declaration bucket{};
  bucket.name = "broken";

  orchestrator_harness harness{ make_topology(1, { bucket }) };
  route_initialized_cluster(*harness.transport, 1);
  harness.transport->route(
    "GET", "/pools/default/buckets/broken", { fake_response::with_status(404) });
  harness.transport->route("POST",
                           buckets_path,
                           { fake_response::with_status(400, R"({"errors":{"ramQuota":"RAM quota specified is too large"}})") });

  auto err = harness.start_and_settle();
  CHECK(err.ec() == cbinit::errc::orchestration::bootstrap_failed);
  CHECK_THAT(err.message(), ContainsSubstring("broken"));

  auto snapshot = harness.snapshot("broken");
  CHECK(snapshot.state == cbinit::resource_state::exited);
  CHECK(snapshot.exit_code == 1);
  CHECK(harness.snapshot("cluster").state == cbinit::resource_state::running);
}

TEST_CASE("unit: failed initialization marks the cluster as exited", "[unit]")
{
  cbinit::bucket_declaration bucket{};
  bucket.name = "default";

  orchestrator_harness harness{ make_topology(2, { bucket }) };
  harness.transport->route("GET", pool_path, { fake_response::with_status(404) });
  harness.transport->route(
    "POST", cluster_init_path, { fake_response::with_status(400, R"(["memoryQuota is too large"])") });

  auto err = harness.start_and_settle();
  CHECK(err.ec() == cbinit::errc::orchestration::bootstrap_failed);

  auto cluster = harness.snapshot("cluster");
  CHECK(cluster.state == cbinit::resource_state::exited);
  CHECK(cluster.exit_code == 1);
  CHECK(harness.snapshot("group1").state == cbinit::resource_state::exited);
  CHECK(harness.snapshot("group1").exit_code == 0);
  CHECK(harness.snapshot("default").state == cbinit::resource_state::exited);
  CHECK(harness.snapshot("default").exit_code == 0);
  CHECK(harness.transport->count("POST", add_node_path) == 0);
  CHECK(harness.transport->count("POST", buckets_path) == 0);
}

TEST_CASE("unit: primary node that exits fails the bootstrap", "[unit]")
{
  orchestrator_harness harness{ make_topology(1) };
  harness.commands->fail_on_start("node0", 1);

  auto err = harness.start_and_settle();
  CHECK(err.ec() == cbinit::errc::orchestration::bootstrap_failed);
  CHECK(harness.snapshot("cluster").exit_code == 1);
  CHECK(harness.transport->requests().empty());
}

TEST_CASE("unit: node that fails to start does not block the other joins", "[unit]")
{
  orchestrator_harness harness{ make_topology(3) };
  harness.commands->fail_on_start("node2", 1);
  harness.transport->route("GET", pool_path, { fake_response::with_status(404) });
  harness.transport->route("POST", cluster_init_path, { fake_response::ok() });
  harness.transport->route("PUT", alternate_addresses_path, { fake_response::ok() });
  harness.transport->route("GET", node_list_path, { fake_response::ok(node_list_body({ 0 })) });
  harness.transport->route("POST", add_node_path, { fake_response::ok() });
  harness.transport->route("POST", rebalance_path, { fake_response::ok() });
  harness.transport->route(
    "GET", rebalance_progress_path, { fake_response::ok(R"({"status":"none"})") });

  auto err = harness.start_and_settle();
  CHECK(err.ec() == cbinit::errc::orchestration::bootstrap_failed);
  CHECK_THAT(err.message(), ContainsSubstring("node2"));

  CHECK(harness.snapshot("cluster").state == cbinit::resource_state::running);
  CHECK(harness.snapshot("node1").property("initialized") == "true");
  auto failed = harness.snapshot("node2");
  CHECK(failed.state == cbinit::resource_state::exited);
  CHECK(failed.exit_code == 1);
  CHECK_FALSE(failed.property("initialized").has_value());

  CHECK(harness.transport->count("POST", add_node_path) == 1);
  CHECK(harness.transport->count("PUT", alternate_addresses_path, management_port(2)) == 0);
  CHECK(harness.transport->count("POST", rebalance_path) == 1);
  for (const auto& recorded : harness.transport->requests()) {
    if (recorded.request.path == add_node_path) {
      CHECK_THAT(recorded.request.body, ContainsSubstring("hostname=node1.dev.internal"));
    }
    if (recorded.request.path == rebalance_path) {
      CHECK_THAT(recorded.request.body, ContainsSubstring("ns_1%40node1.dev.internal"));
      CHECK_THAT(recorded.request.body,
                 !ContainsSubstring("ns_1%40node2.dev.internal"));
    }
  }
}

TEST_CASE("unit: stopping the cluster cancels the bootstrap", "[unit]")
{
  orchestrator_harness harness{ make_topology(2) };
  harness.transport->route("GET", pool_path, { fake_response::never() });

  auto future = harness.settled();
  harness.orchestrator->start();
  REQUIRE(test::utils::wait_until([&harness]() {
    return harness.transport->count("GET", pool_path) == 1;
  }));
  CHECK(harness.snapshot("cluster").state == cbinit::resource_state::starting);

  auto barrier = std::make_shared<std::promise<cbinit::error>>();
  auto stopped = barrier->get_future();
  harness.orchestrator->stop([barrier](cbinit::error err) {
    barrier->set_value(std::move(err));
  });
  REQUIRE(stopped.wait_for(10s) == std::future_status::ready);
  REQUIRE_NO_ERROR(stopped.get());

  auto err = orchestrator_harness::wait(std::move(future));
  REQUIRE_NO_ERROR(err);

  auto cluster = harness.snapshot("cluster");
  CHECK(cluster.state == cbinit::resource_state::exited);
  CHECK(cluster.exit_code == 0);
  CHECK(harness.snapshot("group1").state == cbinit::resource_state::exited);
  CHECK(harness.snapshot("node0").state == cbinit::resource_state::exited);
  CHECK(harness.snapshot("node1").state == cbinit::resource_state::exited);
  CHECK(harness.transport->mutations().empty());
}

TEST_CASE("unit: cluster can be started again after stop", "[unit]")
{
  orchestrator_harness harness{ make_topology(1) };
  route_initialized_cluster(*harness.transport, 1);

  REQUIRE_NO_ERROR(harness.start_and_settle());

  auto barrier = std::make_shared<std::promise<cbinit::error>>();
  auto stopped = barrier->get_future();
  harness.orchestrator->stop([barrier](cbinit::error err) {
    barrier->set_value(std::move(err));
  });
  REQUIRE(stopped.wait_for(10s) == std::future_status::ready);
  CHECK(harness.snapshot("cluster").state == cbinit::resource_state::exited);

  REQUIRE_NO_ERROR(harness.start_and_settle());
  CHECK(harness.snapshot("cluster").state == cbinit::resource_state::running);
  CHECK(harness.transport->count("GET", pool_path) == 2);
}

TEST_CASE("unit: exited server loses initialized property", "[unit]")
{
  orchestrator_harness harness{ make_topology(1) };
  route_initialized_cluster(*harness.transport, 1);

  REQUIRE_NO_ERROR(harness.start_and_settle());
  REQUIRE(harness.snapshot("node0").property("initialized") == "true");

  auto barrier = std::make_shared<std::promise<cbinit::error>>();
  auto stopped = barrier->get_future();
  harness.orchestrator->stop_resource("node0", [barrier](cbinit::error err) {
    barrier->set_value(std::move(err));
  });
  REQUIRE(stopped.wait_for(10s) == std::future_status::ready);
  REQUIRE_NO_ERROR(stopped.get());

  CHECK(test::utils::wait_until([&harness]() {
    auto node = harness.snapshot("node0");
    return cbinit::is_terminal(node.state) && !node.property("initialized");
  }));
}

TEST_CASE("unit: resource commands are validated", "[unit]")
{
  orchestrator_harness harness{ make_topology(1) };

  auto run = [&harness](auto&& command) {
    auto barrier = std::make_shared<std::promise<cbinit::error>>();
    auto future = barrier->get_future();
    command([barrier](cbinit::error err) {
      barrier->set_value(std::move(err));
    });
    REQUIRE(future.wait_for(10s) == std::future_status::ready);
    return future.get();
  };

  auto err = run([&harness](auto&& handler) {
    harness.orchestrator->start_resource("unknown", std::move(handler));
  });
  CHECK(err.ec() == cbinit::errc::orchestration::resource_not_found);

  err = run([&harness](auto&& handler) {
    harness.orchestrator->stop_resource("group1", std::move(handler));
  });
  CHECK(err.ec() == cbinit::errc::orchestration::unsupported_command);

  err = run([&harness](auto&& handler) {
    harness.orchestrator->flush_bucket("missing", std::move(handler));
  });
  CHECK(err.ec() == cbinit::errc::orchestration::resource_not_found);
}

TEST_CASE("unit: flush waits for the bucket to become healthy again", "[unit]")
{
  cbinit::bucket_declaration bucket{};
  bucket.name = "default";
  bucket.settings.flush_enabled = true;

  orchestrator_harness harness{ make_topology(1, { bucket }) };
  route_initialized_cluster(*harness.transport, 1);
  harness.transport->route(
    "GET", "/pools/default/buckets/default", { fake_response::ok(bucket_body("default", "healthy")) });
  REQUIRE_NO_ERROR(harness.start_and_settle());

  harness.transport->route("GET",
                           "/pools/default/buckets/default",
                           {
                             fake_response::ok(bucket_body("default", "warmup")),
                             fake_response::ok(bucket_body("default", "healthy")),
                           });
  harness.transport->route(
    "POST", "/pools/default/buckets/default/controller/doFlush", { fake_response::ok() });

  auto barrier = std::make_shared<std::promise<cbinit::error>>();
  auto flushed = barrier->get_future();
  harness.orchestrator->flush_bucket("default", [barrier](cbinit::error err) {
    barrier->set_value(std::move(err));
  });
  REQUIRE(flushed.wait_for(10s) == std::future_status::ready);
  REQUIRE_NO_ERROR(flushed.get());
  CHECK(harness.transport->count("POST", "/pools/default/buckets/default/controller/doFlush") == 1);
}
