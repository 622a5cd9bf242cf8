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

#include "utils/io_context_runner.hxx"

#include "core/orchestration/resource_notification_service.hxx"

#include <cbinit/error_codes.hxx>

#include <future>

using namespace std::chrono_literals;
using cbinit::resource_kind;
using cbinit::resource_snapshot;
using cbinit::resource_state;

namespace
{
struct wait_result {
  std::error_code ec{};
  resource_snapshot snapshot{};
};

auto
make_snapshot(const std::string& name, resource_kind kind, const std::string& parent = {})
  -> resource_snapshot
{
  resource_snapshot snapshot{};
  snapshot.name = name;
  snapshot.kind = kind;
  snapshot.parent = parent;
  return snapshot;
}

class notifications_harness
{
public:
  notifications_harness()
  {
    test::utils::init_logger();
    service =
      std::make_shared<cbinit::core::orchestration::resource_notification_service>(io.ctx());
    service->register_resource(make_snapshot("cluster", resource_kind::cluster));
    service->register_resource(make_snapshot("group1", resource_kind::server_group, "cluster"));
    service->register_resource(make_snapshot("node0", resource_kind::server, "group1"));
    service->register_resource(make_snapshot("node1", resource_kind::server, "group1"));
    service->register_resource(make_snapshot("default", resource_kind::bucket, "cluster"));
  }

  auto wait_for(const std::string& name,
                std::vector<resource_state> states,
                const std::shared_ptr<cbinit::core::cancellation_token>& token = nullptr)
    -> std::future<wait_result>
  {
    auto barrier = std::make_shared<std::promise<wait_result>>();
    auto future = barrier->get_future();
    service->wait_for(name,
                      std::move(states),
                      token,
                      [barrier](std::error_code ec, resource_snapshot snapshot) {
                        barrier->set_value({ ec, std::move(snapshot) });
                      });
    return future;
  }

  void set_state(const std::string& name, resource_state state)
  {
    REQUIRE(service->publish(name, [state](resource_snapshot& snapshot) {
      snapshot.state = state;
    }));
  }

  test::utils::io_context_runner io{};
  std::shared_ptr<cbinit::core::orchestration::resource_notification_service> service{};
};
} // namespace

TEST_CASE("unit: registered resources keep their order and hierarchy", "[unit]")
{
  notifications_harness harness{};

  auto snapshots = harness.service->snapshots();
  REQUIRE(snapshots.size() == 5);
  CHECK(snapshots[0].name == "cluster");
  CHECK(snapshots[4].name == "default");

  auto children = harness.service->children_of("cluster");
  REQUIRE(children.size() == 2);
  CHECK(children[0].name == "group1");
  CHECK(children[1].name == "default");

  children = harness.service->children_of("group1");
  REQUIRE(children.size() == 2);
  CHECK(children[0].name == "node0");
  CHECK(children[1].name == "node1");

  CHECK(harness.service->children_of("node0").empty());

  harness.service->register_resource(make_snapshot("node0", resource_kind::server, "group1"));
  CHECK(harness.service->snapshots().size() == 5);
}

TEST_CASE("unit: publish updates snapshot and notifies watchers", "[unit]")
{
  notifications_harness harness{};

  std::vector<resource_snapshot> seen{};
  auto id = harness.service->watch([&seen](const resource_snapshot& snapshot) {
    seen.push_back(snapshot);
  });

  CHECK(harness.service->publish("node0", [](resource_snapshot& snapshot) {
    snapshot.state = resource_state::running;
    snapshot.state_text = "Running";
    snapshot.properties["initialized"] = "true";
  }));
  CHECK_FALSE(harness.service->publish("unknown", [](resource_snapshot& /* snapshot */) {}));

  REQUIRE(seen.size() == 1);
  CHECK(seen[0].name == "node0");
  CHECK(seen[0].state == resource_state::running);

  auto current = harness.service->current("node0");
  REQUIRE(current.has_value());
  CHECK(current->state_text == "Running");
  CHECK(current->property("initialized") == "true");
  CHECK_FALSE(current->property("connection_string").has_value());
  CHECK_FALSE(harness.service->current("unknown").has_value());

  harness.service->unwatch(id);
  harness.set_state("node0", resource_state::stopping);
  CHECK(seen.size() == 1);
}

TEST_CASE("unit: wait completes when resource reaches the state", "[unit]")
{
  notifications_harness harness{};

  auto running = harness.wait_for("node0", { resource_state::running });
  CHECK(running.wait_for(20ms) == std::future_status::timeout);

  harness.set_state("node0", resource_state::starting);
  CHECK(running.wait_for(20ms) == std::future_status::timeout);

  harness.set_state("node0", resource_state::running);
  REQUIRE(running.wait_for(10s) == std::future_status::ready);
  auto result = running.get();
  REQUIRE_SUCCESS(result.ec);
  CHECK(result.snapshot.state == resource_state::running);

  auto immediate = harness.wait_for("node0", { resource_state::running, resource_state::exited });
  REQUIRE(immediate.wait_for(10s) == std::future_status::ready);
  REQUIRE_SUCCESS(immediate.get().ec);
}

TEST_CASE("unit: wait for unknown resource", "[unit]")
{
  notifications_harness harness{};

  auto result = harness.wait_for("unknown", { resource_state::running });
  REQUIRE(result.wait_for(10s) == std::future_status::ready);
  CHECK(result.get().ec == cbinit::errc::orchestration::resource_not_found);
}

TEST_CASE("unit: wait is interrupted by cancellation", "[unit]")
{
  notifications_harness harness{};

  auto token = cbinit::core::cancellation_token::create();
  auto pending = harness.wait_for("cluster", { resource_state::running }, token);
  CHECK(pending.wait_for(20ms) == std::future_status::timeout);

  token->cancel();
  REQUIRE(pending.wait_for(10s) == std::future_status::ready);
  CHECK(pending.get().ec == cbinit::errc::common::request_canceled);

  // the cancelled waiter must not fire again
  harness.set_state("cluster", resource_state::running);

  auto late = harness.wait_for("cluster", { resource_state::exited }, token);
  REQUIRE(late.wait_for(10s) == std::future_status::ready);
  CHECK(late.get().ec == cbinit::errc::common::request_canceled);
}

TEST_CASE("unit: wait with custom predicate", "[unit]")
{
  notifications_harness harness{};

  auto barrier = std::make_shared<std::promise<wait_result>>();
  auto future = barrier->get_future();
  harness.service->wait_for(
    "default",
    [](const resource_snapshot& snapshot) {
      return snapshot.property("connection_string").has_value();
    },
    nullptr,
    [barrier](std::error_code ec, resource_snapshot snapshot) {
      barrier->set_value({ ec, std::move(snapshot) });
    });

  harness.set_state("default", resource_state::running);
  CHECK(future.wait_for(20ms) == std::future_status::timeout);

  REQUIRE(harness.service->publish("default", [](resource_snapshot& snapshot) {
    snapshot.properties["connection_string"] = "couchbase://localhost:11210/default";
  }));
  REQUIRE(future.wait_for(10s) == std::future_status::ready);
  auto result = future.get();
  REQUIRE_SUCCESS(result.ec);
  CHECK(result.snapshot.property("connection_string") == "couchbase://localhost:11210/default");
}

TEST_CASE("unit: resource state names", "[unit]")
{
  CHECK(cbinit::to_string(resource_state::not_started) == "NotStarted");
  CHECK(cbinit::to_string(resource_state::failed_to_start) == "FailedToStart");
  CHECK(cbinit::to_string(resource_kind::server_group) == "server_group");
  CHECK(cbinit::is_terminal(resource_state::exited));
  CHECK(cbinit::is_terminal(resource_state::failed_to_start));
  CHECK_FALSE(cbinit::is_terminal(resource_state::stopping));
}
