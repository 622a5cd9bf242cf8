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

#include "core/orchestration/health_requirement.hxx"

using cbinit::core::management::cluster_node;
using cbinit::core::orchestration::health_requirement;

namespace
{
auto
make_node(const std::string& hostname, const std::string& status, std::vector<std::string> services)
  -> cluster_node
{
  cluster_node node{};
  node.hostname = hostname;
  node.status = status;
  node.services = std::move(services);
  return node;
}
} // namespace

TEST_CASE("unit: healthy cluster satisfies default requirement", "[unit]")
{
  std::vector<cluster_node> nodes{
    make_node("node0.dev.internal:8091", "healthy", { "kv", "n1ql" }),
    make_node("node1.dev.internal:8091", "healthy", { "kv" }),
  };
  CHECK_FALSE(health_requirement{}.evaluate(nodes).has_value());
  CHECK(cbinit::core::orchestration::evaluate_services(cbinit::service::data | cbinit::service::query, nodes)
          .empty());
}

TEST_CASE("unit: service without nodes", "[unit]")
{
  std::vector<cluster_node> nodes{
    make_node("node0.dev.internal:8091", "healthy", { "kv" }),
  };
  auto failure = health_requirement{ cbinit::service::query }.evaluate(nodes);
  REQUIRE(failure.has_value());
  CHECK(failure.value() == "Couchbase health check failed for service query, no nodes available.");
}

TEST_CASE("unit: unhealthy nodes are listed", "[unit]")
{
  std::vector<cluster_node> nodes{
    make_node("node2.dev.internal:8091", "warmup", { "kv" }),
    make_node("node0.dev.internal:8091", "healthy", { "kv" }),
    make_node("node1.dev.internal:8091", "unhealthy", { "kv" }),
  };

  health_requirement strict{};
  strict.maximum_unhealthy_nodes = 0;
  auto failure = strict.evaluate(nodes);
  REQUIRE(failure.has_value());
  CHECK(failure.value() ==
        "Couchbase health check failed for service data for nodes node1.dev.internal:8091, "
        "node2.dev.internal:8091.");

  CHECK_FALSE(health_requirement{}.evaluate(nodes).has_value());
}

TEST_CASE("unit: not enough healthy nodes", "[unit]")
{
  std::vector<cluster_node> nodes{
    make_node("node0.dev.internal:8091", "healthy", { "kv" }),
  };
  health_requirement requirement{};
  requirement.minimum_healthy_nodes = 2;
  auto failure = requirement.evaluate(nodes);
  REQUIRE(failure.has_value());
  CHECK(failure.value() == "Couchbase health check failed for service data, 1 healthy nodes.");
}

TEST_CASE("unit: every declared service is evaluated", "[unit]")
{
  std::vector<cluster_node> nodes{
    make_node("node0.dev.internal:8091", "warmup", { "kv", "index" }),
  };
  auto failures = cbinit::core::orchestration::evaluate_services(
    cbinit::service::data | cbinit::service::index | cbinit::service::search, nodes);
  REQUIRE(failures.size() == 3);
  CHECK(failures[0] ==
        "Couchbase health check failed for service data for nodes node0.dev.internal:8091.");
  CHECK(failures[1] ==
        "Couchbase health check failed for service index for nodes node0.dev.internal:8091.");
  CHECK(failures[2] == "Couchbase health check failed for service search, no nodes available.");
}
