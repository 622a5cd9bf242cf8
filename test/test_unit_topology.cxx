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

#include "core/topology/cluster_topology_config.hxx"

#include <cbinit/error_codes.hxx>
#include <cbinit/topology.hxx>

namespace
{
constexpr auto minimal_document = R"({
  "name": "cluster",
  "password": "password",
  "server_groups": [
    { "name": "group1", "servers": [ { "name": "node0" } ] }
  ]
})";

auto
parse(std::string_view document) -> cbinit::cluster_topology
{
  auto topology = cbinit::core::topology::parse_cluster_topology(document);
  REQUIRE(topology.has_value());
  return topology.value();
}

auto
parse_error(std::string_view document) -> std::error_code
{
  auto topology = cbinit::core::topology::parse_cluster_topology(document);
  REQUIRE_FALSE(topology.has_value());
  return topology.error().ec();
}

auto
make_server(const std::string& name, bool initial_node = false) -> cbinit::server_node
{
  cbinit::server_node server{};
  server.name = name;
  server.initial_node = initial_node;
  return server;
}
} // namespace

TEST_CASE("unit: topology document with defaults", "[unit]")
{
  auto topology = parse(minimal_document);

  CHECK(topology.name() == "cluster");
  auto settings = topology.settings();
  CHECK(settings.cluster_name == "cluster");
  CHECK(settings.credentials.username == "Administrator");
  CHECK(settings.credentials.password == "password");
  CHECK(settings.edition == cbinit::edition::enterprise);
  CHECK(settings.quotas.data_mb == 1024);
  CHECK_FALSE(topology.has_certificate_authority());
  CHECK(topology.buckets().empty());

  auto server = topology.find_server("node0");
  REQUIRE(server.has_value());
  CHECK(server->hostname == "node0.dev.internal");
  CHECK(server->external_hostname == "localhost");
  CHECK(server->group == "group1");
  CHECK(server->services == cbinit::default_services);
  CHECK(server->cluster_node_address() == "node0.dev.internal:8091");

  auto endpoint = server->management_endpoint(false);
  CHECK(endpoint.host == "localhost");
  CHECK(endpoint.port == 8091);
  CHECK(server->management_endpoint(true).port == 18091);
}

TEST_CASE("unit: complete topology document", "[unit]")
{
  auto topology = parse(R"({
    "name": "cluster",
    "username": "admin",
    "password": "secret",
    "cluster_name": "dev",
    "edition": "community",
    "memory_quotas": { "data": 512, "index": 256 },
    "index_storage_mode": "memory_optimized",
    "server_groups": [
      {
        "name": "data",
        "services": [ "data" ],
        "servers": [
          { "name": "node0", "endpoints": { "management": 9000, "data": 11000 } },
          { "name": "node1", "hostname": "db1", "external_hostname": "127.0.0.1", "initial_node": true }
        ]
      },
      {
        "name": "query",
        "services": [ "query", "index" ],
        "servers": [ { "name": "node2" } ]
      }
    ],
    "buckets": [
      {
        "name": "default",
        "type": "ephemeral",
        "ram_quota_mb": 256,
        "replicas": 2,
        "flush_enabled": true,
        "max_expiry": 60,
        "compression_mode": "active",
        "eviction_policy": "noEviction",
        "minimum_durability_level": "majority",
        "scopes": { "inventory": [ "airline", "airport" ] }
      },
      { "name": "travel-sample", "sample": true }
    ]
  })");

  auto settings = topology.settings();
  CHECK(settings.credentials.username == "admin");
  CHECK(settings.cluster_name == "dev");
  CHECK(settings.edition == cbinit::edition::community);
  CHECK(settings.quotas.data_mb == 512);
  CHECK(settings.quotas.index_mb == 256);
  CHECK(settings.quotas.query_mb == 1024);
  CHECK(settings.index_storage_mode == cbinit::index_storage_mode::memory_optimized);

  REQUIRE(topology.groups().size() == 2);
  CHECK(topology.servers().size() == 3);

  auto node0 = topology.find_server("node0");
  REQUIRE(node0.has_value());
  CHECK(node0->services == cbinit::service::data);
  CHECK(node0->management_endpoint(false).port == 9000);
  CHECK(node0->endpoint_port(cbinit::endpoint_names::data) == 11000);
  CHECK(node0->endpoint_port(cbinit::endpoint_names::query) == 8093);

  auto node1 = topology.find_server("node1");
  REQUIRE(node1.has_value());
  CHECK(node1->hostname == "db1");
  CHECK(node1->cluster_node_address() == "db1:8091");

  auto node2 = topology.find_server("node2");
  REQUIRE(node2.has_value());
  CHECK(node2->services == (cbinit::service::query | cbinit::service::index));

  auto primary = topology.primary();
  REQUIRE(primary.has_value());
  CHECK(primary->name == "node1");

  auto bucket = topology.find_bucket("default");
  REQUIRE(bucket.has_value());
  CHECK(bucket->kind == cbinit::bucket_kind::standard);
  CHECK(bucket->settings.bucket_type == cbinit::bucket_type::ephemeral);
  CHECK(bucket->settings.effective_ram_quota_mb() == 256);
  CHECK(bucket->settings.num_replicas == 2U);
  CHECK(bucket->settings.flush_enabled == true);
  CHECK(bucket->settings.max_expiry == 60U);
  CHECK(bucket->settings.compression_mode == cbinit::bucket_compression::active);
  CHECK(bucket->settings.eviction_policy == cbinit::bucket_eviction_policy::no_eviction);
  CHECK(bucket->settings.minimum_durability_level == cbinit::durability_level::majority);
  CHECK_FALSE(bucket->settings.storage_backend.has_value());
  REQUIRE(bucket->scopes.count("inventory") == 1);
  CHECK(bucket->scopes.at("inventory") == std::vector<std::string>{ "airline", "airport" });

  auto sample = topology.find_bucket("travel-sample");
  REQUIRE(sample.has_value());
  CHECK(sample->kind == cbinit::bucket_kind::sample);
  CHECK(sample->settings.effective_ram_quota_mb() == 100);

  CHECK(topology.connection_string() ==
        "couchbase://localhost:11000,127.0.0.1:11210");
  CHECK(topology.connection_string("default") ==
        "couchbase://localhost:11000,127.0.0.1:11210/default");
}

TEST_CASE("unit: malformed topology document", "[unit]")
{
  CHECK(parse_error(R"({"name": "cluster", )") == cbinit::errc::common::parsing_failure);
  CHECK(parse_error("") == cbinit::errc::common::parsing_failure);
}

TEST_CASE("unit: topology document with unexpected values", "[unit]")
{
  SECTION("unknown service")
  {
    CHECK(parse_error(R"({"name": "c", "server_groups": [
            {"name": "g", "services": ["data", "xdcr"], "servers": [{"name": "n"}]}]})") ==
          cbinit::errc::orchestration::invalid_topology);
  }

  SECTION("unknown edition")
  {
    CHECK(parse_error(R"({"name": "c", "edition": "gold", "server_groups": [
            {"name": "g", "servers": [{"name": "n"}]}]})") ==
          cbinit::errc::orchestration::invalid_topology);
  }

  SECTION("unknown bucket type")
  {
    CHECK(parse_error(R"({"name": "c", "server_groups": [{"name": "g", "servers": [{"name": "n"}]}],
            "buckets": [{"name": "b", "type": "memory"}]})") ==
          cbinit::errc::orchestration::invalid_topology);
  }

  SECTION("unknown endpoint")
  {
    CHECK(parse_error(R"({"name": "c", "server_groups": [
            {"name": "g", "servers": [{"name": "n", "endpoints": {"dashboard": 80}}]}]})") ==
          cbinit::errc::orchestration::invalid_topology);
  }

  SECTION("missing servers")
  {
    CHECK(parse_error(R"({"name": "c", "server_groups": [{"name": "g"}]})") ==
          cbinit::errc::orchestration::invalid_topology);
  }
}

TEST_CASE("unit: topology validation", "[unit]")
{
  SECTION("valid")
  {
    cbinit::cluster_topology topology{ "cluster", {}, { { "group1", cbinit::default_services, { make_server("node0") } } }, {} };
    CHECK_FALSE(topology.validate());
  }

  SECTION("without server groups")
  {
    cbinit::cluster_topology topology{ "cluster", {}, {}, {} };
    CHECK(topology.validate() == cbinit::errc::orchestration::invalid_topology);
  }

  SECTION("empty server group")
  {
    cbinit::cluster_topology topology{ "cluster", {}, { { "group1", cbinit::default_services, {} } }, {} };
    CHECK(topology.validate() == cbinit::errc::orchestration::invalid_topology);
  }

  SECTION("duplicate names")
  {
    cbinit::cluster_topology topology{
      "cluster", {}, { { "group1", cbinit::default_services, { make_server("node0"), make_server("node0") } } }, {}
    };
    CHECK(topology.validate() == cbinit::errc::orchestration::invalid_topology);

    cbinit::bucket_declaration bucket{};
    bucket.name = "node0";
    cbinit::cluster_topology clash{
      "cluster", {}, { { "group1", cbinit::default_services, { make_server("node0") } } }, { bucket }
    };
    CHECK(clash.validate() == cbinit::errc::orchestration::invalid_topology);
  }

  SECTION("zero bucket quota")
  {
    cbinit::bucket_declaration bucket{};
    bucket.name = "default";
    bucket.settings.ram_quota_mb = 0;
    cbinit::cluster_topology topology{
      "cluster", {}, { { "group1", cbinit::default_services, { make_server("node0") } } }, { bucket }
    };
    CHECK(topology.validate() == cbinit::errc::orchestration::invalid_settings);
  }

  SECTION("no data service")
  {
    cbinit::cluster_topology topology{
      "cluster", {}, { { "group1", cbinit::service::query, { make_server("node0") } } }, {}
    };
    CHECK(topology.validate() == cbinit::errc::orchestration::no_data_service_node);
    CHECK_FALSE(topology.primary().has_value());
  }
}

TEST_CASE("unit: primary is the first data node unless another node is preferred", "[unit]")
{
  cbinit::cluster_topology topology{ "cluster",
                                     {},
                                     {
                                       { "query", cbinit::service::query, { make_server("node0", true) } },
                                       { "data", cbinit::service::data, { make_server("node1"), make_server("node2") } },
                                     },
                                     {} };
  REQUIRE(topology.primary().has_value());
  CHECK(topology.primary()->name == "node1");

  cbinit::cluster_topology preferred{ "cluster",
                                      {},
                                      {
                                        { "data", cbinit::service::data, { make_server("node1"), make_server("node2", true) } },
                                      },
                                      {} };
  REQUIRE(preferred.primary().has_value());
  CHECK(preferred.primary()->name == "node2");
}

TEST_CASE("unit: connection string uses secure ports with certificate authority", "[unit]")
{
  auto node = make_server("node0");
  node.endpoints[cbinit::endpoint_names::data_secure] = 12000;
  cbinit::cluster_topology topology{ "cluster",
                                     {},
                                     { { "group1", cbinit::default_services, { node } } },
                                     {},
                                     cbinit::certificate_authority{ "-----BEGIN CERTIFICATE-----", {} } };
  CHECK(topology.connection_string() == "couchbases://localhost:12000");
  CHECK(topology.connection_string("travel-sample") == "couchbases://localhost:12000/travel-sample");
}

TEST_CASE("unit: settings provider replaces declared settings", "[unit]")
{
  auto topology = parse(minimal_document);
  topology.settings_provider([]() {
    cbinit::cluster_settings settings{};
    settings.credentials.password = "rotated";
    return settings;
  });
  CHECK(topology.credentials().password == "rotated");
}

TEST_CASE("unit: service names", "[unit]")
{
  CHECK(cbinit::to_management_services(cbinit::default_services) == "kv,n1ql,index");
  CHECK(cbinit::to_management_services(cbinit::service::search | cbinit::service::data) == "kv,fts");
  CHECK(cbinit::service_from_string("analytics") == cbinit::service::analytics);
  CHECK_FALSE(cbinit::service_from_string("xdcr").has_value());
  CHECK(cbinit::service_names(cbinit::service::data | cbinit::service::eventing) ==
        std::vector<std::string>{ "data", "eventing" });
}
