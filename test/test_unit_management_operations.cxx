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

#include "core/operations.hxx"

#include <cbinit/error_codes.hxx>

#include <catch2/matchers/catch_matchers_string.hpp>

using Catch::Matchers::ContainsSubstring;
using namespace cbinit::core::operations::management;

namespace
{
auto
make_response(std::uint32_t status_code, std::string body = {}) -> cbinit::core::io::http_response
{
  cbinit::core::io::http_response response{};
  response.status_code = status_code;
  response.body = std::move(body);
  return response;
}
} // namespace

TEST_CASE("unit: cluster initialization request", "[unit]")
{
  cluster_init_request request{};
  request.settings.cluster_name = "my cluster";
  request.settings.credentials = { "Administrator", "p@ss word" };
  request.settings.quotas.data_mb = 2048;
  request.hostname = "node0.dev.internal";

  SECTION("enterprise edition")
  {
    cbinit::core::io::http_request encoded{};
    REQUIRE_SUCCESS(request.encode_to(encoded));
    CHECK(encoded.method == "POST");
    CHECK(encoded.path == "/clusterInit");
    CHECK(encoded.headers["content-type"] == "application/x-www-form-urlencoded");
    CHECK(encoded.body ==
          "username=Administrator&password=p%40ss+word&clusterName=my+cluster"
          "&hostname=node0.dev.internal&memoryQuota=2048&queryMemoryQuota=1024"
          "&indexMemoryQuota=1024&ftsMemoryQuota=1024&indexerStorageMode=plasma"
          "&services=kv%2Cn1ql%2Cindex&port=SAME&cbasMemoryQuota=1024&eventingMemoryQuota=1024"
          "&nodeEncryption=on");
  }

  SECTION("community edition")
  {
    request.settings.edition = cbinit::edition::community;
    request.services = cbinit::service::data;
    cbinit::core::io::http_request encoded{};
    REQUIRE_SUCCESS(request.encode_to(encoded));
    CHECK_THAT(encoded.body, ContainsSubstring("indexerStorageMode=forestdb"));
    CHECK_THAT(encoded.body, ContainsSubstring("services=kv&"));
    CHECK_THAT(encoded.body, !ContainsSubstring("cbasMemoryQuota"));
    CHECK_THAT(encoded.body, !ContainsSubstring("nodeEncryption"));
  }

  SECTION("password is required")
  {
    request.settings.credentials.password.clear();
    cbinit::core::io::http_request encoded{};
    CHECK(request.encode_to(encoded) == cbinit::errc::common::invalid_argument);
  }

  SECTION("validation failure")
  {
    auto response = request.make_response(
      {}, make_response(400, R"(["The RAM Quota value is too large."])"));
    CHECK(response.ctx.ec == cbinit::errc::common::invalid_argument);
  }
}

TEST_CASE("unit: add node request", "[unit]")
{
  node_add_request request{};
  request.credentials = { "Administrator", "password" };
  request.hostname = "node1.dev.internal";
  request.services = cbinit::service::data | cbinit::service::search;

  cbinit::core::io::http_request encoded{};
  REQUIRE_SUCCESS(request.encode_to(encoded));
  CHECK(encoded.path == "/controller/addNode");
  CHECK(encoded.body ==
        "user=Administrator&password=password&hostname=node1.dev.internal&services=kv%2Cfts");

  CHECK_FALSE(request.make_response({}, make_response(200, R"({"otpNode":"ns_1@node1"})")).ctx.ec);
  CHECK(request.make_response({}, make_response(401)).ctx.ec ==
        cbinit::errc::common::authentication_failure);
  CHECK(request.make_response({}, make_response(400, R"(["Prepare join failed."])")).ctx.ec ==
        cbinit::errc::management::request_failed);
}

TEST_CASE("unit: rebalance request lists known nodes", "[unit]")
{
  rebalance_request request{};
  request.known_nodes = { "node0.dev.internal", "node1.dev.internal" };

  cbinit::core::io::http_request encoded{};
  REQUIRE_SUCCESS(request.encode_to(encoded));
  CHECK(encoded.path == "/controller/rebalance");
  CHECK(encoded.body == "knownNodes=ns_1%40node0.dev.internal%2Cns_1%40node1.dev.internal");
}

TEST_CASE("unit: rebalance progress", "[unit]")
{
  rebalance_progress_get_request request{};

  auto response = request.make_response({}, make_response(200, R"({"status":"running"})"));
  REQUIRE_SUCCESS(response.ctx.ec);
  CHECK_FALSE(response.is_done());

  response = request.make_response({}, make_response(200, R"({"status":"none"})"));
  REQUIRE_SUCCESS(response.ctx.ec);
  CHECK(response.is_done());

  response = request.make_response({}, make_response(200, "<html>"));
  CHECK(response.ctx.ec == cbinit::errc::common::parsing_failure);
}

TEST_CASE("unit: bucket creation sends only declared settings", "[unit]")
{
  bucket_create_request request{};
  request.name = "default";

  SECTION("defaults")
  {
    cbinit::core::io::http_request encoded{};
    REQUIRE_SUCCESS(request.encode_to(encoded));
    CHECK(encoded.method == "POST");
    CHECK(encoded.path == "/pools/default/buckets");
    CHECK(encoded.body == "name=default&bucketType=couchbase&ramQuota=100");
  }

  SECTION("all settings")
  {
    request.settings.bucket_type = cbinit::bucket_type::ephemeral;
    request.settings.ram_quota_mb = 512;
    request.settings.num_replicas = 2;
    request.settings.flush_enabled = false;
    request.settings.compression_mode = cbinit::bucket_compression::active;
    request.settings.conflict_resolution_type = cbinit::bucket_conflict_resolution::timestamp;
    request.settings.minimum_durability_level = cbinit::durability_level::majority;
    request.settings.eviction_policy = cbinit::bucket_eviction_policy::not_recently_used;
    request.settings.max_expiry = 3600;

    cbinit::core::io::http_request encoded{};
    REQUIRE_SUCCESS(request.encode_to(encoded));
    CHECK_THAT(encoded.body, ContainsSubstring("bucketType=ephemeral&ramQuota=512"));
    CHECK_THAT(encoded.body, ContainsSubstring("replicaNumber=2"));
    CHECK_THAT(encoded.body, ContainsSubstring("flushEnabled=0"));
    CHECK_THAT(encoded.body, ContainsSubstring("compressionMode=active"));
    CHECK_THAT(encoded.body, ContainsSubstring("conflictResolutionType=lww"));
    CHECK_THAT(encoded.body, ContainsSubstring("durabilityMinLevel=majority"));
    CHECK_THAT(encoded.body, ContainsSubstring("evictionPolicy=nruEviction"));
    CHECK_THAT(encoded.body, ContainsSubstring("maxTTL=3600"));
    CHECK_THAT(encoded.body, !ContainsSubstring("storageBackend"));
  }

  SECTION("existing bucket")
  {
    auto response = request.make_response(
      {},
      make_response(400, R"({"errors":{"name":"Bucket with given name already exists"}})"));
    CHECK(response.ctx.ec == cbinit::errc::management::bucket_exists);
  }

  SECTION("empty name")
  {
    request.name.clear();
    cbinit::core::io::http_request encoded{};
    CHECK(request.encode_to(encoded) == cbinit::errc::common::invalid_argument);
  }
}

TEST_CASE("unit: bucket status", "[unit]")
{
  bucket_get_request request{ "travel-sample" };

  cbinit::core::io::http_request encoded{};
  REQUIRE_SUCCESS(request.encode_to(encoded));
  CHECK(encoded.path == "/pools/default/buckets/travel-sample");

  auto response = request.make_response({}, make_response(404, "Requested resource not found."));
  CHECK(response.ctx.ec == cbinit::errc::common::bucket_not_found);

  response = request.make_response(
    {},
    make_response(200,
                  R"({"name":"travel-sample","bucketType":"membase","nodes":[)"
                  R"({"hostname":"node0.dev.internal:8091","status":"healthy"},)"
                  R"({"hostname":"node1.dev.internal:8091","status":"warmup"}]})"));
  REQUIRE_SUCCESS(response.ctx.ec);
  CHECK(response.bucket.name == "travel-sample");
  CHECK(response.bucket.nodes.size() == 2);
  CHECK_FALSE(response.bucket.is_healthy());

  response.bucket.nodes.back().status = "healthy";
  CHECK(response.bucket.is_healthy());

  response.bucket.nodes.clear();
  CHECK_FALSE(response.bucket.is_healthy());
}

TEST_CASE("unit: default pool tells whether the node is initialized", "[unit]")
{
  pool_get_request request{};

  auto response = request.make_response({}, make_response(404, R"("unknown pool")"));
  REQUIRE_SUCCESS(response.ctx.ec);
  CHECK_FALSE(response.initialized);

  response = request.make_response({}, make_response(200, R"({"name":"default"})"));
  REQUIRE_SUCCESS(response.ctx.ec);
  CHECK(response.initialized);

  response = request.make_response({}, make_response(401));
  CHECK(response.ctx.ec == cbinit::errc::common::authentication_failure);
}

TEST_CASE("unit: alternate addresses", "[unit]")
{
  alternate_addresses_setup_request request{};
  request.hostname = "localhost";
  request.ports = { { "mgmt", 9000 }, { "kv", 11210 } };

  cbinit::core::io::http_request encoded{};
  REQUIRE_SUCCESS(request.encode_to(encoded));
  CHECK(encoded.method == "PUT");
  CHECK(encoded.path == "/node/controller/setupAlternateAddresses/external");
  CHECK(encoded.body == "hostname=localhost&kv=11210&mgmt=9000");

  node_services_get_request get{};
  auto response = get.make_response(
    {},
    make_response(200,
                  R"({"nodesExt":[{"hostname":"node1.dev.internal","services":{"mgmt":8091}},)"
                  R"({"thisNode":true,"hostname":"node0.dev.internal","services":{"mgmt":8091},)"
                  R"("alternateAddresses":{"external":{"hostname":"localhost","ports":{"kv":11210,"mgmt":9000}}}}]})"));
  REQUIRE_SUCCESS(response.ctx.ec);
  CHECK(response.node.hostname == "node0.dev.internal");
  REQUIRE(response.node.external_address.has_value());
  CHECK(response.node.external_address->hostname == request.hostname);
  CHECK(response.node.external_address->ports == request.ports);

  response = get.make_response({}, make_response(200, R"({"nodesExt":[{"hostname":"x"}]})"));
  CHECK(response.ctx.ec == cbinit::errc::common::parsing_failure);
}

TEST_CASE("unit: sample bucket installation", "[unit]")
{
  sample_bucket_install_request request{};
  request.name = "beer-sample";

  cbinit::core::io::http_request encoded{};
  REQUIRE_SUCCESS(request.encode_to(encoded));
  CHECK(encoded.path == "/sampleBuckets/install");
  CHECK(encoded.body == R"(["beer-sample"])");

  auto response = request.make_response(
    {}, make_response(202, R"({"tasks":[{"taskId":"9e5a5d","sample":"beer-sample","bucket":"beer-sample"}]})"));
  REQUIRE_SUCCESS(response.ctx.ec);
  CHECK(response.task_id == "9e5a5d");

  response = request.make_response({}, make_response(202, R"({"tasks":[]})"));
  REQUIRE_SUCCESS(response.ctx.ec);
  CHECK(response.task_id.empty());

  response = request.make_response({}, make_response(202, R"({"tasks":[{"sample":"beer-sample"}]})"));
  REQUIRE_SUCCESS(response.ctx.ec);
  CHECK(response.task_id.empty());

  response = request.make_response({}, make_response(202, "[]"));
  REQUIRE_SUCCESS(response.ctx.ec);
  CHECK(response.task_id.empty());

  response = request.make_response({}, make_response(202, "{"));
  CHECK(response.ctx.ec == cbinit::errc::common::parsing_failure);

  response = request.make_response({}, make_response(400, R"(["Sample bucket beer-sample is already loaded."])"));
  CHECK(response.ctx.ec == cbinit::errc::management::bucket_exists);

  cluster_tasks_get_request tasks{};
  auto tasks_response = tasks.make_response(
    {},
    make_response(200,
                  R"([{"type":"rebalance","status":"notRunning"},)"
                  R"({"task_id":"9e5a5d","type":"loadingSampleBucket","status":"running","bucket":"beer-sample"}])"));
  REQUIRE_SUCCESS(tasks_response.ctx.ec);
  CHECK(tasks_response.tasks.size() == 2);
  CHECK(tasks_response.has_task("9e5a5d"));
  CHECK_FALSE(tasks_response.has_task("other"));
}

TEST_CASE("unit: node list", "[unit]")
{
  node_list_get_request request{};
  auto response = request.make_response(
    {},
    make_response(200,
                  R"({"nodes":[{"hostname":"node0.dev.internal:8091","otpNode":"ns_1@node0.dev.internal",)"
                  R"("status":"healthy","clusterMembership":"active","services":["index","kv","n1ql"],"thisNode":true}]})"));
  REQUIRE_SUCCESS(response.ctx.ec);
  REQUIRE(response.nodes.size() == 1);
  CHECK(response.nodes[0].hostname == "node0.dev.internal:8091");
  CHECK(response.nodes[0].otp_node == "ns_1@node0.dev.internal");
  CHECK(response.nodes[0].services == std::vector<std::string>{ "index", "kv", "n1ql" });
  CHECK(response.nodes[0].this_node);

  response = request.make_response({}, make_response(200, R"({"nodes":[{"status":"healthy"}]})"));
  CHECK(response.ctx.ec == cbinit::errc::common::parsing_failure);
}

TEST_CASE("unit: scopes and collections", "[unit]")
{
  scope_get_all_request request{};
  request.bucket_name = "default";
  auto response = request.make_response(
    {},
    make_response(200,
                  R"({"uid":"2","scopes":[{"name":"_default","uid":"0","collections":[{"name":"_default","uid":"0"}]},)"
                  R"({"name":"inventory","uid":"8","collections":[{"name":"airline","uid":"9"}]}]})"));
  REQUIRE_SUCCESS(response.ctx.ec);
  const auto* scope = response.manifest.find_scope("inventory");
  REQUIRE(scope != nullptr);
  CHECK(scope->has_collection("airline"));
  CHECK_FALSE(scope->has_collection("hotel"));
  CHECK(response.manifest.find_scope("tenant") == nullptr);

  scope_create_request create{};
  create.bucket_name = "default";
  create.scope_name = "tenant";
  cbinit::core::io::http_request encoded{};
  REQUIRE_SUCCESS(create.encode_to(encoded));
  CHECK(encoded.path == "/pools/default/buckets/default/scopes");
  CHECK(encoded.body == "name=tenant");

  collection_create_request collection{};
  collection.bucket_name = "default";
  collection.scope_name = "tenant";
  collection.collection_name = "users";
  REQUIRE_SUCCESS(collection.encode_to(encoded));
  CHECK(encoded.path == "/pools/default/buckets/default/scopes/tenant/collections");
  CHECK(encoded.body == "name=users");
}
