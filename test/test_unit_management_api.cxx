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
#include "core/operations/management/pool_get.hxx"

#include <cbinit/error_codes.hxx>

#include <asio/error.hpp>

#include <future>

using namespace std::chrono_literals;
using test::utils::fake_response;

namespace
{
struct raw_result {
  cbinit::core::error_context::http ctx{};
  cbinit::core::io::http_response response{};
};

class api_harness
{
public:
  explicit api_harness(cbinit::core::management_api_options options, bool secure = false)
  {
    test::utils::init_logger();
    transport = std::make_shared<test::utils::fake_transport>(io.ctx());
    api = std::make_shared<cbinit::core::management_api>(
      io.ctx(),
      transport,
      []() {
        return cbinit::cluster_credentials{ "Administrator", "password" };
      },
      secure,
      options);
    node.name = "node0";
    node.hostname = "node0.dev.internal";
  }

  auto send(cbinit::core::request_options options = {},
            const std::shared_ptr<cbinit::core::cancellation_token>& token = nullptr) -> raw_result
  {
    cbinit::core::io::http_request request{};
    request.method = "GET";
    request.path = "/pools/default";
    auto barrier = std::make_shared<std::promise<raw_result>>();
    auto future = barrier->get_future();
    api->send_request(node,
                      request,
                      options,
                      token,
                      [barrier](cbinit::core::error_context::http ctx,
                                cbinit::core::io::http_response response) {
                        barrier->set_value({ std::move(ctx), std::move(response) });
                      });
    REQUIRE(future.wait_for(10s) == std::future_status::ready);
    return future.get();
  }

  test::utils::io_context_runner io{};
  std::shared_ptr<test::utils::fake_transport> transport{};
  std::shared_ptr<cbinit::core::management_api> api{};
  cbinit::server_node node{};
};

auto
fast_retries(std::size_t max_attempts = 60) -> cbinit::core::management_api_options
{
  cbinit::core::management_api_options options{};
  options.retry.max_attempts = max_attempts;
  options.retry.backoff = 1ms;
  return options;
}
} // namespace

TEST_CASE("unit: default retry policy gives the node a minute", "[unit]")
{
  const cbinit::core::retry_policy policy{};
  CHECK(policy.max_attempts == 60);
  CHECK(policy.backoff == 1s);

  CHECK(cbinit::core::is_retriable_status(500));
  CHECK(cbinit::core::is_retriable_status(503));
  CHECK(cbinit::core::is_retriable_status(408));
  CHECK(cbinit::core::is_retriable_status(429));
  CHECK_FALSE(cbinit::core::is_retriable_status(200));
  CHECK_FALSE(cbinit::core::is_retriable_status(400));
  CHECK_FALSE(cbinit::core::is_retriable_status(404));

  CHECK(cbinit::core::is_retriable_transport_error(asio::error::connection_refused));
  CHECK(cbinit::core::is_retriable_transport_error(asio::error::host_not_found));
  CHECK(cbinit::core::is_retriable_transport_error(cbinit::errc::network::resolve_failure));
  CHECK(cbinit::core::is_retriable_transport_error(cbinit::errc::common::unambiguous_timeout));
  CHECK_FALSE(cbinit::core::is_retriable_transport_error({}));
  CHECK_FALSE(cbinit::core::is_retriable_transport_error(cbinit::errc::common::parsing_failure));
}

TEST_CASE("unit: internal server failure is retried until the budget is exhausted", "[unit]")
{
  api_harness harness{ fast_retries() };
  harness.transport->route("GET", "/pools/default", { fake_response::with_status(503, "busy") });

  auto result = harness.send();
  CHECK(result.ctx.ec == cbinit::errc::common::internal_server_failure);
  CHECK(result.ctx.attempts == 60);
  CHECK(result.ctx.http_status == 503);
  CHECK(result.ctx.http_body == "busy");
  CHECK(harness.transport->count("GET", "/pools/default") == 60);
}

TEST_CASE("unit: request succeeds once the node recovers", "[unit]")
{
  api_harness harness{ fast_retries() };
  harness.transport->route("GET",
                           "/pools/default",
                           {
                             fake_response::failure(asio::error::connection_refused),
                             fake_response::with_status(500),
                             fake_response::with_status(429),
                             fake_response::ok(R"({"name":"default"})"),
                           });

  auto result = harness.send();
  REQUIRE_SUCCESS(result.ctx.ec);
  CHECK(result.response.status_code == 200);
  CHECK(result.ctx.attempts == 4);
}

TEST_CASE("unit: exhausted retries keep the reason", "[unit]")
{
  api_harness harness{ fast_retries(3) };

  SECTION("request timeout")
  {
    harness.transport->route("GET", "/pools/default", { fake_response::with_status(408) });
    CHECK(harness.send().ctx.ec == cbinit::errc::common::temporary_failure);
  }

  SECTION("too many requests")
  {
    harness.transport->route("GET", "/pools/default", { fake_response::with_status(429) });
    CHECK(harness.send().ctx.ec == cbinit::errc::common::rate_limited);
  }

  SECTION("connection failure")
  {
    harness.transport->route(
      "GET", "/pools/default", { fake_response::failure(cbinit::errc::network::resolve_failure) });
    auto result = harness.send();
    CHECK(result.ctx.ec == cbinit::errc::network::resolve_failure);
    CHECK(result.ctx.attempts == 3);
  }

  CHECK(harness.transport->count("GET", "/pools/default") == 3);
}

TEST_CASE("unit: client errors are not retried", "[unit]")
{
  api_harness harness{ fast_retries() };
  harness.transport->route("GET", "/pools/default", { fake_response::with_status(400) });

  auto result = harness.send();
  REQUIRE_SUCCESS(result.ctx.ec);
  CHECK(result.response.status_code == 400);
  CHECK(harness.transport->count("GET", "/pools/default") == 1);
}

TEST_CASE("unit: retries can be disabled per request", "[unit]")
{
  api_harness harness{ fast_retries() };
  harness.transport->route("GET", "/pools/default", { fake_response::with_status(503) });

  cbinit::core::request_options options{};
  options.auto_retry = false;
  auto result = harness.send(options);
  CHECK(result.ctx.ec == cbinit::errc::common::internal_server_failure);
  CHECK(harness.transport->count("GET", "/pools/default") == 1);
}

TEST_CASE("unit: cancellation interrupts request in flight", "[unit]")
{
  api_harness harness{ fast_retries() };
  harness.transport->route("GET", "/pools/default", { fake_response::never() });

  auto token = cbinit::core::cancellation_token::create();
  std::thread canceller([&harness, token]() {
    if (test::utils::wait_until([&harness]() {
          return harness.transport->count("GET", "/pools/default") == 1;
        })) {
      token->cancel();
    }
  });
  auto result = harness.send({}, token);
  canceller.join();
  CHECK(result.ctx.ec == cbinit::errc::common::request_canceled);
}

TEST_CASE("unit: cancellation interrupts backoff", "[unit]")
{
  cbinit::core::management_api_options options{};
  options.retry.backoff = 1h;
  api_harness harness{ options };
  harness.transport->route("GET", "/pools/default", { fake_response::with_status(503) });

  auto token = cbinit::core::cancellation_token::create();
  std::thread canceller([&harness, token]() {
    if (test::utils::wait_until([&harness]() {
          return harness.transport->count("GET", "/pools/default") == 1;
        })) {
      token->cancel();
    }
  });
  auto result = harness.send({}, token);
  canceller.join();
  CHECK(result.ctx.ec == cbinit::errc::common::request_canceled);
  CHECK(harness.transport->count("GET", "/pools/default") == 1);
}

TEST_CASE("unit: requests carry basic authorization", "[unit]")
{
  api_harness harness{ fast_retries() };
  harness.transport->route("GET", "/pools/default", { fake_response::ok() });

  harness.send();
  cbinit::core::request_options anonymous{};
  anonymous.authenticated = false;
  harness.send(anonymous);

  auto requests = harness.transport->requests();
  REQUIRE(requests.size() == 2);
  CHECK(requests[0].request.headers["authorization"] == "Basic QWRtaW5pc3RyYXRvcjpwYXNzd29yZA==");
  CHECK(requests[1].request.headers.count("authorization") == 0);
  CHECK(requests[0].request.timeout == std::chrono::seconds{ 75 });
}

TEST_CASE("unit: management endpoint of the node", "[unit]")
{
  cbinit::server_node node{};
  node.name = "node1";
  node.external_hostname = "127.0.0.1";
  node.endpoints[cbinit::endpoint_names::management] = 9001;

  api_harness plain{ fast_retries() };
  auto endpoint = plain.api->endpoint_for(node, false);
  CHECK(endpoint.host == "127.0.0.1");
  CHECK(endpoint.port == 9001);
  CHECK_FALSE(endpoint.tls);

  api_harness secure{ fast_retries(), true };
  endpoint = secure.api->endpoint_for(node, false);
  CHECK(endpoint.port == 18091);
  CHECK(endpoint.tls);

  endpoint = secure.api->endpoint_for(node, true);
  CHECK(endpoint.port == 9001);
  CHECK_FALSE(endpoint.tls);
}

TEST_CASE("unit: typed request is decoded", "[unit]")
{
  api_harness harness{ fast_retries() };
  harness.transport->route("GET", "/pools/default", { fake_response::with_status(404) });

  auto barrier = std::make_shared<
    std::promise<cbinit::core::operations::management::pool_get_response>>();
  auto future = barrier->get_future();
  harness.api->execute(harness.node,
                       cbinit::core::operations::management::pool_get_request{},
                       nullptr,
                       [barrier](cbinit::core::operations::management::pool_get_response&& resp) {
                         barrier->set_value(std::move(resp));
                       });
  REQUIRE(future.wait_for(10s) == std::future_status::ready);
  auto response = future.get();
  REQUIRE_SUCCESS(response.ctx.ec);
  CHECK_FALSE(response.initialized);
  CHECK(response.ctx.path == "/pools/default");
  CHECK(response.ctx.attempts == 1);
}
