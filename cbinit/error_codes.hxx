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

#pragma once

#include <system_error>

namespace cbinit
{
namespace core::impl
{
const std::error_category&
common_category() noexcept;

const std::error_category&
management_category() noexcept;

const std::error_category&
network_category() noexcept;

const std::error_category&
orchestration_category() noexcept;
} // namespace core::impl

namespace errc
{
/**
 * Common errors for all components.
 */
enum class common {
  /**
   * The request or task was cancelled before it could be completed.
   *
   * Cancellation is never reported as a failure of a resource.
   */
  request_canceled = 2,

  /**
   * It is unambiguously determined that the error was caused because of invalid arguments.
   */
  invalid_argument = 3,

  /**
   * The management endpoint reported an internal failure (HTTP 5xx) and the retry budget has
   * been exhausted.
   */
  internal_server_failure = 5,

  /**
   * The management endpoint rejected the credentials (HTTP 401 or 403).
   */
  authentication_failure = 6,

  /**
   * The management endpoint asked to retry later (HTTP 408) and the retry budget has been
   * exhausted.
   */
  temporary_failure = 7,

  /**
   * The response body could not be decoded.
   */
  parsing_failure = 8,

  /// The bucket does not exist
  bucket_not_found = 10,

  /// The scope does not exist
  scope_not_found = 16,

  /**
   * The request did not complete in time and it is safe to assume that it had no effect.
   */
  unambiguous_timeout = 14,

  /**
   * The request did not complete in time and it might have been applied by the server.
   */
  ambiguous_timeout = 13,

  /// HTTP 429 after the retry budget has been exhausted
  rate_limited = 21,
};

/**
 * Errors related to the management REST API (ns_server)
 */
enum class management {
  /// Raised when creating a collection that already exists
  collection_exists = 601,

  /// Raised when creating a scope that already exists
  scope_exists = 602,

  /// Raised when creating a bucket that already exists
  bucket_exists = 605,

  /// Raised when flushing a bucket that has flush disabled
  bucket_not_flushable = 607,

  /**
   * The management endpoint responded with a status code that was not expected by the operation.
   *
   * The error context carries the status code and response body.
   */
  request_failed = 620,
};

/**
 * Errors of the HTTP transport.
 */
enum class network {
  /// Unable to resolve node address
  resolve_failure = 1001,

  /// No hosts left to connect
  no_endpoints_left = 1002,

  /// Failed to complete protocol handshake
  handshake_failure = 1003,

  /// Unexpected protocol state or input
  protocol_error = 1004,

  /// The connection was closed before the response was complete
  end_of_stream = 1005,
};

/**
 * Errors of the bootstrap sequence that are detected before or between management calls.
 */
enum class orchestration {
  /// The topology does not contain any server with the data service
  no_data_service_node = 1101,

  /// The topology is not valid (duplicate names, empty groups, unknown resources)
  invalid_topology = 1102,

  /// The cluster settings are not valid
  invalid_settings = 1103,

  /// The certificate authority could not be loaded
  certificate_unavailable = 1104,

  /// The resource is not declared in the topology
  resource_not_found = 1105,

  /// The resource command is not supported for this kind of resource
  unsupported_command = 1106,

  /// The server was stopped while the orchestrator was waiting for it
  server_not_initialized = 1107,

  /// The cluster or one of its buckets has exited with non-zero exit code
  bootstrap_failed = 1108,
};

inline auto
make_error_code(common e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::common_category() };
}

inline auto
make_error_code(management e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::management_category() };
}

inline auto
make_error_code(network e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::network_category() };
}

inline auto
make_error_code(orchestration e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::orchestration_category() };
}
} // namespace errc
} // namespace cbinit

template<>
struct std::is_error_code_enum<cbinit::errc::common> : std::true_type {
};

template<>
struct std::is_error_code_enum<cbinit::errc::management> : std::true_type {
};

template<>
struct std::is_error_code_enum<cbinit::errc::network> : std::true_type {
};

template<>
struct std::is_error_code_enum<cbinit::errc::orchestration> : std::true_type {
};
