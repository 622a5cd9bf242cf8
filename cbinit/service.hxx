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

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbinit
{
/**
 * Services that can be enabled on a cluster node. Values are bit flags and can be combined.
 */
enum class service : std::uint32_t {
  none = 0,
  data = 1U << 0U,
  query = 1U << 1U,
  index = 1U << 2U,
  search = 1U << 3U,
  analytics = 1U << 4U,
  eventing = 1U << 5U,
  backup = 1U << 6U,
};

constexpr auto
operator|(service lhs, service rhs) -> service
{
  return static_cast<service>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
}

constexpr auto
operator&(service lhs, service rhs) -> service
{
  return static_cast<service>(static_cast<std::uint32_t>(lhs) & static_cast<std::uint32_t>(rhs));
}

constexpr auto
operator|=(service& lhs, service rhs) -> service&
{
  lhs = lhs | rhs;
  return lhs;
}

constexpr auto
has_service(service services, service flag) -> bool
{
  return (services & flag) == flag && flag != service::none;
}

/**
 * Services of a server group when none were configured explicitly.
 */
constexpr service default_services{ service::data | service::query | service::index };

/**
 * Every single service flag in the order used by the management API.
 */
constexpr service all_services[]{
  service::data,      service::query,    service::index,  service::search,
  service::analytics, service::eventing, service::backup,
};

/**
 * Builds the comma separated list of service identifiers understood by the management API
 * (for example "kv,n1ql,index").
 */
auto
to_management_services(service services) -> std::string;

/**
 * @return name of the single service flag as used in configuration files ("data", "query", ...)
 */
auto
to_string(service flag) -> std::string_view;

/**
 * Parses service name as used in configuration files.
 */
auto
service_from_string(std::string_view name) -> std::optional<service>;

/**
 * @return list of configuration names of every flag set in @p services
 */
auto
service_names(service services) -> std::vector<std::string>;
} // namespace cbinit
