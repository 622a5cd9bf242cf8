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

#include <cbinit/error_codes.hxx>
#include <cbinit/topology.hxx>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <set>
#include <utility>

namespace cbinit
{
namespace
{
struct endpoint_info {
  const char* name;
  std::uint16_t default_port;
  const char* service_key;
};

constexpr std::array<endpoint_info, 17> known_endpoints{ {
  { endpoint_names::management, 8091, "mgmt" },
  { endpoint_names::management_secure, 18091, "mgmtSSL" },
  { endpoint_names::data, 11210, "kv" },
  { endpoint_names::data_secure, 11207, "kvSSL" },
  { endpoint_names::views, 8092, "capi" },
  { endpoint_names::views_secure, 18092, "capiSSL" },
  { endpoint_names::query, 8093, "n1ql" },
  { endpoint_names::query_secure, 18093, "n1qlSSL" },
  { endpoint_names::fts, 8094, "fts" },
  { endpoint_names::fts_secure, 18094, "ftsSSL" },
  { endpoint_names::analytics, 8095, "cbas" },
  { endpoint_names::analytics_secure, 18095, "cbasSSL" },
  { endpoint_names::eventing, 8096, "eventingAdminPort" },
  { endpoint_names::eventing_secure, 18096, "eventingSSL" },
  { endpoint_names::eventing_debug, 9140, "eventingDebug" },
  { endpoint_names::backup, 8097, "backupAPI" },
  { endpoint_names::backup_secure, 18097, "backupAPIHTTPS" },
} };

auto
find_endpoint(const std::string& name) -> const endpoint_info*
{
  for (const auto& info : known_endpoints) {
    if (name == info.name) {
      return &info;
    }
  }
  return nullptr;
}
} // namespace

auto
alternate_address_service_key(const std::string& endpoint_name) -> std::optional<std::string>
{
  if (const auto* info = find_endpoint(endpoint_name); info != nullptr) {
    return info->service_key;
  }
  return {};
}

auto
default_endpoint_port(const std::string& endpoint_name) -> std::optional<std::uint16_t>
{
  if (const auto* info = find_endpoint(endpoint_name); info != nullptr) {
    return info->default_port;
  }
  return {};
}

auto
server_node::endpoint_port(const std::string& endpoint_name) const -> std::optional<std::uint16_t>
{
  if (auto it = endpoints.find(endpoint_name); it != endpoints.end()) {
    return it->second;
  }
  return default_endpoint_port(endpoint_name);
}

auto
server_node::management_endpoint(bool secure) const -> endpoint_address
{
  const std::string endpoint_name =
    secure ? endpoint_names::management_secure : endpoint_names::management;
  return { external_hostname, endpoint_port(endpoint_name).value_or(0), secure };
}

auto
server_node::cluster_node_address() const -> std::string
{
  return fmt::format("{}:{}", hostname, default_endpoint_port(endpoint_names::management).value());
}

cluster_topology::cluster_topology(std::string name,
                                   cluster_settings settings,
                                   std::vector<server_group> groups,
                                   std::vector<bucket_declaration> buckets,
                                   std::optional<certificate_authority> authority)
  : name_{ std::move(name) }
  , settings_{ std::move(settings) }
  , groups_{ std::move(groups) }
  , buckets_{ std::move(buckets) }
  , authority_{ std::move(authority) }
{
  for (auto& group : groups_) {
    for (auto& server : group.servers) {
      server.services = group.services;
      server.group = group.name;
      if (server.hostname.empty()) {
        server.hostname = fmt::format("{}.dev.internal", server.name);
      }
    }
  }
}

auto
cluster_topology::name() const -> const std::string&
{
  return name_;
}

auto
cluster_topology::groups() const -> const std::vector<server_group>&
{
  return groups_;
}

auto
cluster_topology::buckets() const -> const std::vector<bucket_declaration>&
{
  return buckets_;
}

auto
cluster_topology::authority() const -> const std::optional<certificate_authority>&
{
  return authority_;
}

auto
cluster_topology::has_certificate_authority() const -> bool
{
  return authority_.has_value();
}

auto
cluster_topology::servers() const -> std::vector<server_node>
{
  std::vector<server_node> result{};
  for (const auto& group : groups_) {
    result.insert(result.end(), group.servers.begin(), group.servers.end());
  }
  return result;
}

auto
cluster_topology::find_server(const std::string& name) const -> std::optional<server_node>
{
  for (const auto& group : groups_) {
    for (const auto& server : group.servers) {
      if (server.name == name) {
        return server;
      }
    }
  }
  return {};
}

auto
cluster_topology::find_bucket(const std::string& name) const -> std::optional<bucket_declaration>
{
  for (const auto& bucket : buckets_) {
    if (bucket.name == name) {
      return bucket;
    }
  }
  return {};
}

auto
cluster_topology::primary() const -> std::optional<server_node>
{
  std::optional<server_node> first_data_node{};
  for (const auto& group : groups_) {
    for (const auto& server : group.servers) {
      if (!has_service(server.services, service::data)) {
        continue;
      }
      if (server.initial_node) {
        return server;
      }
      if (!first_data_node) {
        first_data_node = server;
      }
    }
  }
  return first_data_node;
}

auto
cluster_topology::validate() const -> std::error_code
{
  if (name_.empty() || groups_.empty()) {
    return errc::orchestration::invalid_topology;
  }
  std::set<std::string> names{ name_ };
  for (const auto& group : groups_) {
    if (group.servers.empty() || group.services == service::none ||
        !names.insert(group.name).second) {
      return errc::orchestration::invalid_topology;
    }
    for (const auto& server : group.servers) {
      if (server.name.empty() || !names.insert(server.name).second) {
        return errc::orchestration::invalid_topology;
      }
    }
  }
  for (const auto& bucket : buckets_) {
    if (bucket.name.empty() || !names.insert(bucket.name).second) {
      return errc::orchestration::invalid_topology;
    }
    if (bucket.settings.ram_quota_mb && bucket.settings.ram_quota_mb.value() == 0) {
      return errc::orchestration::invalid_settings;
    }
  }
  if (!primary()) {
    return errc::orchestration::no_data_service_node;
  }
  return {};
}

auto
cluster_topology::connection_string(const std::optional<std::string>& bucket_name) const
  -> std::string
{
  const bool tls = has_certificate_authority();
  std::vector<std::string> hosts{};
  for (const auto& group : groups_) {
    if (!has_service(group.services, service::data)) {
      continue;
    }
    for (const auto& server : group.servers) {
      auto port = server.endpoint_port(tls ? endpoint_names::data_secure : endpoint_names::data);
      hosts.emplace_back(fmt::format("{}:{}", server.external_hostname, port.value_or(0)));
    }
  }
  auto result =
    fmt::format("{}://{}", tls ? "couchbases" : "couchbase", fmt::join(hosts, ","));
  if (bucket_name) {
    result += fmt::format("/{}", bucket_name.value());
  }
  return result;
}

void
cluster_topology::settings_provider(settings_provider_type provider)
{
  settings_provider_ = std::move(provider);
}

auto
cluster_topology::settings() const -> cluster_settings
{
  if (settings_provider_) {
    return settings_provider_();
  }
  return settings_;
}

auto
cluster_topology::credentials() const -> cluster_credentials
{
  return settings().credentials;
}
} // namespace cbinit
