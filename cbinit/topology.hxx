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

#include <cbinit/bucket_settings.hxx>
#include <cbinit/cluster_settings.hxx>
#include <cbinit/service.hxx>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace cbinit
{
namespace endpoint_names
{
constexpr auto data{ "data" };
constexpr auto data_secure{ "datas" };
constexpr auto management{ "management" };
constexpr auto management_secure{ "managements" };
constexpr auto views{ "view" };
constexpr auto views_secure{ "views" };
constexpr auto query{ "query" };
constexpr auto query_secure{ "querys" };
constexpr auto fts{ "fts" };
constexpr auto fts_secure{ "ftss" };
constexpr auto analytics{ "analytic" };
constexpr auto analytics_secure{ "analytics" };
constexpr auto eventing{ "eventing" };
constexpr auto eventing_secure{ "eventings" };
constexpr auto eventing_debug{ "eventingdebug" };
constexpr auto backup{ "backup" };
constexpr auto backup_secure{ "backups" };
} // namespace endpoint_names

/**
 * @return service key of the alternate address API for the endpoint name, or empty optional if the
 * endpoint is not exposed as alternate address
 */
auto
alternate_address_service_key(const std::string& endpoint_name) -> std::optional<std::string>;

/**
 * Port the server listens on inside of the cluster network for the given endpoint name.
 */
auto
default_endpoint_port(const std::string& endpoint_name) -> std::optional<std::uint16_t>;

struct endpoint_address {
  std::string host{};
  std::uint16_t port{};
  bool tls{ false };
};

struct certificate_authority {
  /**
   * PEM encoded root certificate.
   */
  std::string certificate{};

  /**
   * PEM encoded intermediate certificates.
   */
  std::vector<std::string> chain{};
};

struct server_node {
  std::string name{};

  /**
   * Hostname of the node inside of the cluster network. Defaults to "{name}.dev.internal".
   */
  std::string hostname{};

  /**
   * Hostname used to reach the node from outside of the cluster network. Also advertised as
   * alternate address.
   */
  std::string external_hostname{ "localhost" };
  cbinit::service services{ default_services };

  /**
   * The node is preferred as primary (the node that initializes the cluster).
   */
  bool initial_node{ false };

  /**
   * Endpoint name to the externally reachable port.
   */
  std::map<std::string, std::uint16_t> endpoints{};

  /**
   * Name of the server group.
   */
  std::string group{};

  /**
   * @return external port of the endpoint, falls back to the default port of the endpoint
   */
  [[nodiscard]] auto endpoint_port(const std::string& endpoint_name) const
    -> std::optional<std::uint16_t>;

  [[nodiscard]] auto management_endpoint(bool secure) const -> endpoint_address;

  /**
   * Entry of this node in the node list of the cluster ("{hostname}:8091").
   */
  [[nodiscard]] auto cluster_node_address() const -> std::string;
};

struct server_group {
  std::string name{};
  cbinit::service services{ default_services };
  std::vector<server_node> servers{};
};

/**
 * Declarative description of the cluster: server groups with their nodes, buckets and the optional
 * certificate authority.
 */
class cluster_topology
{
public:
  using settings_provider_type = std::function<cluster_settings()>;

  cluster_topology() = default;
  cluster_topology(std::string name,
                   cluster_settings settings,
                   std::vector<server_group> groups,
                   std::vector<bucket_declaration> buckets = {},
                   std::optional<certificate_authority> authority = {});

  [[nodiscard]] auto name() const -> const std::string&;
  [[nodiscard]] auto groups() const -> const std::vector<server_group>&;
  [[nodiscard]] auto buckets() const -> const std::vector<bucket_declaration>&;
  [[nodiscard]] auto authority() const -> const std::optional<certificate_authority>&;
  [[nodiscard]] auto has_certificate_authority() const -> bool;

  /**
   * All servers of all groups in declaration order.
   */
  [[nodiscard]] auto servers() const -> std::vector<server_node>;
  [[nodiscard]] auto find_server(const std::string& name) const -> std::optional<server_node>;
  [[nodiscard]] auto find_bucket(const std::string& name) const
    -> std::optional<bucket_declaration>;

  /**
   * Selects the node that initializes the cluster. It is the node flagged as initial node if it
   * runs the data service, otherwise the first node with the data service.
   *
   * @return empty optional if no node runs the data service
   */
  [[nodiscard]] auto primary() const -> std::optional<server_node>;

  /**
   * Checks that the topology can be bootstrapped: unique resource names, non-empty groups, a node
   * with the data service and sane bucket declarations.
   */
  [[nodiscard]] auto validate() const -> std::error_code;

  /**
   * Connection string of the data service nodes. Uses "couchbases://" with the TLS data ports when
   * a certificate authority is configured.
   */
  [[nodiscard]] auto connection_string(const std::optional<std::string>& bucket_name = {}) const
    -> std::string;

  /**
   * The settings are resolved once the cluster is initialized, so the provider may depend on
   * information that is only available late (e.g. generated passwords).
   */
  void settings_provider(settings_provider_type provider);
  [[nodiscard]] auto settings() const -> cluster_settings;

  /**
   * Credentials are needed before initialization for every authenticated call.
   */
  [[nodiscard]] auto credentials() const -> cluster_credentials;

private:
  std::string name_{};
  cluster_settings settings_{};
  std::vector<server_group> groups_{};
  std::vector<bucket_declaration> buckets_{};
  std::optional<certificate_authority> authority_{};
  settings_provider_type settings_provider_{};
};
} // namespace cbinit
