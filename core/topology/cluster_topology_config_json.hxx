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

#include "cluster_topology_config.hxx"

#include <cbinit/service.hxx>

#include <tao/json/forward.hpp>

#include <fmt/core.h>

#include <stdexcept>

namespace cbinit::core::topology
{
template<typename Value, typename Parser>
auto
parse_enum(const Value& v, const char* key, Parser&& parser)
{
  const auto& name = v.get_string();
  auto result = parser(name);
  if (!result) {
    throw std::invalid_argument(fmt::format(R"(unexpected value "{}" for "{}")", name, key));
  }
  return result.value();
}

template<typename Value, typename Target>
void
read_optional(const Value& object, const char* key, std::optional<Target>& target)
{
  if (const auto* v = object.find(key); v != nullptr && !v->is_null()) {
    target = v->template as<Target>();
  }
}

template<typename Value, typename Target>
void
read(const Value& object, const char* key, Target& target)
{
  if (const auto* v = object.find(key); v != nullptr && !v->is_null()) {
    target = v->template as<Target>();
  }
}
} // namespace cbinit::core::topology

namespace tao::json
{
template<>
struct traits<cbinit::memory_quotas> {
  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v) -> cbinit::memory_quotas
  {
    using cbinit::core::topology::read;

    cbinit::memory_quotas result{};
    read(v, "data", result.data_mb);
    read(v, "query", result.query_mb);
    read(v, "index", result.index_mb);
    read(v, "search", result.search_mb);
    read(v, "analytics", result.analytics_mb);
    read(v, "eventing", result.eventing_mb);
    return result;
  }
};

template<>
struct traits<cbinit::server_node> {
  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v) -> cbinit::server_node
  {
    using cbinit::core::topology::read;

    cbinit::server_node result{};
    result.name = v.at("name").get_string();
    read(v, "hostname", result.hostname);
    read(v, "external_hostname", result.external_hostname);
    read(v, "initial_node", result.initial_node);
    if (const auto* endpoints = v.find("endpoints"); endpoints != nullptr) {
      for (const auto& [endpoint_name, port] : endpoints->get_object()) {
        if (!cbinit::default_endpoint_port(endpoint_name)) {
          throw std::invalid_argument(fmt::format(R"(unknown endpoint "{}" of server "{}")", endpoint_name, result.name));
        }
        result.endpoints[endpoint_name] = port.template as<std::uint16_t>();
      }
    }
    return result;
  }
};

template<>
struct traits<cbinit::server_group> {
  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v) -> cbinit::server_group
  {
    cbinit::server_group result{};
    result.name = v.at("name").get_string();
    if (const auto* services = v.find("services"); services != nullptr) {
      result.services = cbinit::service::none;
      for (const auto& entry : services->get_array()) {
        result.services |=
          cbinit::core::topology::parse_enum(entry, "services", cbinit::service_from_string);
      }
    }
    for (const auto& server : v.at("servers").get_array()) {
      result.servers.emplace_back(server.template as<cbinit::server_node>());
    }
    return result;
  }
};

template<>
struct traits<cbinit::bucket_declaration> {
  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v) -> cbinit::bucket_declaration
  {
    using cbinit::core::topology::parse_enum;
    using cbinit::core::topology::read;
    using cbinit::core::topology::read_optional;

    cbinit::bucket_declaration result{};
    result.name = v.at("name").get_string();
    if (const auto* sample = v.find("sample"); sample != nullptr && sample->get_boolean()) {
      result.kind = cbinit::bucket_kind::sample;
    }

    auto& settings = result.settings;
    if (const auto* type = v.find("type"); type != nullptr) {
      settings.bucket_type = parse_enum(*type, "type", cbinit::bucket_type_from_string);
    }
    read_optional(v, "ram_quota_mb", settings.ram_quota_mb);
    read_optional(v, "replicas", settings.num_replicas);
    read_optional(v, "flush_enabled", settings.flush_enabled);
    read_optional(v, "max_expiry", settings.max_expiry);
    if (const auto* backend = v.find("storage_backend"); backend != nullptr) {
      settings.storage_backend =
        parse_enum(*backend, "storage_backend", cbinit::bucket_storage_backend_from_string);
    }
    if (const auto* mode = v.find("compression_mode"); mode != nullptr) {
      settings.compression_mode =
        parse_enum(*mode, "compression_mode", cbinit::bucket_compression_from_string);
    }
    if (const auto* resolution = v.find("conflict_resolution"); resolution != nullptr) {
      settings.conflict_resolution_type =
        parse_enum(*resolution,
                   "conflict_resolution",
                   cbinit::bucket_conflict_resolution_from_string);
    }
    if (const auto* level = v.find("minimum_durability_level"); level != nullptr) {
      settings.minimum_durability_level =
        parse_enum(*level, "minimum_durability_level", cbinit::durability_level_from_string);
    }
    if (const auto* policy = v.find("eviction_policy"); policy != nullptr) {
      settings.eviction_policy =
        parse_enum(*policy, "eviction_policy", cbinit::bucket_eviction_policy_from_string);
    }

    if (const auto* scopes = v.find("scopes"); scopes != nullptr) {
      for (const auto& [scope_name, collections] : scopes->get_object()) {
        auto& names = result.scopes[scope_name];
        for (const auto& collection : collections.get_array()) {
          names.emplace_back(collection.get_string());
        }
      }
    }
    return result;
  }
};

template<>
struct traits<cbinit::core::topology::cluster_topology_config> {
  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v)
    -> cbinit::core::topology::cluster_topology_config
  {
    using cbinit::core::topology::parse_enum;
    using cbinit::core::topology::read;

    cbinit::core::topology::cluster_topology_config result{};
    result.name = v.at("name").get_string();

    auto& settings = result.settings;
    read(v, "username", settings.credentials.username);
    read(v, "password", settings.credentials.password);
    read(v, "cluster_name", settings.cluster_name);
    if (settings.cluster_name.empty()) {
      settings.cluster_name = result.name;
    }
    if (const auto* edition = v.find("edition"); edition != nullptr) {
      settings.edition = parse_enum(*edition, "edition", cbinit::edition_from_string);
    }
    if (const auto* quotas = v.find("memory_quotas"); quotas != nullptr) {
      settings.quotas = quotas->template as<cbinit::memory_quotas>();
    }
    if (const auto* mode = v.find("index_storage_mode"); mode != nullptr) {
      settings.index_storage_mode =
        parse_enum(*mode, "index_storage_mode", cbinit::index_storage_mode_from_string);
    }

    if (const auto* authority = v.find("certificate_authority"); authority != nullptr) {
      cbinit::core::topology::cluster_topology_config::certificate_authority_files files{};
      files.certificate = authority->at("certificate").get_string();
      if (const auto* chain = authority->find("chain"); chain != nullptr) {
        for (const auto& path : chain->get_array()) {
          files.chain.emplace_back(path.get_string());
        }
      }
      result.certificate_authority = std::move(files);
    }

    for (const auto& group : v.at("server_groups").get_array()) {
      result.groups.emplace_back(group.template as<cbinit::server_group>());
    }
    if (const auto* buckets = v.find("buckets"); buckets != nullptr) {
      for (const auto& bucket : buckets->get_array()) {
        result.buckets.emplace_back(bucket.template as<cbinit::bucket_declaration>());
      }
    }
    return result;
  }
};
} // namespace tao::json
