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

#include "cluster_topology_config.hxx"

#include "cluster_topology_config_json.hxx"

#include "core/logger/logger.hxx"
#include "core/orchestration/certificate_provider.hxx"
#include "core/utils/json.hxx"

#include <cbinit/error_codes.hxx>
#include <cbinit/fmt/error.hxx>

#include <tao/json.hpp>

#include <fmt/format.h>

#include <utility>

namespace cbinit::core::topology
{
auto
make_cluster_topology(cluster_topology_config config)
  -> tl::expected<cluster_topology, cbinit::error>
{
  std::optional<certificate_authority> authority{};
  if (config.certificate_authority) {
    auto loaded = orchestration::load_certificate_authority(
      config.certificate_authority->certificate, config.certificate_authority->chain);
    if (!loaded) {
      return tl::unexpected(loaded.error());
    }
    authority = std::move(loaded.value());
  }

  cluster_topology topology{ std::move(config.name),
                             std::move(config.settings),
                             std::move(config.groups),
                             std::move(config.buckets),
                             std::move(authority) };
  if (auto ec = topology.validate(); ec) {
    return tl::unexpected(cbinit::error{ ec, fmt::format(R"(topology "{}" is not valid)", topology.name()) });
  }
  return topology;
}

auto
parse_cluster_topology(std::string_view document) -> tl::expected<cluster_topology, cbinit::error>
{
  cluster_topology_config config{};
  try {
    config = utils::json::parse(document).as<cluster_topology_config>();
  } catch (const tao::pegtl::parse_error& e) {
    return tl::unexpected(cbinit::error{ errc::common::parsing_failure, e.what() });
  } catch (const std::logic_error& e) {
    return tl::unexpected(cbinit::error{ errc::orchestration::invalid_topology, e.what() });
  }
  return make_cluster_topology(std::move(config));
}

auto
load_cluster_topology(const std::string& path) -> tl::expected<cluster_topology, cbinit::error>
{
  CBINIT_LOG_DEBUG(R"(loading topology from "{}")", path);
  cluster_topology_config config{};
  try {
    config = utils::json::parse_file(path).as<cluster_topology_config>();
  } catch (const tao::pegtl::parse_error& e) {
    return tl::unexpected(cbinit::error{ errc::common::parsing_failure, e.what() });
  } catch (const std::logic_error& e) {
    return tl::unexpected(cbinit::error{ errc::orchestration::invalid_topology, e.what() });
  } catch (const std::system_error& e) {
    return tl::unexpected(
      cbinit::error{ e.code(), fmt::format(R"(unable to read topology "{}": {})", path, e.what()) });
  }
  return make_cluster_topology(std::move(config));
}
} // namespace cbinit::core::topology
