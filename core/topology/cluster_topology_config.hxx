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
#include <cbinit/error.hxx>
#include <cbinit/topology.hxx>

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbinit::core::topology
{
/**
 * Topology as written in the configuration file. The certificate authority is referenced by the
 * paths of PEM files.
 */
struct cluster_topology_config {
  struct certificate_authority_files {
    std::string certificate{};
    std::vector<std::string> chain{};
  };

  std::string name{};
  cluster_settings settings{};
  std::vector<server_group> groups{};
  std::vector<bucket_declaration> buckets{};
  std::optional<certificate_authority_files> certificate_authority{};
};

/**
 * Decodes and validates the topology document. PEM files of the certificate authority are
 * resolved relative to the current directory.
 */
auto
parse_cluster_topology(std::string_view document) -> tl::expected<cluster_topology, cbinit::error>;

auto
load_cluster_topology(const std::string& path) -> tl::expected<cluster_topology, cbinit::error>;

/**
 * Turns the decoded configuration into topology: loads the certificate authority and runs the
 * validation of the topology.
 */
auto
make_cluster_topology(cluster_topology_config config)
  -> tl::expected<cluster_topology, cbinit::error>;
} // namespace cbinit::core::topology
