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

namespace cbinit
{
enum class edition { enterprise, community };

enum class index_storage_mode {
  /**
   * Standard global secondary indexes. Enterprise edition only.
   */
  plasma,

  /**
   * Legacy storage engine, the only choice of community edition.
   */
  forestdb,

  /**
   * Memory optimized global secondary indexes.
   */
  memory_optimized,
};

/**
 * Per-node memory quotas of the services in megabytes.
 */
struct memory_quotas {
  std::uint32_t data_mb{ 1024 };
  std::uint32_t query_mb{ 1024 };
  std::uint32_t index_mb{ 1024 };
  std::uint32_t search_mb{ 1024 };
  std::uint32_t analytics_mb{ 1024 };
  std::uint32_t eventing_mb{ 1024 };
};

struct cluster_credentials {
  std::string username{ "Administrator" };
  std::string password{};
};

struct cluster_settings {
  cbinit::edition edition{ edition::enterprise };
  std::string cluster_name{};
  cluster_credentials credentials{};
  memory_quotas quotas{};

  /**
   * When not set, derived from the edition.
   */
  std::optional<cbinit::index_storage_mode> index_storage_mode{};

  /**
   * Management port directive sent with cluster initialization. "SAME" keeps the port the node
   * listens on.
   */
  std::string management_port{ "SAME" };

  [[nodiscard]] auto effective_index_storage_mode() const -> cbinit::index_storage_mode;
};

auto
to_string(edition value) -> std::string_view;

auto
edition_from_string(std::string_view value) -> std::optional<edition>;

/**
 * @return the identifier used by the management API ("plasma", "forestdb", "memory_optimized")
 */
auto
to_string(index_storage_mode value) -> std::string_view;

auto
index_storage_mode_from_string(std::string_view value) -> std::optional<index_storage_mode>;
} // namespace cbinit
