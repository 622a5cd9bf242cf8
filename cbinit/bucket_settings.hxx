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
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbinit
{
enum class bucket_type { couchbase, memcached, ephemeral };
enum class bucket_compression { off, passive, active };
enum class bucket_storage_backend { couchstore, magma };

enum class bucket_eviction_policy {
  /**
   * Only the value is ejected, key and metadata remain in memory.
   *
   * Only valid for buckets of type couchbase.
   */
  value_only,

  /**
   * Key, metadata and value are ejected.
   *
   * Only valid for buckets of type couchbase.
   */
  full,

  /**
   * Data is kept until deleted, new data is rejected once the quota is reached.
   *
   * Only valid for buckets of type ephemeral.
   */
  no_eviction,

  /**
   * Data that has not been used recently is ejected once the quota is reached.
   *
   * Only valid for buckets of type ephemeral.
   */
  not_recently_used,
};

enum class bucket_conflict_resolution { sequence_number, timestamp, custom };

enum class durability_level {
  none,
  majority,
  majority_and_persist_to_active,
  persist_to_majority,
};

/**
 * Declared settings of a bucket. Unset optional fields are not sent to the cluster, so the server
 * defaults apply.
 */
struct bucket_settings {
  cbinit::bucket_type bucket_type{ bucket_type::couchbase };
  std::optional<std::uint32_t> ram_quota_mb{};
  std::optional<std::uint32_t> num_replicas{};
  std::optional<bool> flush_enabled{};
  std::optional<bucket_storage_backend> storage_backend{};
  std::optional<bucket_compression> compression_mode{};
  std::optional<bucket_conflict_resolution> conflict_resolution_type{};
  std::optional<durability_level> minimum_durability_level{};
  std::optional<bucket_eviction_policy> eviction_policy{};
  std::optional<std::uint32_t> max_expiry{};

  static constexpr std::uint32_t default_ram_quota_mb{ 100 };

  [[nodiscard]] auto effective_ram_quota_mb() const -> std::uint32_t
  {
    return ram_quota_mb.value_or(default_ram_quota_mb);
  }
};

enum class bucket_kind {
  /// created from the declared settings
  standard,

  /// installed from the sample data shipped with the server (e.g. "travel-sample")
  sample,
};

struct bucket_declaration {
  std::string name{};
  bucket_kind kind{ bucket_kind::standard };
  bucket_settings settings{};

  /**
   * Scope name to the names of its collections.
   */
  std::map<std::string, std::vector<std::string>> scopes{};
};

/*
 * Identifiers of the management API.
 */
auto
to_string(bucket_type value) -> std::string_view;

auto
to_string(bucket_compression value) -> std::string_view;

auto
to_string(bucket_storage_backend value) -> std::string_view;

auto
to_string(bucket_eviction_policy value) -> std::string_view;

auto
to_string(bucket_conflict_resolution value) -> std::string_view;

auto
to_string(durability_level value) -> std::string_view;

auto
bucket_type_from_string(std::string_view value) -> std::optional<bucket_type>;

auto
bucket_compression_from_string(std::string_view value) -> std::optional<bucket_compression>;

auto
bucket_storage_backend_from_string(std::string_view value) -> std::optional<bucket_storage_backend>;

auto
bucket_eviction_policy_from_string(std::string_view value) -> std::optional<bucket_eviction_policy>;

auto
bucket_conflict_resolution_from_string(std::string_view value)
  -> std::optional<bucket_conflict_resolution>;

auto
durability_level_from_string(std::string_view value) -> std::optional<durability_level>;
} // namespace cbinit
