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

#include <cbinit/bucket_settings.hxx>

#include <array>
#include <utility>

namespace cbinit
{
namespace
{
template<typename Enum, std::size_t N>
auto
lookup(const std::array<std::pair<Enum, std::string_view>, N>& table, Enum value)
  -> std::string_view
{
  for (const auto& [key, name] : table) {
    if (key == value) {
      return name;
    }
  }
  return "unknown";
}

template<typename Enum, std::size_t N>
auto
reverse_lookup(const std::array<std::pair<Enum, std::string_view>, N>& table,
               std::string_view name) -> std::optional<Enum>
{
  for (const auto& [key, value] : table) {
    if (value == name) {
      return key;
    }
  }
  return {};
}

constexpr std::array<std::pair<bucket_type, std::string_view>, 3> bucket_types{ {
  { bucket_type::couchbase, "couchbase" },
  { bucket_type::memcached, "memcached" },
  { bucket_type::ephemeral, "ephemeral" },
} };

constexpr std::array<std::pair<bucket_compression, std::string_view>, 3> compression_modes{ {
  { bucket_compression::off, "off" },
  { bucket_compression::passive, "passive" },
  { bucket_compression::active, "active" },
} };

constexpr std::array<std::pair<bucket_storage_backend, std::string_view>, 2> storage_backends{ {
  { bucket_storage_backend::couchstore, "couchstore" },
  { bucket_storage_backend::magma, "magma" },
} };

constexpr std::array<std::pair<bucket_eviction_policy, std::string_view>, 4> eviction_policies{ {
  { bucket_eviction_policy::value_only, "valueOnly" },
  { bucket_eviction_policy::full, "fullEviction" },
  { bucket_eviction_policy::no_eviction, "noEviction" },
  { bucket_eviction_policy::not_recently_used, "nruEviction" },
} };

constexpr std::array<std::pair<bucket_conflict_resolution, std::string_view>, 3>
  conflict_resolutions{ {
    { bucket_conflict_resolution::sequence_number, "seqno" },
    { bucket_conflict_resolution::timestamp, "lww" },
    { bucket_conflict_resolution::custom, "custom" },
  } };

constexpr std::array<std::pair<durability_level, std::string_view>, 4> durability_levels{ {
  { durability_level::none, "none" },
  { durability_level::majority, "majority" },
  { durability_level::majority_and_persist_to_active, "majorityAndPersistActive" },
  { durability_level::persist_to_majority, "persistToMajority" },
} };
} // namespace

auto
to_string(bucket_type value) -> std::string_view
{
  return lookup(bucket_types, value);
}

auto
to_string(bucket_compression value) -> std::string_view
{
  return lookup(compression_modes, value);
}

auto
to_string(bucket_storage_backend value) -> std::string_view
{
  return lookup(storage_backends, value);
}

auto
to_string(bucket_eviction_policy value) -> std::string_view
{
  return lookup(eviction_policies, value);
}

auto
to_string(bucket_conflict_resolution value) -> std::string_view
{
  return lookup(conflict_resolutions, value);
}

auto
to_string(durability_level value) -> std::string_view
{
  return lookup(durability_levels, value);
}

auto
bucket_type_from_string(std::string_view value) -> std::optional<bucket_type>
{
  return reverse_lookup(bucket_types, value);
}

auto
bucket_compression_from_string(std::string_view value) -> std::optional<bucket_compression>
{
  return reverse_lookup(compression_modes, value);
}

auto
bucket_storage_backend_from_string(std::string_view value) -> std::optional<bucket_storage_backend>
{
  return reverse_lookup(storage_backends, value);
}

auto
bucket_eviction_policy_from_string(std::string_view value) -> std::optional<bucket_eviction_policy>
{
  return reverse_lookup(eviction_policies, value);
}

auto
bucket_conflict_resolution_from_string(std::string_view value)
  -> std::optional<bucket_conflict_resolution>
{
  return reverse_lookup(conflict_resolutions, value);
}

auto
durability_level_from_string(std::string_view value) -> std::optional<durability_level>
{
  return reverse_lookup(durability_levels, value);
}
} // namespace cbinit
