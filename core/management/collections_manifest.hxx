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
#include <string>
#include <vector>

namespace cbinit::core::management
{
struct collections_manifest {
  struct collection {
    std::string uid{};
    std::string name{};
  };

  struct scope {
    std::string uid{};
    std::string name{};
    std::vector<collection> collections{};

    [[nodiscard]] auto has_collection(const std::string& collection_name) const -> bool
    {
      for (const auto& c : collections) {
        if (c.name == collection_name) {
          return true;
        }
      }
      return false;
    }
  };

  std::string uid{};
  std::vector<scope> scopes{};

  [[nodiscard]] auto find_scope(const std::string& scope_name) const -> const scope*
  {
    for (const auto& s : scopes) {
      if (s.name == scope_name) {
        return &s;
      }
    }
    return nullptr;
  }
};
} // namespace cbinit::core::management
