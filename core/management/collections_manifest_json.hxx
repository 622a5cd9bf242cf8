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

#include "collections_manifest.hxx"

#include <tao/json/forward.hpp>

namespace tao::json
{
template<>
struct traits<cbinit::core::management::collections_manifest> {
  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v)
    -> cbinit::core::management::collections_manifest
  {
    cbinit::core::management::collections_manifest result;
    if (const auto* uid = v.find("uid"); uid != nullptr && uid->is_string()) {
      result.uid = uid->get_string();
    }
    for (const auto& s : v.at("scopes").get_array()) {
      cbinit::core::management::collections_manifest::scope scope{};
      scope.name = s.at("name").get_string();
      if (const auto* uid = s.find("uid"); uid != nullptr && uid->is_string()) {
        scope.uid = uid->get_string();
      }
      if (const auto* collections = s.find("collections");
          collections != nullptr && collections->is_array()) {
        for (const auto& c : collections->get_array()) {
          cbinit::core::management::collections_manifest::collection collection{};
          collection.name = c.at("name").get_string();
          if (const auto* uid = c.find("uid"); uid != nullptr && uid->is_string()) {
            collection.uid = uid->get_string();
          }
          scope.collections.emplace_back(std::move(collection));
        }
      }
      result.scopes.emplace_back(std::move(scope));
    }
    return result;
  }
};
} // namespace tao::json
