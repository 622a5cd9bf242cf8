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

#include "bucket_status.hxx"

#include <tao/json/forward.hpp>

namespace tao::json
{
template<>
struct traits<cbinit::core::management::bucket_status> {
  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v) -> cbinit::core::management::bucket_status
  {
    cbinit::core::management::bucket_status result;
    result.name = v.at("name").get_string();
    if (const auto* type = v.find("bucketType"); type != nullptr && type->is_string()) {
      result.bucket_type = type->get_string();
    }
    if (const auto* nodes = v.find("nodes"); nodes != nullptr && nodes->is_array()) {
      for (const auto& entry : nodes->get_array()) {
        cbinit::core::management::bucket_status::node node{};
        if (const auto* hostname = entry.find("hostname");
            hostname != nullptr && hostname->is_string()) {
          node.hostname = hostname->get_string();
        }
        if (const auto* status = entry.find("status"); status != nullptr && status->is_string()) {
          node.status = status->get_string();
        }
        result.nodes.emplace_back(std::move(node));
      }
    }
    return result;
  }
};
} // namespace tao::json
