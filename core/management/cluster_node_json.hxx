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

#include "cluster_node.hxx"

#include <tao/json/forward.hpp>

namespace tao::json
{
template<>
struct traits<cbinit::core::management::cluster_node> {
  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v) -> cbinit::core::management::cluster_node
  {
    cbinit::core::management::cluster_node result;
    result.hostname = v.at("hostname").get_string();
    if (const auto* otp_node = v.find("otpNode"); otp_node != nullptr && otp_node->is_string()) {
      result.otp_node = otp_node->get_string();
    }
    if (const auto* status = v.find("status"); status != nullptr && status->is_string()) {
      result.status = status->get_string();
    }
    if (const auto* membership = v.find("clusterMembership");
        membership != nullptr && membership->is_string()) {
      result.cluster_membership = membership->get_string();
    }
    if (const auto* version = v.find("version"); version != nullptr && version->is_string()) {
      result.version = version->get_string();
    }
    if (const auto* services = v.find("services"); services != nullptr && services->is_array()) {
      for (const auto& service : services->get_array()) {
        result.services.emplace_back(service.get_string());
      }
    }
    if (const auto* this_node = v.find("thisNode");
        this_node != nullptr && this_node->is_boolean()) {
      result.this_node = this_node->get_boolean();
    }
    return result;
  }
};
} // namespace tao::json
