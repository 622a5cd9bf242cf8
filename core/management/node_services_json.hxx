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

#include "node_services.hxx"

#include <tao/json/forward.hpp>

namespace tao::json
{
template<>
struct traits<cbinit::core::management::node_services> {
  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v) -> cbinit::core::management::node_services
  {
    cbinit::core::management::node_services result;
    if (const auto* hostname = v.find("hostname"); hostname != nullptr && hostname->is_string()) {
      result.hostname = hostname->get_string();
    }
    if (const auto* services = v.find("services"); services != nullptr && services->is_object()) {
      for (const auto& [name, port] : services->get_object()) {
        result.services[name] = port.template as<std::uint16_t>();
      }
    }
    if (const auto* this_node = v.find("thisNode");
        this_node != nullptr && this_node->is_boolean()) {
      result.this_node = this_node->get_boolean();
    }
    if (const auto* alternate = v.find("alternateAddresses"); alternate != nullptr) {
      if (const auto* external = alternate->find("external"); external != nullptr) {
        cbinit::core::management::alternate_address address{};
        address.hostname = external->at("hostname").get_string();
        if (const auto* ports = external->find("ports"); ports != nullptr && ports->is_object()) {
          for (const auto& [key, port] : ports->get_object()) {
            address.ports[key] = port.template as<std::uint16_t>();
          }
        }
        result.external_address = std::move(address);
      }
    }
    return result;
  }
};
} // namespace tao::json
