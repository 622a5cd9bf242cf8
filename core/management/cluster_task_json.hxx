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

#include "cluster_task.hxx"

#include <tao/json/forward.hpp>

namespace tao::json
{
template<>
struct traits<cbinit::core::management::cluster_task> {
  template<template<typename...> class Traits>
  static auto as(const tao::json::basic_value<Traits>& v) -> cbinit::core::management::cluster_task
  {
    cbinit::core::management::cluster_task result;
    if (const auto* type = v.find("type"); type != nullptr && type->is_string()) {
      result.type = type->get_string();
    }
    if (const auto* status = v.find("status"); status != nullptr && status->is_string()) {
      result.status = status->get_string();
    }
    if (const auto* task_id = v.find("task_id"); task_id != nullptr && task_id->is_string()) {
      result.task_id = task_id->get_string();
    }
    if (const auto* bucket = v.find("bucket"); bucket != nullptr && bucket->is_string()) {
      result.bucket = bucket->get_string();
    }
    return result;
  }
};
} // namespace tao::json
