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

#include <chrono>
#include <thread>

namespace test::utils
{
template<class ConditionChecker>
auto
wait_until(ConditionChecker&& condition_checker,
           std::chrono::milliseconds timeout,
           std::chrono::milliseconds delay) -> bool
{
  const auto start = std::chrono::steady_clock::now();
  while (!condition_checker()) {
    if (std::chrono::steady_clock::now() > start + timeout) {
      return false;
    }
    std::this_thread::sleep_for(delay);
  }
  return true;
}

template<class ConditionChecker>
auto
wait_until(ConditionChecker&& condition_checker, std::chrono::milliseconds timeout) -> bool
{
  return wait_until(condition_checker, timeout, std::chrono::milliseconds(10));
}

template<class ConditionChecker>
auto
wait_until(ConditionChecker&& condition_checker) -> bool
{
  return wait_until(condition_checker, std::chrono::seconds(10));
}
} // namespace test::utils
