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

#include "utils/logger.hxx"
#include "utils/wait_until.hxx"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_tostring.hpp>
#include <fmt/core.h>

#include <cbinit/error.hxx>
#include <cbinit/fmt/error.hxx>

/**
 * This will make Catch2 show the contents of the error when used in an assertion that fails.
 */
template<>
struct Catch::StringMaker<cbinit::error> {
  static auto convert(const cbinit::error& err) -> std::string
  {
    return fmt::format("cbinit::error{{ ec: {}, msg: {} }}", err.ec().message(), err.message());
  }
};

#define REQUIRE_SUCCESS(ec)                                                                        \
  INFO((ec).message());                                                                            \
  REQUIRE_FALSE(ec)
#define REQUIRE_NO_ERROR(err)                                                                      \
  if (err) {                                                                                       \
    INFO(fmt::format("Expected no error. Got: {}.", err));                                         \
  }                                                                                                \
  REQUIRE_FALSE((err));
