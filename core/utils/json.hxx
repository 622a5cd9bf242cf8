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

#include <tao/json/value.hpp>

#include <string>
#include <string_view>

namespace cbinit::core::utils::json
{
/**
 * Parses the document, duplicated keys keep the last value.
 *
 * @throws tao::pegtl::parse_error if the input is not valid JSON
 */
auto
parse(std::string_view input) -> tao::json::value;

auto
generate(const tao::json::value& object) -> std::string;

/**
 * Like @ref parse, but reads the whole file.
 */
auto
parse_file(const std::string& path) -> tao::json::value;
} // namespace cbinit::core::utils::json
