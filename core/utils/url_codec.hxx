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

#include <string>
#include <utility>
#include <vector>

namespace cbinit::core::utils::string_codec
{
enum class encoding {
  encode_path_segment,
  encode_query_component,
};

auto
escape(const std::string& s, encoding mode) -> std::string;

/**
 * Escapes the string so it can be safely placed inside a URL query or a form body. Spaces become
 * '+'.
 */
inline auto
query_escape(const std::string& s) -> std::string
{
  return escape(s, encoding::encode_query_component);
}

/**
 * Escapes the string so it can be safely placed inside a URL path segment, replacing special
 * characters (including /) with %XX sequences as needed.
 */
inline auto
path_escape(const std::string& s) -> std::string
{
  return escape(s, encoding::encode_path_segment);
}

/**
 * Builds "application/x-www-form-urlencoded" body, the fields keep their order.
 */
auto
form_encode(const std::vector<std::pair<std::string, std::string>>& values) -> std::string;
} // namespace cbinit::core::utils::string_codec
