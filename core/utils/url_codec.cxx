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

#include "url_codec.hxx"

namespace cbinit::core::utils::string_codec
{
namespace
{
auto
should_escape(char c, encoding mode) -> bool
{
  // §2.3 Unreserved characters (alphanum)
  if (('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z') || ('0' <= c && c <= '9')) {
    return false;
  }

  switch (c) {
    case '-':
    case '_':
    case '.':
    case '~':
      // §2.3 Unreserved characters (mark)
      return false;

    case '$':
    case '&':
    case '+':
    case ',':
    case '/':
    case ':':
    case ';':
    case '=':
    case '?':
    case '@':
      // §3.3 path segments may carry : @ & = + $ unescaped, §3.4 query reserves everything
      if (mode == encoding::encode_path_segment) {
        return c == '/' || c == ';' || c == ',' || c == '?';
      }
      return true;

    default:
      break;
  }
  return true;
}

constexpr auto upper_hex = "0123456789ABCDEF";
} // namespace

auto
escape(const std::string& s, encoding mode) -> std::string
{
  std::string result{};
  result.reserve(s.size());
  for (const auto c : s) {
    if (c == ' ' && mode == encoding::encode_query_component) {
      result.push_back('+');
    } else if (should_escape(c, mode)) {
      const auto byte = static_cast<unsigned char>(c);
      result.push_back('%');
      result.push_back(upper_hex[(byte >> 4U) & 0x0fU]);
      result.push_back(upper_hex[byte & 0x0fU]);
    } else {
      result.push_back(c);
    }
  }
  return result;
}

auto
form_encode(const std::vector<std::pair<std::string, std::string>>& values) -> std::string
{
  std::string body{};
  for (const auto& [key, value] : values) {
    if (!body.empty()) {
      body.push_back('&');
    }
    body.append(query_escape(key)).append("=").append(query_escape(value));
  }
  return body;
}
} // namespace cbinit::core::utils::string_codec
