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

#include <cbinit/error_codes.hxx>

#include <string>

namespace cbinit::core::impl
{
struct network_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "cbinit.network";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::network>(ev)) {
      case errc::network::resolve_failure:
        return "resolve_failure (1001)";
      case errc::network::no_endpoints_left:
        return "no_endpoints_left (1002)";
      case errc::network::handshake_failure:
        return "handshake_failure (1003)";
      case errc::network::protocol_error:
        return "protocol_error (1004)";
      case errc::network::end_of_stream:
        return "end_of_stream (1005)";
    }
    return "FIXME: unknown error code (recompile with newer library): cbinit.network." +
           std::to_string(ev);
  }
};

const inline static network_error_category category_instance;

auto
network_category() noexcept -> const std::error_category&
{
  return category_instance;
}
} // namespace cbinit::core::impl
