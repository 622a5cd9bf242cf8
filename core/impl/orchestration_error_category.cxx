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
struct orchestration_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "cbinit.orchestration";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::orchestration>(ev)) {
      case errc::orchestration::no_data_service_node:
        return "no_data_service_node (1101)"
               ". The cluster must have at least one server with the data service.";
      case errc::orchestration::invalid_topology:
        return "invalid_topology (1102)";
      case errc::orchestration::invalid_settings:
        return "invalid_settings (1103)";
      case errc::orchestration::certificate_unavailable:
        return "certificate_unavailable (1104)";
      case errc::orchestration::resource_not_found:
        return "resource_not_found (1105)";
      case errc::orchestration::unsupported_command:
        return "unsupported_command (1106)";
      case errc::orchestration::server_not_initialized:
        return "server_not_initialized (1107)";
      case errc::orchestration::bootstrap_failed:
        return "bootstrap_failed (1108)";
    }
    return "FIXME: unknown error code (recompile with newer library): cbinit.orchestration." +
           std::to_string(ev);
  }
};

const inline static orchestration_error_category category_instance;

auto
orchestration_category() noexcept -> const std::error_category&
{
  return category_instance;
}
} // namespace cbinit::core::impl
