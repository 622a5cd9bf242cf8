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

#include <cbinit/service.hxx>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace cbinit
{
namespace
{
auto
management_identifier(service flag) -> std::string_view
{
  switch (flag) {
    case service::data:
      return "kv";
    case service::query:
      return "n1ql";
    case service::index:
      return "index";
    case service::search:
      return "fts";
    case service::analytics:
      return "cbas";
    case service::eventing:
      return "eventing";
    case service::backup:
      return "backup";
    case service::none:
      break;
  }
  return {};
}
} // namespace

auto
to_management_services(service services) -> std::string
{
  std::vector<std::string_view> identifiers{};
  for (const auto flag : all_services) {
    if (has_service(services, flag)) {
      identifiers.emplace_back(management_identifier(flag));
    }
  }
  return fmt::format("{}", fmt::join(identifiers, ","));
}

auto
to_string(service flag) -> std::string_view
{
  switch (flag) {
    case service::data:
      return "data";
    case service::query:
      return "query";
    case service::index:
      return "index";
    case service::search:
      return "search";
    case service::analytics:
      return "analytics";
    case service::eventing:
      return "eventing";
    case service::backup:
      return "backup";
    case service::none:
      break;
  }
  return "none";
}

auto
service_from_string(std::string_view name) -> std::optional<service>
{
  for (const auto flag : all_services) {
    if (to_string(flag) == name) {
      return flag;
    }
  }
  /* identifiers of the management API are accepted too */
  for (const auto flag : all_services) {
    if (management_identifier(flag) == name) {
      return flag;
    }
  }
  return {};
}

auto
service_names(service services) -> std::vector<std::string>
{
  std::vector<std::string> names{};
  for (const auto flag : all_services) {
    if (has_service(services, flag)) {
      names.emplace_back(to_string(flag));
    }
  }
  return names;
}
} // namespace cbinit
