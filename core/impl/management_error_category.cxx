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
struct management_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "cbinit.management";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::management>(ev)) {
      case errc::management::collection_exists:
        return "collection_exists (601)";
      case errc::management::scope_exists:
        return "scope_exists (602)";
      case errc::management::bucket_exists:
        return "bucket_exists (605)";
      case errc::management::bucket_not_flushable:
        return "bucket_not_flushable (607)";
      case errc::management::request_failed:
        return "request_failed (620)";
    }
    return "FIXME: unknown error code (recompile with newer library): cbinit.management." +
           std::to_string(ev);
  }
};

const inline static management_error_category category_instance;

auto
management_category() noexcept -> const std::error_category&
{
  return category_instance;
}
} // namespace cbinit::core::impl
