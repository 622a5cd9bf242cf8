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

#include "version.hxx"

#include "core/utils/json.hxx"

#include <cbinit/build_version.hxx>

#include <asio/version.hpp>
#include <fmt/core.h>
#include <llhttp.h>
#include <openssl/crypto.h>
#include <spdlog/version.h>
#include <tao/json/value.hpp>

namespace cbinit::core::meta
{
auto
version() -> const std::string&
{
  static const std::string version{ fmt::format(
    "{}.{}.{}", CBINIT_VERSION_MAJOR, CBINIT_VERSION_MINOR, CBINIT_VERSION_PATCH) };
  return version;
}

auto
build_info() -> std::map<std::string, std::string>
{
  std::map<std::string, std::string> info{};
  info["version"] = version();
  info["version_major"] = std::to_string(CBINIT_VERSION_MAJOR);
  info["version_minor"] = std::to_string(CBINIT_VERSION_MINOR);
  info["version_patch"] = std::to_string(CBINIT_VERSION_PATCH);
  info["revision"] = CBINIT_GIT_REVISION;
  info["build_timestamp"] = CBINIT_BUILD_TIMESTAMP;
  info["platform"] = CBINIT_SYSTEM;
  info["cpu"] = CBINIT_SYSTEM_PROCESSOR;
  info["cxx"] = CBINIT_CXX_COMPILER;
  info["cmake_build_type"] = CBINIT_CMAKE_BUILD_TYPE;
  info["spdlog"] = fmt::format("{}.{}.{}", SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH);
  info["fmt"] =
    fmt::format("{}.{}.{}", FMT_VERSION / 10'000, FMT_VERSION / 100 % 100, FMT_VERSION % 100);
  info["asio"] =
    fmt::format("{}.{}.{}", ASIO_VERSION / 100'000, ASIO_VERSION / 100 % 1000, ASIO_VERSION % 100);
  info["llhttp"] =
    fmt::format("{}.{}.{}", LLHTTP_VERSION_MAJOR, LLHTTP_VERSION_MINOR, LLHTTP_VERSION_PATCH);
  info["openssl_headers"] = OPENSSL_VERSION_TEXT;
  info["openssl_runtime"] = OpenSSL_version(OPENSSL_VERSION);
  info["__cplusplus"] = fmt::format("{}", __cplusplus);
#if defined(__GLIBC__)
  info["libc"] = fmt::format("glibc {}.{}", __GLIBC__, __GLIBC_MINOR__);
#endif
  return info;
}

auto
build_info_json() -> std::string
{
  tao::json::value info = tao::json::empty_object;
  for (const auto& [name, value] : build_info()) {
    if (name == "version_major" || name == "version_minor" || name == "version_patch") {
      info[name] = std::stoi(value);
    } else {
      info[name] = value;
    }
  }
  return utils::json::generate(info);
}

auto
user_agent() -> const std::string&
{
  static const std::string user_agent{ fmt::format("cbinit/{}; {}", version(), CBINIT_SYSTEM) };
  return user_agent;
}
} // namespace cbinit::core::meta
