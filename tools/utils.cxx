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

#include "utils.hxx"

#include "core/logger/configuration.hxx"
#include "core/logger/logger.hxx"
#include "core/topology/cluster_topology_config.hxx"

#include <cbinit/fmt/error.hxx>

#include <fmt/core.h>
#include <spdlog/details/os.h>

#include <cstdlib>

namespace cbinit_tool
{
namespace
{
auto
default_log_level() -> std::string
{
  if (auto level = spdlog::details::os::getenv("CBINIT_LOG_LEVEL"); !level.empty()) {
    return level;
  }
  return "info";
}
} // namespace

void
add_options(CLI::App* app, logger_options& options)
{
  auto* group = app->add_option_group("Logger", "Logger options.");
  group
    ->add_option(
      "--log-level", options.level, "Log level (the default comes from CBINIT_LOG_LEVEL).")
    ->default_val(default_log_level())
    ->check(CLI::IsMember({ "trace", "debug", "info", "warning", "error", "critical", "off" }));
  group->add_option("--log-output",
                    options.output_path,
                    "File to send logs (when is not set, logs will be written to STDERR).");
}

void
add_options(CLI::App* app, topology_options& options)
{
  app->add_option("--topology", options.path, "Path to the JSON document describing the cluster.")
    ->required()
    ->check(CLI::ExistingFile);
}

void
apply_logger_options(const logger_options& options)
{
  auto level = cbinit::core::logger::level_from_str(options.level);

  if (level != cbinit::core::logger::level::off) {
    cbinit::core::logger::configuration configuration{};

    if (options.output_path.empty()) {
      configuration.console = true;
      configuration.synchronous = true;
    } else {
      configuration.filename = options.output_path;
    }
    configuration.log_level = level;
    if (auto err = cbinit::core::logger::create_file_logger(configuration); err) {
      fail(fmt::format("unable to initialize logger: {}", err.value()));
    }
  }

  cbinit::core::logger::set_log_levels(level);
}

auto
load_topology_or_fail(const topology_options& options) -> cbinit::cluster_topology
{
  auto topology = cbinit::core::topology::load_cluster_topology(options.path);
  if (!topology) {
    fail(fmt::format(R"(unable to load topology from "{}": {})", options.path, topology.error()));
  }
  return std::move(topology.value());
}

[[noreturn]] void
fail(std::string_view message)
{
  fmt::print(stderr, "ERROR: {}\n", message);
  cbinit::core::logger::shutdown();
  std::exit(EXIT_FAILURE);
}
} // namespace cbinit_tool
