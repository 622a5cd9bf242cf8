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

#include <cbinit/topology.hxx>

#include <CLI/CLI.hpp>

#include <string>
#include <string_view>

namespace cbinit_tool
{
struct logger_options {
  std::string level{};
  std::string output_path{};
};

struct topology_options {
  std::string path{};
};

void
add_options(CLI::App* app, logger_options& options);

void
add_options(CLI::App* app, topology_options& options);

void
apply_logger_options(const logger_options& options);

/**
 * Loads the topology or terminates the process with the description of the problem.
 */
auto
load_topology_or_fail(const topology_options& options) -> cbinit::cluster_topology;

[[noreturn]] void
fail(std::string_view message);
} // namespace cbinit_tool
