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

#include "bootstrap.hxx"
#include "flush.hxx"
#include "health.hxx"
#include "version.hxx"

#include "core/logger/logger.hxx"
#include "core/meta/version.hxx"

#include <fmt/core.h>

int
main(int argc, const char** argv)
{
  CLI::App app{ "Bootstrap Couchbase clusters from declarative topology.", "cbinit" };
  app.set_version_flag("--version", fmt::format("cbinit {}", cbinit::core::meta::version()));
  app.require_subcommand(1);

  app.add_subcommand(cbinit_tool::make_version_command());
  app.add_subcommand(cbinit_tool::make_bootstrap_command());
  app.add_subcommand(cbinit_tool::make_flush_command());
  app.add_subcommand(cbinit_tool::make_health_command());

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  int exit_code = 0;
  for (const auto& item : app.get_subcommands()) {
    if (item->get_name() == "version") {
      exit_code = cbinit_tool::execute_version_command(item);
    } else if (item->get_name() == "bootstrap") {
      exit_code = cbinit_tool::execute_bootstrap_command(item);
    } else if (item->get_name() == "flush") {
      exit_code = cbinit_tool::execute_flush_command(item);
    } else if (item->get_name() == "health") {
      exit_code = cbinit_tool::execute_health_command(item);
    }
  }

  cbinit::core::logger::shutdown();
  return exit_code;
}
