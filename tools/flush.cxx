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

#include "flush.hxx"

#include "environment.hxx"
#include "utils.hxx"

#include <cbinit/fmt/error.hxx>

#include <fmt/core.h>

#include <future>

namespace
{
class flush_app : public CLI::App
{
public:
  flush_app()
    : CLI::App("Remove all documents from the bucket of running cluster.", "flush")
  {
    cbinit_tool::add_options(this, topology_options_);
    cbinit_tool::add_options(this, logger_options_);

    add_option("--bucket", bucket_name_, "Name of the bucket.")->required();
  }

  [[nodiscard]] auto execute() const -> int
  {
    cbinit_tool::apply_logger_options(logger_options_);
    auto topology = cbinit_tool::load_topology_or_fail(topology_options_);
    if (!topology.find_bucket(bucket_name_)) {
      cbinit_tool::fail(fmt::format(
        R"(bucket "{}" is not declared in topology "{}")", bucket_name_, topology.name()));
    }

    cbinit_tool::cluster_environment environment{ topology };

    std::promise<cbinit::error> barrier;
    auto f = barrier.get_future();
    environment.orchestrator()->flush_bucket(bucket_name_, [&barrier](cbinit::error err) {
      barrier.set_value(std::move(err));
    });
    if (auto err = f.get(); err) {
      fmt::print(stderr, "ERROR: unable to flush bucket \"{}\": {}\n", bucket_name_, err);
      return 1;
    }
    fmt::print(stdout, "bucket \"{}\" has been flushed\n", bucket_name_);
    return 0;
  }

private:
  cbinit_tool::topology_options topology_options_{};
  cbinit_tool::logger_options logger_options_{};
  std::string bucket_name_{};
};
} // namespace

namespace cbinit_tool
{
auto
make_flush_command() -> std::shared_ptr<CLI::App>
{
  return std::make_shared<flush_app>();
}

auto
execute_flush_command(const CLI::App* app) -> int
{
  if (const auto* flush = dynamic_cast<const flush_app*>(app); flush != nullptr) {
    return flush->execute();
  }
  return 1;
}
} // namespace cbinit_tool
