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

#include "level.hxx"

#include <cstddef>
#include <string>

namespace cbinit::core::logger
{
struct configuration {
  /**
   * The base name of the log file. Rotated files get a sequence number appended, the lower the
   * newer.
   */
  std::string filename{};

  /**
   * Number of queued messages of the asynchronous logger.
   */
  std::size_t buffer_size{ 8192 };

  /**
   * Size of the log file before it is rotated.
   */
  std::size_t cycle_size{ 10LLU * 1024 * 1024 };

  std::size_t max_files{ 3 };

  /**
   * Messages are written on the calling thread. Used when the output goes only to the console.
   */
  bool synchronous{ false };

  /**
   * Mirror the messages to stderr.
   */
  bool console{ true };

  level console_sink_log_level{ level::trace };
  level log_level{ level::info };
};
} // namespace cbinit::core::logger
