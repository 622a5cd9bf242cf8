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

#include "logger.hxx"

#include "configuration.hxx"

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace cbinit::core::logger
{
namespace
{
const std::string logger_name{ "cbinit" };

/*
 * The resource name is part of the message, so the pattern only adds time, level and thread.
 */
const std::string log_pattern{ "%Y-%m-%dT%T.%e [%^%-8l%$] [%t] %v" };

/**
 * Holds the process-wide logger. The logger is replaced only at startup and shutdown, every other
 * access takes a copy of the pointer.
 */
class logger_holder
{
public:
  [[nodiscard]] auto current() const -> std::shared_ptr<spdlog::logger>
  {
    const std::scoped_lock lock(mutex_);
    return logger_;
  }

  void replace(std::shared_ptr<spdlog::logger> logger)
  {
    const std::scoped_lock lock(mutex_);
    spdlog::drop(logger_name);
    logger_ = std::move(logger);
    if (logger_) {
      spdlog::register_logger(logger_);
    }
  }

private:
  mutable std::mutex mutex_{};
  std::shared_ptr<spdlog::logger> logger_{};
};

auto
holder() -> logger_holder&
{
  static logger_holder instance{};
  return instance;
}

auto
translate_level(level lvl) -> spdlog::level::level_enum
{
  switch (lvl) {
    case level::trace:
      return spdlog::level::level_enum::trace;
    case level::debug:
      return spdlog::level::level_enum::debug;
    case level::info:
      return spdlog::level::level_enum::info;
    case level::warn:
      return spdlog::level::level_enum::warn;
    case level::err:
      return spdlog::level::level_enum::err;
    case level::critical:
      return spdlog::level::level_enum::critical;
    case level::off:
      return spdlog::level::level_enum::off;
  }
  return spdlog::level::level_enum::trace;
}
} // namespace

auto
level_from_str(const std::string& str) -> level
{
  switch (spdlog::level::from_str(str)) {
    case spdlog::level::level_enum::trace:
      return level::trace;
    case spdlog::level::level_enum::debug:
      return level::debug;
    case spdlog::level::level_enum::info:
      return level::info;
    case spdlog::level::level_enum::warn:
      return level::warn;
    case spdlog::level::level_enum::err:
      return level::err;
    case spdlog::level::level_enum::critical:
      return level::critical;
    case spdlog::level::level_enum::off:
      // spdlog maps unknown names to "off" as well
      return str == "off" ? level::off : level::trace;
    default:
      break;
  }
  return level::trace;
}

auto
create_file_logger(const configuration& logger_settings) -> std::optional<std::string>
{
  std::shared_ptr<spdlog::logger> logger{};

  try {
    // logger
    //   |__dist_sink_mt
    //       |__rotating_file_sink_mt (when the file name is set)
    //       |__stderr_color_sink_mt (filtered by console_sink_log_level)
    auto sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
    sink->set_level(spdlog::level::trace);

    if (!logger_settings.filename.empty()) {
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        logger_settings.filename, logger_settings.cycle_size, logger_settings.max_files);
      file_sink->set_level(spdlog::level::trace);
      sink->add_sink(file_sink);
    }

    if (logger_settings.console) {
      auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_level(translate_level(logger_settings.console_sink_log_level));
      sink->add_sink(console_sink);
    }

    if (logger_settings.synchronous) {
      logger = std::make_shared<spdlog::logger>(logger_name, sink);
    } else {
      spdlog::init_thread_pool(logger_settings.buffer_size, 1);
      logger = std::make_shared<spdlog::async_logger>(
        logger_name, sink, spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    }

    logger->set_pattern(log_pattern);
    logger->set_level(translate_level(logger_settings.log_level));
    logger->flush_on(spdlog::level::warn);
  } catch (const spdlog::spdlog_ex& ex) {
    return std::string{ "Log initialization failed: " } + ex.what();
  }
  holder().replace(std::move(logger));
  spdlog::flush_every(std::chrono::seconds(1));
  return {};
}

void
create_console_logger()
{
  auto logger = std::make_shared<spdlog::logger>(
    logger_name, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  logger->set_level(spdlog::level::info);
  logger->set_pattern(log_pattern);
  holder().replace(std::move(logger));
}

void
set_log_levels(level lvl)
{
  if (auto logger = holder().current(); logger) {
    logger->set_level(translate_level(lvl));
    logger->flush();
  }
}

void
set_pattern(const std::string& pattern)
{
  if (auto logger = holder().current(); logger) {
    logger->set_pattern(pattern);
  }
}

auto
should_log(level lvl) -> bool
{
  if (auto logger = holder().current(); logger) {
    return logger->should_log(translate_level(lvl));
  }
  return false;
}

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg)
{
  if (auto logger = holder().current(); logger) {
    logger->log(spdlog::source_loc{ file, line, function }, translate_level(lvl), msg);
  }
}
} // namespace detail

void
flush()
{
  if (auto logger = holder().current(); logger) {
    logger->flush();
  }
}

void
shutdown()
{
  flush();

  // joins the thread pool of the asynchronous logger, queued messages reach the sinks first
  holder().replace(nullptr);
  spdlog::shutdown();
}
} // namespace cbinit::core::logger
