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

/*
 *   A note on the thread safety of the logger API:
 *
 *   Logging functions can be called from any thread. Creating or resetting the logger is only safe
 * while no other thread is logging, typically at the start of the process or of a test case.
 */

#pragma once

#include "level.hxx"

#include <fmt/core.h>

#include <optional>
#include <string>
#include <string_view>

namespace cbinit::core::logger
{
struct configuration;

/**
 * @return the level for the name ("trace", "debug", "info", "warning", "error", "critical",
 * "off"), trace for names it does not know
 */
auto
level_from_str(const std::string& str) -> level;

/**
 * Initialize the logger with a rotating file sink and/or console sink.
 *
 * @param logger_settings the configuration for the logger
 * @return optional error message if something goes wrong
 */
auto
create_file_logger(const configuration& logger_settings) -> std::optional<std::string>;

/**
 * Initialize the synchronous logger which writes to stderr.
 */
void
create_console_logger();

void
set_log_levels(level lvl);

void
set_pattern(const std::string& pattern);

/**
 * Checks whether a specific level should be logged based on the current configuration.
 */
auto
should_log(level lvl) -> bool;

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg);
} // namespace detail

template<typename String, typename... Args>
inline void
log(const char* file, int line, const char* function, level lvl, const String& msg, Args&&... args)
{
  detail::log(file, line, function, lvl, fmt::format(msg, std::forward<Args>(args)...));
}

void
flush();

/**
 * Flush buffers and release the logger. The logger has to be created again after this call.
 */
void
shutdown();
} // namespace cbinit::core::logger

#if defined(__GNUC__) || defined(__clang__)
#define CBINIT_LOGGER_FUNCTION __PRETTY_FUNCTION__
#else
#define CBINIT_LOGGER_FUNCTION __FUNCTION__
#endif

/**
 * Arguments are not evaluated unless the severity is enabled.
 */
#define CBINIT_LOG(file, line, function, severity, ...)                                            \
  do {                                                                                             \
    if (cbinit::core::logger::should_log(severity)) {                                              \
      cbinit::core::logger::log(file, line, function, severity, __VA_ARGS__);                      \
    }                                                                                              \
  } while (false)

#define CBINIT_LOG_TRACE(...)                                                                      \
  CBINIT_LOG(                                                                                      \
    __FILE__, __LINE__, CBINIT_LOGGER_FUNCTION, cbinit::core::logger::level::trace, __VA_ARGS__)
#define CBINIT_LOG_DEBUG(...)                                                                      \
  CBINIT_LOG(                                                                                      \
    __FILE__, __LINE__, CBINIT_LOGGER_FUNCTION, cbinit::core::logger::level::debug, __VA_ARGS__)
#define CBINIT_LOG_INFO(...)                                                                       \
  CBINIT_LOG(                                                                                      \
    __FILE__, __LINE__, CBINIT_LOGGER_FUNCTION, cbinit::core::logger::level::info, __VA_ARGS__)
#define CBINIT_LOG_WARNING(...)                                                                    \
  CBINIT_LOG(                                                                                      \
    __FILE__, __LINE__, CBINIT_LOGGER_FUNCTION, cbinit::core::logger::level::warn, __VA_ARGS__)
#define CBINIT_LOG_ERROR(...)                                                                      \
  CBINIT_LOG(                                                                                      \
    __FILE__, __LINE__, CBINIT_LOGGER_FUNCTION, cbinit::core::logger::level::err, __VA_ARGS__)
#define CBINIT_LOG_CRITICAL(...)                                                                   \
  CBINIT_LOG(__FILE__,                                                                             \
             __LINE__,                                                                             \
             CBINIT_LOGGER_FUNCTION,                                                               \
             cbinit::core::logger::level::critical,                                                \
             __VA_ARGS__)
