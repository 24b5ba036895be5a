/*
 * Copyright (C) 2025 Agtonomy
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 */

#ifndef TSINK_CORE_LOGGING_HPP
#define TSINK_CORE_LOGGING_HPP

#include <fmt/core.h>

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace tsink {
namespace core {
namespace Log {

/**
 * @brief Log levels
 *
 * A message is written when its level is at or below the current level, so kDebug shows everything and the default,
 * kFatal, shows all but debug messages.
 */
enum LogLevel { kInfo = 0, kWarn, kError, kFatal, kDebug };

/**
 * @brief Set the log level by name: info, warn, warning, error, fatal or debug (case-insensitive)
 *
 * Unknown names select the default level.
 */
void SetLogLevel(const std::string& log_level_string);
void SetLogLevel(LogLevel log_level);
LogLevel GetLogLevel();

/// Redirect log output, std::cout by default. The stream must outlive every later log call.
void SetLogStream(std::ostream& stream);

void DoLog(std::string_view msg, std::string_view prefix, LogLevel level);

template <typename... Args>
inline void Info(fmt::format_string<Args...> fmt_msg, Args&&... args) {
  DoLog(fmt::format(fmt_msg, std::forward<Args>(args)...), "[INFO]  ", kInfo);
}

template <typename... Args>
inline void Warn(fmt::format_string<Args...> fmt_msg, Args&&... args) {
  DoLog(fmt::format(fmt_msg, std::forward<Args>(args)...), "[WARN]  ", kWarn);
}

template <typename... Args>
inline void Error(fmt::format_string<Args...> fmt_msg, Args&&... args) {
  DoLog(fmt::format(fmt_msg, std::forward<Args>(args)...), "[ERROR] ", kError);
}

template <typename... Args>
inline void Debug(fmt::format_string<Args...> fmt_msg, Args&&... args) {
  DoLog(fmt::format(fmt_msg, std::forward<Args>(args)...), "[DEBUG] ", kDebug);
}

}  // namespace Log
}  // namespace core
}  // namespace tsink

#endif  // TSINK_CORE_LOGGING_HPP
