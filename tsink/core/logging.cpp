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

#include "logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <mutex>

namespace tsink {
namespace core {
namespace Log {

namespace {

constexpr LogLevel kDefaultLogLevel{kFatal};

constexpr std::array<std::pair<std::string_view, LogLevel>, 6> kLevelNames{{{"info", kInfo},
                                                                             {"warn", kWarn},
                                                                             {"warning", kWarn},
                                                                             {"error", kError},
                                                                             {"fatal", kFatal},
                                                                             {"debug", kDebug}}};

struct Sink {
  std::mutex mutex;
  LogLevel level{kDefaultLogLevel};
  std::ostream* stream{&std::cout};
};

// Function-local so logging works from other static initializers
Sink& GetSink() {
  static Sink sink;
  return sink;
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

}  // namespace

void SetLogLevel(const std::string& log_level_string) {
  const auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                               [&log_level_string](const auto& entry) {
                                 return EqualsIgnoreCase(entry.first, log_level_string);
                               });
  SetLogLevel(it != kLevelNames.end() ? it->second : kDefaultLogLevel);
}

void SetLogLevel(LogLevel log_level) {
  Sink& sink = GetSink();
  std::lock_guard lock(sink.mutex);
  sink.level = log_level;
}

LogLevel GetLogLevel() {
  Sink& sink = GetSink();
  std::lock_guard lock(sink.mutex);
  return sink.level;
}

void SetLogStream(std::ostream& stream) {
  Sink& sink = GetSink();
  std::lock_guard lock(sink.mutex);
  sink.stream = &stream;
}

void DoLog(std::string_view msg, std::string_view prefix, LogLevel level) {
  Sink& sink = GetSink();
  std::lock_guard lock(sink.mutex);
  if (level <= sink.level) {
    *sink.stream << prefix << msg << std::endl;
  }
}

}  // namespace Log
}  // namespace core
}  // namespace tsink
