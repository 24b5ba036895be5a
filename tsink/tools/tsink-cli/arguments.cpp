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

#include "arguments.hpp"

#include <fmt/core.h>

#include <cctype>
#include <charconv>
#include <stdexcept>
#include <string>

#include "tsink/core/logging.hpp"

namespace tsink {
namespace tools {
namespace cli {

std::pair<std::string, std::string> ParseKeyValue(std::string_view text) {
  const auto equals = text.find('=');
  if (equals == std::string_view::npos || equals == 0) {
    throw std::invalid_argument(fmt::format("Expected key=value, got '{}'", text));
  }
  return {std::string{text.substr(0, equals)}, std::string{text.substr(equals + 1)}};
}

influxdb::FieldValue ParseFieldValue(std::string_view text) {
  if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
    return std::string{text.substr(1, text.size() - 2)};
  }
  if (text == "true") {
    return true;
  }
  if (text == "false") {
    return false;
  }
  if (text.size() > 1 && text.back() == 'i') {
    int64_t value = 0;
    const auto digits = text.substr(0, text.size() - 1);
    const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc{} && end == digits.data() + digits.size()) {
      return value;
    }
  }
  // std::stod accepts leading whitespace and trailing garbage, so require it to consume everything
  try {
    std::size_t consumed = 0;
    const std::string number{text};
    const double value = std::stod(number, &consumed);
    if (!text.empty() && consumed == number.size() && !std::isspace(static_cast<unsigned char>(text.front()))) {
      return value;
    }
  } catch (const std::logic_error&) {
    // not a number, treat as a string below
  }
  return std::string{text};
}

influxdb::Point BuildPoint(const std::string& measurement, const std::vector<std::string>& tags,
                           const std::vector<std::string>& fields) {
  influxdb::Point point(measurement);
  for (const auto& tag : tags) {
    auto [key, value] = ParseKeyValue(tag);
    point.AddTag(std::move(key), std::move(value));
  }
  for (const auto& field : fields) {
    auto [key, value] = ParseKeyValue(field);
    point.AddField(std::move(key), ParseFieldValue(value));
  }
  return point;
}

tsink::core::Config LoadConfig(const std::string& path, const std::string& overlay_path, const std::string& log_level) {
  tsink::core::Config config(path);
  if (!overlay_path.empty()) {
    config.OverlayFromFile(overlay_path, true);
  }

  if (!log_level.empty()) {
    tsink::core::Log::SetLogLevel(log_level);
  } else if (config["logging"] && config["logging"]["level"]) {
    tsink::core::Log::SetLogLevel(config["logging"]["level"].as<std::string>());
  }
  return config;
}

}  // namespace cli
}  // namespace tools
}  // namespace tsink
