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

#ifndef TSINK_TOOLS_TSINK_CLI_ARGUMENTS_HPP
#define TSINK_TOOLS_TSINK_CLI_ARGUMENTS_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tsink/core/config.hpp"
#include "tsink/influxdb/point.hpp"

namespace tsink {
namespace tools {
namespace cli {

/**
 * @brief Split `key=value` at the first '='
 *
 * @throws std::invalid_argument if there is no '=' or the key is empty
 */
std::pair<std::string, std::string> ParseKeyValue(std::string_view text);

/**
 * @brief Interpret a field value the way line protocol would: `12i` is an integer, `true`/`false` a boolean, a number
 * a float, and anything else (optionally double-quoted) a string
 */
influxdb::FieldValue ParseFieldValue(std::string_view text);

/**
 * @brief Build a point from command line pieces
 *
 * @throws std::invalid_argument on a malformed tag or field
 */
influxdb::Point BuildPoint(const std::string& measurement, const std::vector<std::string>& tags,
                           const std::vector<std::string>& fields);

/**
 * @brief Load the configuration file, apply an optional overlay and set the log level
 *
 * The log level comes from `log_level` if non-empty, else from `logging.level` in the configuration.
 */
tsink::core::Config LoadConfig(const std::string& path, const std::string& overlay_path, const std::string& log_level);

}  // namespace cli
}  // namespace tools
}  // namespace tsink

#endif  // TSINK_TOOLS_TSINK_CLI_ARGUMENTS_HPP
