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

#ifndef TSINK_TOOLS_TSINK_CLI_CONSTANTS_HPP
#define TSINK_TOOLS_TSINK_CLI_CONSTANTS_HPP

#include <string_view>

namespace tsink {
namespace tools {
namespace cli {

constexpr std::string_view root_command{"tsink-cli"};

// ==================== Full command strings ====================

constexpr std::string_view write_command{"tsink-cli write"};
constexpr std::string_view create_db_command{"tsink-cli create-db"};

// ==================== Command descriptions ====================

constexpr std::string_view write_desc{"write one point to InfluxDB"};
constexpr std::string_view create_db_desc{"create the configured InfluxDB database"};

// Time to let a fire-and-forget write complete before the process exits
constexpr unsigned kDefaultLingerMs = 1000U;

}  // namespace cli
}  // namespace tools
}  // namespace tsink

#endif  // TSINK_TOOLS_TSINK_CLI_CONSTANTS_HPP
