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

#include <cxxopts.hpp>
#include <iostream>

#include "tsink/core/logging.hpp"
#include "tsink/influxdb/client.hpp"
#include "tsink/tools/tsink-cli/arguments.hpp"
#include "tsink/tools/tsink-cli/command_handlers.hpp"
#include "tsink/tools/tsink-cli/constants.hpp"

namespace tsink {
namespace tools {
namespace cli {

int create_db_main(int argc, char* argv[]) {
  cxxopts::Options options(create_db_command.data(), create_db_desc.data());
  options.add_options()("c,config", "YAML configuration file", cxxopts::value<std::string>())(
      "o,overlay", "YAML overlay applied on top of the configuration",
      cxxopts::value<std::string>()->default_value(""))("l,log-level", "log level (info, warn, error, debug)",
                                                        cxxopts::value<std::string>()->default_value(""))(
      "h,help", "print usage");

  try {
    auto result = options.parse(argc, argv);
    if (result.count("help") || !result.count("config")) {
      std::cout << options.help() << std::endl;
      return 1;
    }

    const auto config = LoadConfig(result["config"].as<std::string>(), result["overlay"].as<std::string>(),
                                   result["log-level"].as<std::string>());
    // The client creates the database while it is constructed
    influxdb::InfluxDBClient client(influxdb::ConnectionConfig::FromConfig(config));
    if (!client.IsDatabaseReady()) {
      std::cerr << "Failed to create database " << client.GetConfig().database << std::endl;
      return 1;
    }
    std::cout << "Database " << client.GetConfig().database << " is ready" << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "create-db failed: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

}  // namespace cli
}  // namespace tools
}  // namespace tsink
