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
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "tsink/core/logging.hpp"
#include "tsink/influxdb/client.hpp"
#include "tsink/tools/tsink-cli/arguments.hpp"
#include "tsink/tools/tsink-cli/command_handlers.hpp"
#include "tsink/tools/tsink-cli/constants.hpp"

namespace tsink {
namespace tools {
namespace cli {

using namespace tsink::core;

int write_main(int argc, char* argv[]) {
  cxxopts::Options options(write_command.data(), write_desc.data());
  options.add_options()("c,config", "YAML configuration file", cxxopts::value<std::string>())(
      "o,overlay", "YAML overlay applied on top of the configuration",
      cxxopts::value<std::string>()->default_value(""))("l,log-level", "log level (info, warn, error, debug)",
                                                        cxxopts::value<std::string>()->default_value(""))(
      "m,measurement", "measurement name", cxxopts::value<std::string>())(
      "t,tag", "tag as key=value (repeatable)", cxxopts::value<std::vector<std::string>>())(
      "f,field", "field as key=value (repeatable)", cxxopts::value<std::vector<std::string>>())(
      "timestamp", "timestamp in milliseconds since the epoch (default: now)", cxxopts::value<int64_t>())(
      "linger", "milliseconds to wait for the write to complete before exiting",
      cxxopts::value<unsigned>()->default_value(std::to_string(kDefaultLingerMs)))("h,help", "print usage");

  try {
    auto result = options.parse(argc, argv);
    if (result.count("help") || !result.count("config") || !result.count("measurement") || !result.count("field")) {
      std::cout << options.help() << std::endl;
      return 1;
    }

    const auto config = LoadConfig(result["config"].as<std::string>(), result["overlay"].as<std::string>(),
                                   result["log-level"].as<std::string>());
    const std::vector<std::string> tags =
        result.count("tag") ? result["tag"].as<std::vector<std::string>>() : std::vector<std::string>{};

    auto point = BuildPoint(result["measurement"].as<std::string>(), tags,
                            result["field"].as<std::vector<std::string>>());
    if (result.count("timestamp")) {
      point.SetTimestamp(result["timestamp"].as<int64_t>());
    } else {
      const auto now = std::chrono::system_clock::now().time_since_epoch();
      point.SetTimestamp(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
    }

    influxdb::InfluxDBClient client(influxdb::ConnectionConfig::FromConfig(config));
    if (!client.IsDatabaseReady()) {
      Log::Warn("Database {} could not be created, the write will be retried once", client.GetConfig().database);
    }
    std::cout << "Writing: " << point.AsLineProtocol() << std::endl;
    client.Write({point});

    // Writes are fire-and-forget; give the response a chance to arrive so failures show up in the log
    std::this_thread::sleep_for(std::chrono::milliseconds(result["linger"].as<unsigned>()));
    client.Close();
  } catch (const std::exception& e) {
    std::cerr << "Write failed: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

}  // namespace cli
}  // namespace tools
}  // namespace tsink
