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

#ifndef TSINK_INFLUXDB_CONNECTION_CONFIG_HPP
#define TSINK_INFLUXDB_CONNECTION_CONFIG_HPP

#include <cstddef>
#include <optional>
#include <string>

#include "tsink/core/config.hpp"
#include "tsink/influxdb/point.hpp"
#include "tsink/network/http_client.hpp"

namespace tsink {
namespace influxdb {

/**
 * @brief Settings for talking to one InfluxDB database
 *
 * The defaults target a local InfluxDB 1.x with its stock credentials.
 */
struct ConnectionConfig {
  static constexpr std::size_t kDefaultBufferCapacity = 64 * 1024;

  std::string connect_string{"http://localhost:8086"};  ///< base URL of the InfluxDB HTTP API
  std::string database{"kafka"};
  std::string username{"root"};
  std::string password{"root"};
  std::optional<std::string> retention_policy;  ///< sent as `rp` when set
  std::optional<std::string> consistency;       ///< sent as `consistency` when set
  Tags tags;                                    ///< default tags merged into every point
  network::HttpClient::Options http;
  std::size_t buffer_capacity{kDefaultBufferCapacity};

  /**
   * @brief Read the `influxdb` section of a configuration tree
   *
   * Missing keys keep their defaults. Empty optional strings are treated as unset.
   *
   * @throws std::invalid_argument if the database name is empty or `tags` is not a map
   * @throws YAML::Exception if a key has the wrong type
   */
  static ConnectionConfig FromConfig(const tsink::core::Config& config);
};

}  // namespace influxdb
}  // namespace tsink

#endif  // TSINK_INFLUXDB_CONNECTION_CONFIG_HPP
