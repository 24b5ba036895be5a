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

#include "connection_config.hpp"

#include <stdexcept>

namespace tsink {
namespace influxdb {

namespace {

template <typename T>
void ReadIfPresent(const YAML::Node& node, const char* key, T& target) {
  if (node[key]) {
    target = node[key].as<T>();
  }
}

std::optional<std::string> ReadOptional(const YAML::Node& node, const char* key) {
  if (!node[key] || node[key].IsNull()) {
    return std::nullopt;
  }
  auto value = node[key].as<std::string>();
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

ConnectionConfig ConnectionConfig::FromConfig(const tsink::core::Config& config) {
  ConnectionConfig result;
  const YAML::Node influx = config["influxdb"];
  if (!influx) {
    return result;
  }

  ReadIfPresent(influx, "connect_string", result.connect_string);
  ReadIfPresent(influx, "database", result.database);
  ReadIfPresent(influx, "username", result.username);
  ReadIfPresent(influx, "password", result.password);
  result.retention_policy = ReadOptional(influx, "retention_policy");
  result.consistency = ReadOptional(influx, "consistency");

  if (result.database.empty()) {
    throw std::invalid_argument("influxdb.database must not be empty");
  }

  if (const YAML::Node tags = influx["tags"]; tags && !tags.IsNull()) {
    if (!tags.IsMap()) {
      throw std::invalid_argument("influxdb.tags must be a map");
    }
    // yaml-cpp iterates maps in document order, which becomes the tag order on the wire
    for (const auto& it : tags) {
      result.tags.emplace_back(it.first.as<std::string>(), it.second.as<std::string>());
    }
  }

  if (const YAML::Node http = influx["http"]; http) {
    ReadIfPresent(http, "connect_timeout_ms", result.http.connect_timeout_ms);
    ReadIfPresent(http, "request_timeout_ms", result.http.request_timeout_ms);
    ReadIfPresent(http, "buffer_capacity", result.buffer_capacity);
  }
  return result;
}

}  // namespace influxdb
}  // namespace tsink
