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

#include "client.hpp"

#include <stdexcept>

#include "tsink/core/logging.hpp"
#include "tsink/network/basic_auth.hpp"

namespace tsink {
namespace influxdb {

using namespace tsink::core;

InfluxDBClient::InfluxDBClient(ConnectionConfig config)
    : config_{std::move(config)},
      credentials_{network::EncodeBasicCredentials(config_.username, config_.password)},
      http_{config_.http},
      encoder_{config_.buffer_capacity},
      initializer_{http_, config_, credentials_},
      dispatcher_{http_, config_, credentials_} {
  initializer_.EnsureDatabase();
}

InfluxDBClient::~InfluxDBClient() { Close(); }

void InfluxDBClient::Write(const std::vector<Point>& points) {
  if (http_.IsClosed()) {
    throw std::runtime_error("InfluxDBClient is closed");
  }
  if (!initializer_.IsReady() && !initializer_.EnsureDatabase()) {
    Log::Warn("Skipping write of {} points, InfluxDB database {} is not ready", points.size(), config_.database);
    return;
  }

  const auto payload = encoder_.Encode(points, config_.tags);
  dispatcher_.Dispatch(payload);
}

void InfluxDBClient::Close() { http_.Close(); }

}  // namespace influxdb
}  // namespace tsink
