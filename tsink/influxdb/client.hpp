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

#ifndef TSINK_INFLUXDB_CLIENT_HPP
#define TSINK_INFLUXDB_CLIENT_HPP

#include <string>
#include <vector>

#include "tsink/influxdb/connection_config.hpp"
#include "tsink/influxdb/database_initializer.hpp"
#include "tsink/influxdb/line_encoder.hpp"
#include "tsink/influxdb/point.hpp"
#include "tsink/influxdb/write_dispatcher.hpp"
#include "tsink/network/http_client.hpp"

namespace tsink {
namespace influxdb {

/**
 * @brief Publishes batches of points to an InfluxDB database
 *
 * Construction creates the database (blocking, see DatabaseInitializer). A failure there is logged and the client is
 * still usable: every Write() retries the creation until it has succeeded once, and skips the batch if it still
 * fails.
 *
 * Write() is fire-and-forget. It returns once the request has been handed to the HTTP client; the response is
 * classified and logged on the HTTP client's I/O thread. Only failures before that hand-off (a point that cannot be
 * encoded, a malformed connect string, a closed client) are thrown to the caller.
 *
 * Not thread-safe: Write() reuses one serialization buffer, so calls must be serialized by the caller.
 */
class InfluxDBClient {
 public:
  explicit InfluxDBClient(ConnectionConfig config);
  ~InfluxDBClient();

  InfluxDBClient(const InfluxDBClient&) = delete;
  InfluxDBClient& operator=(const InfluxDBClient&) = delete;

  /**
   * @brief Write a batch of points
   *
   * The points are read only during the call and are not modified.
   *
   * @throws std::invalid_argument if a point cannot be encoded or the connect string is malformed
   * @throws std::runtime_error if the client has been closed
   */
  void Write(const std::vector<Point>& points);

  bool IsDatabaseReady() const { return initializer_.IsReady(); }

  const ConnectionConfig& GetConfig() const { return config_; }

  /**
   * @brief Close the HTTP transport; writes still in flight are abandoned
   */
  void Close();

 private:
  const ConnectionConfig config_;
  const std::string credentials_;
  network::HttpClient http_;
  LineEncoder encoder_;
  DatabaseInitializer initializer_;
  WriteDispatcher dispatcher_;
};

}  // namespace influxdb
}  // namespace tsink

#endif  // TSINK_INFLUXDB_CLIENT_HPP
