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

#ifndef TSINK_INFLUXDB_WRITE_DISPATCHER_HPP
#define TSINK_INFLUXDB_WRITE_DISPATCHER_HPP

#include <string>
#include <string_view>

#include "tsink/influxdb/connection_config.hpp"
#include "tsink/network/http_client.hpp"
#include "tsink/network/http_request.hpp"

namespace tsink {
namespace influxdb {

/**
 * @brief Sends line protocol payloads to the `/write` endpoint without waiting for the response
 *
 * Each request gets its own ResponseClassifier, which logs delivery failures on the HTTP client's I/O thread. The
 * outcome is not reported back to the caller.
 */
class WriteDispatcher {
 public:
  /**
   * @param http transport used to send requests; must outlive the dispatcher
   * @param config connection settings; must outlive the dispatcher
   * @param credentials Base64 basic-auth credentials
   */
  WriteDispatcher(network::HttpClient& http, const ConnectionConfig& config, std::string credentials);

  /**
   * @brief Submit one write request carrying the payload
   *
   * The payload is copied into the request before this returns.
   *
   * @throws std::invalid_argument if the connect string is malformed
   * @throws std::runtime_error if the HTTP client is closed
   */
  void Dispatch(std::string_view payload);

  /**
   * @brief Build the write request:
   * `POST {connect}/write?db={database}&precision=ms[&rp={retention}][&consistency={level}]`
   *
   * @throws std::invalid_argument if the connect string is malformed
   */
  static network::HttpRequest BuildRequest(const ConnectionConfig& config, const std::string& credentials,
                                           std::string_view payload);

 private:
  network::HttpClient& http_;
  const ConnectionConfig& config_;
  const std::string credentials_;
};

}  // namespace influxdb
}  // namespace tsink

#endif  // TSINK_INFLUXDB_WRITE_DISPATCHER_HPP
