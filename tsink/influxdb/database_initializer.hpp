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

#ifndef TSINK_INFLUXDB_DATABASE_INITIALIZER_HPP
#define TSINK_INFLUXDB_DATABASE_INITIALIZER_HPP

#include <string>

#include "tsink/influxdb/connection_config.hpp"
#include "tsink/network/http_client.hpp"
#include "tsink/network/http_request.hpp"

namespace tsink {
namespace influxdb {

/**
 * @brief Creates the target database and remembers once that has succeeded
 *
 * `CREATE DATABASE` is idempotent on the server, so the request may be repeated safely. The ready state only saves
 * repeating it once a success has been observed: it starts at kNotReady, becomes kReady on the first successful
 * attempt, and never goes back.
 */
class DatabaseInitializer {
 public:
  enum class State { kNotReady = 0, kReady };

  /**
   * @param http transport used to send the request; must outlive the initializer
   * @param config connection settings; must outlive the initializer
   * @param credentials Base64 basic-auth credentials
   */
  DatabaseInitializer(network::HttpClient& http, const ConnectionConfig& config, std::string credentials);

  /**
   * @brief Send `CREATE DATABASE` and block until its outcome is known
   *
   * Failures (malformed connect string, transport error, non-success status) are logged and leave the state as it
   * was. Never throws.
   *
   * @return true if the state is kReady after the attempt
   */
  bool EnsureDatabase();

  State GetState() const { return state_; }
  bool IsReady() const { return state_ == State::kReady; }

  /**
   * @brief The state after an attempt that did or did not succeed
   */
  static State Transition(State current, bool attempt_succeeded) {
    return (current == State::kReady || attempt_succeeded) ? State::kReady : State::kNotReady;
  }

  /**
   * @brief Build the `CREATE DATABASE` request for the given settings
   *
   * @throws std::invalid_argument if the connect string is malformed
   */
  static network::HttpRequest BuildRequest(const ConnectionConfig& config, const std::string& credentials);

 private:
  bool Attempt();

  network::HttpClient& http_;
  const ConnectionConfig& config_;
  const std::string credentials_;
  State state_{State::kNotReady};
};

/**
 * @brief Quote an InfluxQL identifier if it is not a plain `[A-Za-z_][A-Za-z0-9_]*` name
 */
std::string QuoteIdentifier(const std::string& identifier);

}  // namespace influxdb
}  // namespace tsink

#endif  // TSINK_INFLUXDB_DATABASE_INITIALIZER_HPP
