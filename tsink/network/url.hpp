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

#ifndef TSINK_NETWORK_URL_HPP
#define TSINK_NETWORK_URL_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace tsink {
namespace network {

/**
 * @brief An absolute `http://` URL split into the parts needed to open a connection and write a request line.
 */
struct Url {
  static constexpr uint16_t kDefaultHttpPort = 80;

  std::string scheme;
  std::string host;
  uint16_t port{kDefaultHttpPort};
  std::string path;  ///< Always begins with '/', never ends with '/' unless it is exactly "/"

  /**
   * @brief Parse an absolute URL such as `http://localhost:8086` or `http://proxy/influx/`.
   *
   * Only the `http` scheme is accepted. Query strings, fragments and user info are rejected since connect strings
   * never carry them.
   *
   * @param text the URL text
   * @return the parsed URL
   * @throws std::invalid_argument if the text is not a supported URL
   */
  static Url Parse(std::string_view text);

  /**
   * @brief Return a copy of this URL with the given path segment appended (e.g. "/write").
   */
  Url Join(std::string_view segment) const;

  /**
   * @brief The value for the Host header: the host, followed by the port if it is not the default.
   */
  std::string Authority() const;

  std::string ToString() const;
};

/**
 * @brief Encode a query string component using application/x-www-form-urlencoded rules.
 *
 * Unreserved characters pass through, a space becomes '+', anything else is percent-encoded.
 */
std::string FormEncode(std::string_view value);

}  // namespace network
}  // namespace tsink

#endif  // TSINK_NETWORK_URL_HPP
