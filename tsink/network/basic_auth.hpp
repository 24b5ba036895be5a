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

#ifndef TSINK_NETWORK_BASIC_AUTH_HPP
#define TSINK_NETWORK_BASIC_AUTH_HPP

#include <string>
#include <string_view>

namespace tsink {
namespace network {

/**
 * @brief Encode `username:password` as the credential part of an HTTP Basic Authorization header
 *
 * @return the Base64 text, without the "Basic " scheme prefix
 */
std::string EncodeBasicCredentials(std::string_view username, std::string_view password);

/**
 * @brief Build the full Authorization header value ("Basic <credentials>")
 */
std::string BasicAuthorization(std::string_view credentials);

}  // namespace network
}  // namespace tsink

#endif  // TSINK_NETWORK_BASIC_AUTH_HPP
