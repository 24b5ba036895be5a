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

#include "basic_auth.hpp"

#include <crypto++/base64.h>
#include <crypto++/filters.h>

namespace tsink {
namespace network {

std::string EncodeBasicCredentials(std::string_view username, std::string_view password) {
  std::string plain;
  plain.reserve(username.size() + password.size() + 1);
  plain.append(username.data(), username.size());
  plain += ':';
  plain.append(password.data(), password.size());

  std::string encoded;
  // No line breaks: the value must fit on one header line
  CryptoPP::StringSource source(plain, true,
                                new CryptoPP::Base64Encoder(new CryptoPP::StringSink(encoded), false));
  return encoded;
}

std::string BasicAuthorization(std::string_view credentials) {
  std::string value{"Basic "};
  value.append(credentials.data(), credentials.size());
  return value;
}

}  // namespace network
}  // namespace tsink
