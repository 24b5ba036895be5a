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

#include "http_request.hpp"

#include <fmt/core.h>

#include <stdexcept>

namespace tsink {
namespace network {

namespace {
bool HasLineBreak(std::string_view s) { return s.find_first_of("\r\n") != std::string_view::npos; }
}  // namespace

HttpRequest::HttpRequest(std::string method, Url url) : method_{std::move(method)}, url_{std::move(url)} {
  if (method_.empty() || method_.find_first_of(" \r\n") != std::string::npos) {
    throw std::invalid_argument(fmt::format("Invalid HTTP method '{}'", method_));
  }
}

HttpRequest& HttpRequest::AddQueryParam(std::string name, std::string value) {
  query_.emplace_back(std::move(name), std::move(value));
  return *this;
}

HttpRequest& HttpRequest::AddHeader(std::string name, std::string value) {
  if (name.empty() || name.find(':') != std::string::npos || HasLineBreak(name) || HasLineBreak(value)) {
    throw std::invalid_argument(fmt::format("Invalid HTTP header '{}'", name));
  }
  headers_.emplace_back(std::move(name), std::move(value));
  return *this;
}

HttpRequest& HttpRequest::SetBody(std::string_view body) {
  body_ = body;
  return *this;
}

std::string HttpRequest::Target() const {
  std::string target = url_.path;
  char separator = '?';
  for (const auto& [name, value] : query_) {
    target += separator;
    target += FormEncode(name);
    target += '=';
    target += FormEncode(value);
    separator = '&';
  }
  return target;
}

std::string HttpRequest::Uri() const { return fmt::format("{}://{}{}", url_.scheme, url_.Authority(), Target()); }

}  // namespace network
}  // namespace tsink
