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

#include "url.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace tsink {
namespace network {

namespace {

std::string ToLower(std::string_view s) {
  std::string out{s};
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

bool IsUnreserved(unsigned char c) { return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~'; }

}  // namespace

Url Url::Parse(std::string_view text) {
  const auto scheme_end = text.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    throw std::invalid_argument(fmt::format("URL '{}' has no scheme", text));
  }

  Url url;
  url.scheme = ToLower(text.substr(0, scheme_end));
  if (url.scheme != "http") {
    throw std::invalid_argument(fmt::format("URL '{}' has unsupported scheme '{}'", text, url.scheme));
  }

  std::string_view rest = text.substr(scheme_end + 3);
  if (rest.find_first_of("?#@") != std::string_view::npos) {
    throw std::invalid_argument(fmt::format("URL '{}' must not contain a query, fragment or user info", text));
  }

  const auto path_begin = rest.find('/');
  const std::string_view authority = rest.substr(0, path_begin);
  const std::string_view path = path_begin == std::string_view::npos ? std::string_view{} : rest.substr(path_begin);

  const auto colon = authority.rfind(':');
  const std::string_view host = authority.substr(0, colon);
  if (host.empty()) {
    throw std::invalid_argument(fmt::format("URL '{}' has no host", text));
  }
  if (host.find_first_of(" \t\r\n:") != std::string_view::npos) {
    throw std::invalid_argument(fmt::format("URL '{}' has an invalid host", text));
  }
  url.host = std::string{host};

  if (colon != std::string_view::npos) {
    const std::string_view port_text = authority.substr(colon + 1);
    unsigned port = 0;
    const auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (port_text.empty() || ec != std::errc{} || end != port_text.data() + port_text.size() || port == 0 ||
        port > 65535) {
      throw std::invalid_argument(fmt::format("URL '{}' has an invalid port", text));
    }
    url.port = static_cast<uint16_t>(port);
  }

  if (path.find_first_of(" \t\r\n") != std::string_view::npos) {
    throw std::invalid_argument(fmt::format("URL '{}' has an invalid path", text));
  }
  url.path = std::string{path};
  while (url.path.size() > 1 && url.path.back() == '/') {
    url.path.pop_back();
  }
  if (url.path.empty()) {
    url.path = "/";
  }
  return url;
}

Url Url::Join(std::string_view segment) const {
  Url joined{*this};
  if (joined.path == "/") {
    joined.path.clear();
  }
  if (segment.empty() || segment.front() != '/') {
    joined.path += '/';
  }
  joined.path += segment;
  return joined;
}

std::string Url::Authority() const {
  if (port == kDefaultHttpPort) {
    return host;
  }
  return fmt::format("{}:{}", host, port);
}

std::string Url::ToString() const { return fmt::format("{}://{}{}", scheme, Authority(), path); }

std::string FormEncode(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    const auto c = static_cast<unsigned char>(ch);
    if (IsUnreserved(c)) {
      out += ch;
    } else if (c == ' ') {
      out += '+';
    } else {
      out += fmt::format("%{:02X}", c);
    }
  }
  return out;
}

}  // namespace network
}  // namespace tsink
