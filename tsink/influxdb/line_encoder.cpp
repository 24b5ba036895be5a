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

#include "line_encoder.hpp"

#include <stdexcept>

namespace tsink {
namespace influxdb {

LineEncoder::LineEncoder(std::size_t capacity) { buffer_.reserve(capacity); }

std::string_view LineEncoder::Encode(const std::vector<Point>& points, const Tags& default_tags) {
  buffer_.clear();
  try {
    for (const auto& point : points) {
      point.AppendLineProtocol(buffer_, default_tags);
      buffer_.push_back('\n');
    }
  } catch (const std::invalid_argument&) {
    buffer_.clear();
    throw;
  }
  return {buffer_.data(), buffer_.size()};
}

}  // namespace influxdb
}  // namespace tsink
