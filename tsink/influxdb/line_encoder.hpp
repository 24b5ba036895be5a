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

#ifndef TSINK_INFLUXDB_LINE_ENCODER_HPP
#define TSINK_INFLUXDB_LINE_ENCODER_HPP

#include <fmt/format.h>

#include <cstddef>
#include <string_view>
#include <vector>

#include "tsink/influxdb/point.hpp"

namespace tsink {
namespace influxdb {

/**
 * @brief Serializes batches of points into a line protocol payload, reusing one buffer across calls
 *
 * The buffer keeps its capacity between calls, so steady-state encoding does not allocate. It grows if a batch does
 * not fit.
 *
 * Single writer: the view returned by Encode() refers to the encoder's storage and is invalidated by the next call.
 * Callers must consume it (the HTTP client copies it while submitting a request) before encoding again.
 */
class LineEncoder {
 public:
  explicit LineEncoder(std::size_t capacity);

  LineEncoder(const LineEncoder&) = delete;
  LineEncoder& operator=(const LineEncoder&) = delete;

  /**
   * @brief Encode one line per point, each terminated by '\n'
   *
   * Default tags are merged into each rendered line without modifying the points; a point's own tag wins over a
   * default tag with the same key.
   *
   * @param points the batch, possibly empty
   * @param default_tags tags to add to every point
   * @return a view of exactly the bytes encoded by this call
   * @throws std::invalid_argument if a point cannot be encoded; the buffer is left empty
   */
  std::string_view Encode(const std::vector<Point>& points, const Tags& default_tags);

  std::size_t Capacity() const { return buffer_.capacity(); }

  /**
   * @brief Size of the most recent payload
   */
  std::size_t Size() const { return buffer_.size(); }

 private:
  fmt::memory_buffer buffer_;
};

}  // namespace influxdb
}  // namespace tsink

#endif  // TSINK_INFLUXDB_LINE_ENCODER_HPP
