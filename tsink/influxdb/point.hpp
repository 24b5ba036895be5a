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

#ifndef TSINK_INFLUXDB_POINT_HPP
#define TSINK_INFLUXDB_POINT_HPP

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tsink {
namespace influxdb {

/// Tag set in the order tags are rendered
using Tags = std::vector<std::pair<std::string, std::string>>;

using FieldValue = std::variant<double, int64_t, bool, std::string>;
using Fields = std::vector<std::pair<std::string, FieldValue>>;

/**
 * @brief A single measurement observation: measurement name, tags, fields and an optional timestamp
 *
 * Rendering follows the InfluxDB line protocol:
 *
 *   measurement[,tag=value...] field=value[,field=value...] [timestamp]
 *
 * Tags are rendered in insertion order. Tags with an empty value are dropped, since the protocol has no way to write
 * them. Timestamps are in milliseconds, matching the `precision=ms` the client writes with.
 */
class Point {
 public:
  explicit Point(std::string measurement);

  /**
   * @brief Set a tag, replacing the value if the key is already present
   */
  Point& AddTag(std::string key, std::string value);

  /**
   * @brief Merge additional tags into this point
   *
   * Keys the point already has keep their value; new keys are appended in the given order.
   */
  Point& AddTags(const Tags& tags);

  /**
   * @brief Set a field, replacing the value if the key is already present
   */
  Point& AddField(std::string key, FieldValue value);

  /**
   * @brief Set a field from a plain value: integers are stored as int64_t, floating point as double, anything else
   * convertible to a string as a string field
   */
  template <typename T>
  Point& AddField(std::string key, T value) {
    if constexpr (std::is_same_v<T, bool>) {
      return AddField(std::move(key), FieldValue{std::in_place_type<bool>, value});
    } else if constexpr (std::is_integral_v<T>) {
      return AddField(std::move(key), FieldValue{std::in_place_type<int64_t>, static_cast<int64_t>(value)});
    } else if constexpr (std::is_floating_point_v<T>) {
      return AddField(std::move(key), FieldValue{std::in_place_type<double>, static_cast<double>(value)});
    } else {
      return AddField(std::move(key), FieldValue{std::in_place_type<std::string>, std::string(std::move(value))});
    }
  }

  Point& SetTimestamp(int64_t timestamp_ms);

  const std::string& GetMeasurement() const { return measurement_; }
  const Tags& GetTags() const { return tags_; }
  const Fields& GetFields() const { return fields_; }
  const std::optional<int64_t>& GetTimestamp() const { return timestamp_ms_; }

  bool HasTag(const std::string& key) const;

  /**
   * @brief Render the point as one line of line protocol, without a trailing newline
   *
   * @throws std::invalid_argument if the point cannot be expressed in line protocol
   */
  std::string AsLineProtocol() const;

  /**
   * @brief Append the line protocol for this point to the given buffer, merging in extra tags
   *
   * The extra tags are rendered after the point's own tags and are skipped for keys the point already has. The point
   * itself is not modified. Nothing is appended if the point is invalid.
   *
   * @param out the buffer to append to
   * @param extra_tags tags to merge into the rendered line
   * @throws std::invalid_argument if the measurement or a key is empty, there are no fields, a float field is not
   * finite, or any name, key or string value (extra tags included) contains a CR or LF
   */
  void AppendLineProtocol(fmt::memory_buffer& out, const Tags& extra_tags = {}) const;

 private:
  void Validate() const;

  std::string measurement_;
  Tags tags_;
  Fields fields_;
  std::optional<int64_t> timestamp_ms_;
};

}  // namespace influxdb
}  // namespace tsink

#endif  // TSINK_INFLUXDB_POINT_HPP
