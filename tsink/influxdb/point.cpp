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

#include "point.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace tsink {
namespace influxdb {

namespace {

template <typename Container>
auto FindKey(Container& container, const std::string& key) {
  return std::find_if(container.begin(), container.end(), [&key](const auto& item) { return item.first == key; });
}

// Backslash-escape every character of `special` in `text`
void AppendEscaped(fmt::memory_buffer& out, std::string_view text, std::string_view special) {
  for (const char c : text) {
    if (special.find(c) != std::string_view::npos) {
      out.push_back('\\');
    }
    out.push_back(c);
  }
}

void AppendMeasurement(fmt::memory_buffer& out, std::string_view measurement) {
  AppendEscaped(out, measurement, ", ");
}

void AppendKey(fmt::memory_buffer& out, std::string_view key) { AppendEscaped(out, key, ",= "); }

void AppendTag(fmt::memory_buffer& out, const std::pair<std::string, std::string>& tag) {
  if (tag.second.empty()) {
    return;
  }
  out.push_back(',');
  AppendKey(out, tag.first);
  out.push_back('=');
  AppendKey(out, tag.second);
}

void AppendFieldValue(fmt::memory_buffer& out, const FieldValue& value) {
  auto it = std::back_inserter(out);
  if (const auto* d = std::get_if<double>(&value)) {
    fmt::format_to(it, "{}", *d);
  } else if (const auto* i = std::get_if<int64_t>(&value)) {
    fmt::format_to(it, "{}i", *i);
  } else if (const auto* b = std::get_if<bool>(&value)) {
    fmt::format_to(it, "{}", *b ? "true" : "false");
  } else {
    out.push_back('"');
    AppendEscaped(out, std::get<std::string>(value), "\"\\");
    out.push_back('"');
  }
}

// Line protocol has no escape for line breaks; a raw one would split the record
void CheckNoLineBreak(const std::string& measurement, std::string_view what, std::string_view text) {
  if (text.find_first_of("\r\n") != std::string_view::npos) {
    throw std::invalid_argument(fmt::format("Point '{}' {} contains a line break", measurement, what));
  }
}

void ValidateTags(const std::string& measurement, const Tags& tags) {
  for (const auto& [key, value] : tags) {
    if (key.empty()) {
      throw std::invalid_argument(fmt::format("Point '{}' has a tag with an empty key", measurement));
    }
    CheckNoLineBreak(measurement, fmt::format("tag key '{}'", key), key);
    CheckNoLineBreak(measurement, fmt::format("tag '{}' value", key), value);
  }
}

}  // namespace

Point::Point(std::string measurement) : measurement_{std::move(measurement)} {}

Point& Point::AddTag(std::string key, std::string value) {
  auto it = FindKey(tags_, key);
  if (it != tags_.end()) {
    it->second = std::move(value);
  } else {
    tags_.emplace_back(std::move(key), std::move(value));
  }
  return *this;
}

Point& Point::AddTags(const Tags& tags) {
  for (const auto& tag : tags) {
    if (!HasTag(tag.first)) {
      tags_.push_back(tag);
    }
  }
  return *this;
}

Point& Point::AddField(std::string key, FieldValue value) {
  auto it = FindKey(fields_, key);
  if (it != fields_.end()) {
    it->second = std::move(value);
  } else {
    fields_.emplace_back(std::move(key), std::move(value));
  }
  return *this;
}

Point& Point::SetTimestamp(int64_t timestamp_ms) {
  timestamp_ms_ = timestamp_ms;
  return *this;
}

bool Point::HasTag(const std::string& key) const { return FindKey(tags_, key) != tags_.end(); }

std::string Point::AsLineProtocol() const {
  fmt::memory_buffer out;
  AppendLineProtocol(out);
  return fmt::to_string(out);
}

void Point::Validate() const {
  if (measurement_.empty()) {
    throw std::invalid_argument("Point has an empty measurement name");
  }
  CheckNoLineBreak(measurement_, "measurement name", measurement_);
  ValidateTags(measurement_, tags_);
  if (fields_.empty()) {
    throw std::invalid_argument(fmt::format("Point '{}' has no fields", measurement_));
  }
  for (const auto& [key, value] : fields_) {
    if (key.empty()) {
      throw std::invalid_argument(fmt::format("Point '{}' has a field with an empty key", measurement_));
    }
    CheckNoLineBreak(measurement_, fmt::format("field key '{}'", key), key);
    if (const auto* d = std::get_if<double>(&value); d && !std::isfinite(*d)) {
      throw std::invalid_argument(fmt::format("Point '{}' field '{}' is not a finite number", measurement_, key));
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
      CheckNoLineBreak(measurement_, fmt::format("field '{}' value", key), *text);
    }
  }
}

void Point::AppendLineProtocol(fmt::memory_buffer& out, const Tags& extra_tags) const {
  Validate();
  ValidateTags(measurement_, extra_tags);

  AppendMeasurement(out, measurement_);
  for (const auto& tag : tags_) {
    AppendTag(out, tag);
  }
  for (const auto& tag : extra_tags) {
    if (!HasTag(tag.first)) {
      AppendTag(out, tag);
    }
  }

  char separator = ' ';
  for (const auto& [key, value] : fields_) {
    out.push_back(separator);
    AppendKey(out, key);
    out.push_back('=');
    AppendFieldValue(out, value);
    separator = ',';
  }

  if (timestamp_ms_) {
    fmt::format_to(std::back_inserter(out), " {}", *timestamp_ms_);
  }
}

}  // namespace influxdb
}  // namespace tsink
