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

#include "config.hpp"

#include <sstream>
#include <stdexcept>

#include "logging.hpp"

namespace tsink {
namespace core {

Config::Config(const std::string& file) : Config(YAML::LoadFile(file)) {}

Config::Config(const YAML::Node& root) : root_{root} {
  if (!root_.IsMap()) {
    throw std::invalid_argument("YAML root node must be a map");
  }
}

YAML::Node Config::operator[](const std::string& key) { return root_[key]; }

const YAML::Node Config::operator[](const std::string& key) const { return root_[key]; }

void Config::Overlay(const YAML::Node& overlay, bool verbose) { RecursiveOverlay(root_, overlay, verbose); }

void Config::Overlay(const std::string& raw_yaml, bool verbose) { Overlay(YAML::Load(raw_yaml), verbose); }

void Config::OverlayFromFile(const std::string& filename, bool verbose) {
  Overlay(YAML::LoadFile(filename), verbose);
}

void Config::RecursiveOverlay(YAML::Node base, const YAML::Node& overlay, bool verbose,
                              const std::string& key_prefix) {
  if (!overlay.IsMap()) {
    throw std::invalid_argument("Overlay YAML root node must be a map");
  }

  for (const auto& it : overlay) {
    const std::string key = it.first.as<std::string>();
    const YAML::Node value = it.second;
    const std::string full_key = key_prefix.empty() ? key : key_prefix + "." + key;
    const bool exists_in_base = static_cast<bool>(base[key]);

    if (exists_in_base && value.IsMap() && base[key].IsMap()) {
      RecursiveOverlay(base[key], value, verbose, full_key);
      continue;
    }

    // New branches are attached as-is, existing scalars and sequences are replaced
    if (exists_in_base && (base[key].Type() != value.Type())) {
      throw std::invalid_argument("Overlay key " + full_key + " does not match the base key type!");
    }
    base[key] = value;
    if (verbose) {
      std::stringstream value_str;
      value_str << value;
      Log::Info("Configuration overlay overwriting {} = {}", full_key, value_str.str());
    }
  }
}

}  // namespace core
}  // namespace tsink
