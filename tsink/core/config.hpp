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

#ifndef TSINK_CORE_CONFIG_HPP
#define TSINK_CORE_CONFIG_HPP

#include <string>

#include "yaml-cpp/yaml.h"

namespace tsink {
namespace core {

/**
 * Config holds the YAML configuration tree for the client and its tools
 *
 * Sections are looked up by key, e.g. `config["influxdb"]["database"]`. A base file can be refined by overlays, which
 * is how command line tools layer per-deployment settings on top of a shared file.
 */
class Config {
 public:
  /**
   * Default construct an empty config object
   */
  Config() = default;

  /*
   * Construct a config object from the contents of a YAML file
   *
   * @param file the file path to read from
   * @throws YAML::BadFile on error
   * @throws std::invalid_argument if the root is not a map
   */
  explicit Config(const std::string& file);

  /*
   * Construct a config object based on the given YAML node
   *
   * @param root the YAML node that represents the root of the configuration
   * @throws std::invalid_argument if the root is not a map
   */
  explicit Config(const YAML::Node& root);

  /**
   * Retrieve a child node via the given key
   * @param key a string representing the key name
   * @return the YAML node at the key
   */
  YAML::Node operator[](const std::string& key);

  /**
   * Retrieve a child node via the given key (const)
   * @param key a string representing the key name
   * @return the YAML node at the key
   */
  const YAML::Node operator[](const std::string& key) const;

  /**
   * Root get the root YAML node
   * @return the YAML node pointing to the root of the structure
   */
  const YAML::Node& Root() const { return root_; }

  /**
   * Overlay the given node on top of the existing configuration
   *
   * Maps are merged key by key. Scalars and sequences in the overlay replace the base value. A key that exists in both
   * trees must keep its node type.
   *
   * @param overlay root of YAML node to overlay
   * @param verbose log every overwritten key
   * @throws std::invalid_argument if the overlay is not a map or a key changes type
   */
  void Overlay(const YAML::Node& overlay, bool verbose = false);

  /**
   * Overlay the given config tree as a YAML string on top of the existing configuration
   *
   * @see Overlay(const YAML::Node&, bool)
   */
  void Overlay(const std::string& raw_yaml, bool verbose = false);

  /**
   * Overlay the config tree from the given file
   *
   * @see Overlay(const YAML::Node&, bool)
   */
  void OverlayFromFile(const std::string& filename, bool verbose = false);

 private:
  static void RecursiveOverlay(YAML::Node base, const YAML::Node& overlay, bool verbose,
                               const std::string& key_prefix = "");
  YAML::Node root_{YAML::NodeType::Map};
};

}  // namespace core
}  // namespace tsink

#endif  // TSINK_CORE_CONFIG_HPP
