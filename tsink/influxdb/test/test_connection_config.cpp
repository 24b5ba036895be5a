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

#include "tsink/influxdb/connection_config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace tsink {
namespace influxdb {

TEST(ConnectionConfigTests, Defaults) {
  const ConnectionConfig config;
  ASSERT_EQ(config.connect_string, "http://localhost:8086");
  ASSERT_EQ(config.database, "kafka");
  ASSERT_EQ(config.username, "root");
  ASSERT_EQ(config.password, "root");
  ASSERT_FALSE(config.retention_policy);
  ASSERT_FALSE(config.consistency);
  ASSERT_TRUE(config.tags.empty());
  ASSERT_EQ(config.http.connect_timeout_ms, 5000U);
  ASSERT_EQ(config.http.request_timeout_ms, 60000U);
  ASSERT_EQ(config.buffer_capacity, 64U * 1024U);
}

TEST(ConnectionConfigTests, MissingSectionKeepsDefaults) {
  const tsink::core::Config root(YAML::Load("logging:\n  level: info\n"));
  const auto config = ConnectionConfig::FromConfig(root);
  ASSERT_EQ(config.database, "kafka");
  ASSERT_EQ(config.connect_string, "http://localhost:8086");
}

TEST(ConnectionConfigTests, ReadsFullSection) {
  const tsink::core::Config root(YAML::Load(R"(
influxdb:
  connect_string: http://influx.internal:8086
  database: broker_metrics
  username: writer
  password: s3cret
  retention_policy: one_week
  consistency: all
  tags:
    cluster: main
    env: prod
    dc: eu-west
  http:
    connect_timeout_ms: 250
    request_timeout_ms: 0
    buffer_capacity: 4096
)"));
  const auto config = ConnectionConfig::FromConfig(root);

  ASSERT_EQ(config.connect_string, "http://influx.internal:8086");
  ASSERT_EQ(config.database, "broker_metrics");
  ASSERT_EQ(config.username, "writer");
  ASSERT_EQ(config.password, "s3cret");
  ASSERT_EQ(config.retention_policy.value_or(""), "one_week");
  ASSERT_EQ(config.consistency.value_or(""), "all");
  const Tags expected_tags{{"cluster", "main"}, {"env", "prod"}, {"dc", "eu-west"}};
  ASSERT_EQ(config.tags, expected_tags);
  ASSERT_EQ(config.http.connect_timeout_ms, 250U);
  ASSERT_EQ(config.http.request_timeout_ms, 0U);
  ASSERT_EQ(config.buffer_capacity, 4096U);
}

TEST(ConnectionConfigTests, EmptyOptionalsAreUnset) {
  const tsink::core::Config root(YAML::Load("influxdb:\n  retention_policy: \"\"\n  consistency: ~\n"));
  const auto config = ConnectionConfig::FromConfig(root);
  ASSERT_FALSE(config.retention_policy);
  ASSERT_FALSE(config.consistency);
}

TEST(ConnectionConfigTests, InvalidValuesThrow) {
  ASSERT_THROW(ConnectionConfig::FromConfig(tsink::core::Config(YAML::Load("influxdb:\n  database: \"\"\n"))),
               std::invalid_argument);
  ASSERT_THROW(ConnectionConfig::FromConfig(tsink::core::Config(YAML::Load("influxdb:\n  tags: [a, b]\n"))),
               std::invalid_argument);
  ASSERT_THROW(
      ConnectionConfig::FromConfig(tsink::core::Config(YAML::Load("influxdb:\n  http:\n    connect_timeout_ms: soon\n"))),
      YAML::Exception);
}

}  // namespace influxdb
}  // namespace tsink
