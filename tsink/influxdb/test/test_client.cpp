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

#include "tsink/influxdb/client.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "tsink/network/test/mock_http_server.hpp"

namespace tsink {
namespace influxdb {

namespace {

using network::test::CannedResponse;
using network::test::MockHttpServer;

constexpr auto kCreatedBody = "{\"results\":[{\"statement_id\":0}]}";

class InfluxDBClientTest : public ::testing::Test {
 protected:
  ConnectionConfig MakeConfig() const {
    ConnectionConfig config;
    config.connect_string = server_.Url();
    config.database = "kafka";
    config.tags = {{"env", "prod"}};
    return config;
  }

  static std::vector<Point> MakeBatch() {
    Point point("cpu");
    point.AddTag("host", "h1").AddField("value", 0.5).SetTimestamp(1000);
    return {point};
  }

  MockHttpServer server_;
};

}  // namespace

TEST_F(InfluxDBClientTest, CreatesDatabaseThenWrites) {
  server_.Enqueue(CannedResponse::Status(200, "OK", kCreatedBody));
  InfluxDBClient client(MakeConfig());
  ASSERT_TRUE(client.IsDatabaseReady());

  client.Write(MakeBatch());
  ASSERT_TRUE(server_.WaitForRequests(2));

  const auto requests = server_.GetRequests();
  ASSERT_EQ(requests.size(), 2U);
  ASSERT_EQ(requests[0].method, "GET");
  ASSERT_EQ(requests[0].target, "/query?q=CREATE+DATABASE+kafka");
  ASSERT_EQ(requests[0].headers.at("authorization"), "Basic cm9vdDpyb290");

  ASSERT_EQ(requests[1].method, "POST");
  ASSERT_EQ(requests[1].target, "/write?db=kafka&precision=ms");
  ASSERT_EQ(requests[1].body, "cpu,host=h1,env=prod value=0.5 1000\n");
  ASSERT_EQ(requests[1].headers.at("authorization"), "Basic cm9vdDpyb290");
}

TEST_F(InfluxDBClientTest, DatabaseIsCreatedOnlyOnce) {
  InfluxDBClient client(MakeConfig());
  ASSERT_TRUE(client.IsDatabaseReady());

  client.Write(MakeBatch());
  client.Write(MakeBatch());
  ASSERT_TRUE(server_.WaitForRequests(3));

  const auto requests = server_.GetRequests();
  ASSERT_EQ(requests.size(), 3U);
  ASSERT_EQ(requests[1].method, "POST");
  ASSERT_EQ(requests[2].method, "POST");
}

TEST_F(InfluxDBClientTest, RetriesDatabaseCreationOnWrite) {
  server_.Enqueue(CannedResponse::Drop());
  server_.Enqueue(CannedResponse::Status(200, "OK", kCreatedBody));
  InfluxDBClient client(MakeConfig());
  ASSERT_FALSE(client.IsDatabaseReady());

  client.Write(MakeBatch());
  ASSERT_TRUE(client.IsDatabaseReady());
  ASSERT_TRUE(server_.WaitForRequests(3));

  const auto requests = server_.GetRequests();
  ASSERT_EQ(requests[0].method, "GET");
  ASSERT_EQ(requests[1].method, "GET");
  ASSERT_EQ(requests[2].method, "POST");
  ASSERT_EQ(requests[2].body, "cpu,host=h1,env=prod value=0.5 1000\n");
}

TEST_F(InfluxDBClientTest, SkipsWriteWhileDatabaseCannotBeCreated) {
  server_.SetDefault(CannedResponse::Status(500, "Internal Server Error", "{\"error\":\"disk full\"}"));
  InfluxDBClient client(MakeConfig());
  ASSERT_FALSE(client.IsDatabaseReady());

  ASSERT_NO_THROW(client.Write(MakeBatch()));
  ASSERT_FALSE(client.IsDatabaseReady());

  // Both requests were creation attempts; the batch was dropped
  const auto requests = server_.GetRequests();
  ASSERT_EQ(requests.size(), 2U);
  ASSERT_EQ(requests[0].method, "GET");
  ASSERT_EQ(requests[1].method, "GET");
}

TEST_F(InfluxDBClientTest, WriteFailuresAreNotThrown) {
  server_.Enqueue(CannedResponse::Status(200, "OK", kCreatedBody));
  server_.Enqueue(CannedResponse::Status(400, "Bad Request", "{\"error\":\"partial write\"}"));
  InfluxDBClient client(MakeConfig());

  ASSERT_NO_THROW(client.Write(MakeBatch()));
  ASSERT_TRUE(server_.WaitForRequests(2));
  ASSERT_TRUE(client.IsDatabaseReady());
}

TEST_F(InfluxDBClientTest, EmptyBatchSendsEmptyBody) {
  InfluxDBClient client(MakeConfig());
  client.Write({});
  ASSERT_TRUE(server_.WaitForRequests(2));
  const auto requests = server_.GetRequests();
  ASSERT_EQ(requests[1].method, "POST");
  ASSERT_TRUE(requests[1].body.empty());
}

TEST_F(InfluxDBClientTest, PointsAreNotModified) {
  InfluxDBClient client(MakeConfig());
  const auto batch = MakeBatch();
  client.Write(batch);
  ASSERT_EQ(batch[0].GetTags().size(), 1U);
  ASSERT_FALSE(batch[0].HasTag("env"));
}

TEST_F(InfluxDBClientTest, InvalidPointThrowsAndSendsNothing) {
  InfluxDBClient client(MakeConfig());
  ASSERT_THROW(client.Write({Point("no_fields")}), std::invalid_argument);

  client.Write(MakeBatch());
  ASSERT_TRUE(server_.WaitForRequests(2));
  const auto requests = server_.GetRequests();
  ASSERT_EQ(requests.size(), 2U);
  ASSERT_EQ(requests[1].body, "cpu,host=h1,env=prod value=0.5 1000\n");
}

TEST_F(InfluxDBClientTest, WriteAfterCloseThrows) {
  InfluxDBClient client(MakeConfig());
  client.Close();
  ASSERT_THROW(client.Write(MakeBatch()), std::runtime_error);
}

TEST_F(InfluxDBClientTest, KeepsConfiguration) {
  InfluxDBClient client(MakeConfig());
  ASSERT_EQ(client.GetConfig().connect_string, server_.Url());
  ASSERT_EQ(client.GetConfig().database, "kafka");
}

}  // namespace influxdb
}  // namespace tsink
