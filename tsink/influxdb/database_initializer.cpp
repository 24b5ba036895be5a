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

#include "database_initializer.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <memory>

#include "tsink/core/logging.hpp"
#include "tsink/influxdb/response_classifier.hpp"
#include "tsink/network/basic_auth.hpp"

namespace tsink {
namespace influxdb {

using namespace tsink::core;

std::string QuoteIdentifier(const std::string& identifier) {
  const bool plain =
      !identifier.empty() && !std::isdigit(static_cast<unsigned char>(identifier.front())) &&
      std::all_of(identifier.begin(), identifier.end(),
                  [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; });
  if (plain) {
    return identifier;
  }
  std::string quoted{"\""};
  for (const char c : identifier) {
    if (c == '"' || c == '\\') {
      quoted += '\\';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

DatabaseInitializer::DatabaseInitializer(network::HttpClient& http, const ConnectionConfig& config,
                                         std::string credentials)
    : http_{http}, config_{config}, credentials_{std::move(credentials)} {}

network::HttpRequest DatabaseInitializer::BuildRequest(const ConnectionConfig& config, const std::string& credentials) {
  network::HttpRequest request("GET", network::Url::Parse(config.connect_string).Join("/query"));
  request.AddQueryParam("q", "CREATE DATABASE " + QuoteIdentifier(config.database));
  request.AddHeader("Authorization", network::BasicAuthorization(credentials));
  return request;
}

bool DatabaseInitializer::EnsureDatabase() {
  Log::Info("Attempt to create InfluxDB database {}", config_.database);
  const bool succeeded = Attempt();
  state_ = Transition(state_, succeeded);
  if (succeeded) {
    Log::Debug("InfluxDB database {} is ready", config_.database);
  }
  return IsReady();
}

bool DatabaseInitializer::Attempt() {
  try {
    auto classifier = std::make_shared<ResponseClassifier>();
    std::future<bool> outcome = classifier->GetOutcome();
    http_.Execute(BuildRequest(config_, credentials_), classifier);
    if (!outcome.get()) {
      Log::Error("Cannot create database {}, the request did not succeed", config_.database);
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    Log::Error("Cannot create database {}, error: {}", config_.database, e.what());
  }
  return false;
}

}  // namespace influxdb
}  // namespace tsink
