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

#include "write_dispatcher.hpp"

#include <memory>

#include "tsink/core/logging.hpp"
#include "tsink/influxdb/response_classifier.hpp"
#include "tsink/network/basic_auth.hpp"

namespace tsink {
namespace influxdb {

using namespace tsink::core;

WriteDispatcher::WriteDispatcher(network::HttpClient& http, const ConnectionConfig& config, std::string credentials)
    : http_{http}, config_{config}, credentials_{std::move(credentials)} {}

network::HttpRequest WriteDispatcher::BuildRequest(const ConnectionConfig& config, const std::string& credentials,
                                                   std::string_view payload) {
  network::HttpRequest request("POST", network::Url::Parse(config.connect_string).Join("/write"));
  request.AddQueryParam("db", config.database);
  request.AddQueryParam("precision", "ms");
  if (config.retention_policy) {
    request.AddQueryParam("rp", *config.retention_policy);
  }
  if (config.consistency) {
    request.AddQueryParam("consistency", *config.consistency);
  }
  request.AddHeader("Authorization", network::BasicAuthorization(credentials));
  request.AddHeader("Content-Type", "text/plain; charset=utf-8");
  request.SetBody(payload);
  return request;
}

void WriteDispatcher::Dispatch(std::string_view payload) {
  // Fire-and-forget; the classifier logs failures
  http_.Execute(BuildRequest(config_, credentials_, payload), std::make_shared<ResponseClassifier>());
  Log::Debug("Submitted {} byte write to InfluxDB database {}", payload.size(), config_.database);
}

}  // namespace influxdb
}  // namespace tsink
