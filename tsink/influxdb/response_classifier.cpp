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

#include "response_classifier.hpp"

#include "tsink/core/logging.hpp"

namespace tsink {
namespace influxdb {

using namespace tsink::core;

ResponseClassifier::Action ResponseClassifier::OnStatusReceived(const network::ResponseStatus& status) {
  if (resolved_) {
    return Action::kAbort;
  }
  state_ = State::kStatusReceived;
  if (!IsSuccessStatus(status.code)) {
    status_ok_ = false;
    Log::Warn("Unexpected response status from InfluxDB '{}' - '{}' Uri: {}", status.code, status.text, status.uri);
  }
  return Action::kContinue;
}

ResponseClassifier::Action ResponseClassifier::OnHeadersReceived(const network::ResponseHeaders&) {
  return Action::kContinue;
}

ResponseClassifier::Action ResponseClassifier::OnBodyPartReceived(std::string_view) { return Action::kContinue; }

void ResponseClassifier::OnCompleted() { Resolve(status_ok_ ? State::kCompleted : State::kFailed, status_ok_); }

void ResponseClassifier::OnTransportError(const std::string& what) {
  if (resolved_) {
    return;
  }
  // A failed status already produced this exchange's warning
  if (status_ok_) {
    Log::Warn("Cannot establish connection to InfluxDB: {}", what);
  }
  Resolve(State::kFailed, false);
}

void ResponseClassifier::Resolve(State final_state, bool outcome) {
  if (resolved_) {
    return;
  }
  resolved_ = true;
  state_ = final_state;
  outcome_.set_value(outcome);
}

}  // namespace influxdb
}  // namespace tsink
