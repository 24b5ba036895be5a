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

#ifndef TSINK_INFLUXDB_RESPONSE_CLASSIFIER_HPP
#define TSINK_INFLUXDB_RESPONSE_CLASSIFIER_HPP

#include <atomic>
#include <future>
#include <string>

#include "tsink/network/response_handler.hpp"

namespace tsink {
namespace influxdb {

/**
 * @brief Classifies the outcome of one InfluxDB request
 *
 * State machine:
 *
 *   kSubmitted --status--> kStatusReceived --complete--> kCompleted | kFailed
 *   kSubmitted --complete--> kCompleted
 *   any non-final state --transport error--> kFailed
 *
 * Status 200 and 204 are successes. Any other status, and any transport error, is logged once as a warning and
 * resolves the outcome to false. A completion without a status resolves to true. Failures are never rethrown; the
 * outcome future is the only way to observe them besides the log.
 */
class ResponseClassifier : public network::ResponseHandler {
 public:
  enum class State { kSubmitted = 0, kStatusReceived, kCompleted, kFailed };

  ResponseClassifier() = default;

  static bool IsSuccessStatus(int status_code) { return status_code == 200 || status_code == 204; }

  /**
   * @brief Future for the boolean outcome; may be retrieved once
   *
   * @throws std::future_error if called more than once
   */
  std::future<bool> GetOutcome() { return outcome_.get_future(); }

  State GetState() const { return state_.load(); }

  Action OnStatusReceived(const network::ResponseStatus& status) override;
  Action OnHeadersReceived(const network::ResponseHeaders& headers) override;
  Action OnBodyPartReceived(std::string_view part) override;
  void OnCompleted() override;
  void OnTransportError(const std::string& what) override;

 private:
  void Resolve(State final_state, bool outcome);

  std::atomic<State> state_{State::kSubmitted};
  bool status_ok_{true};
  bool resolved_{false};
  std::promise<bool> outcome_;
};

}  // namespace influxdb
}  // namespace tsink

#endif  // TSINK_INFLUXDB_RESPONSE_CLASSIFIER_HPP
