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

#ifndef TSINK_NETWORK_RESPONSE_HANDLER_HPP
#define TSINK_NETWORK_RESPONSE_HANDLER_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tsink {
namespace network {

/**
 * @brief The status line of a response together with the URI of the request it answers
 */
struct ResponseStatus {
  int code{0};
  std::string text;
  std::string uri;
};

using ResponseHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Observer for a single HTTP exchange
 *
 * Events arrive on the HTTP client's I/O thread in this order: OnStatusReceived, OnHeadersReceived, any number of
 * OnBodyPartReceived, then exactly one of OnCompleted or OnTransportError. A handler may return kAbort from any of
 * the response events to stop reading; the exchange then completes without further body events.
 *
 * Implementations must not throw; the I/O thread has nobody to report to.
 */
class ResponseHandler {
 public:
  enum class Action { kContinue = 0, kAbort };

  virtual ~ResponseHandler() = default;

  virtual Action OnStatusReceived(const ResponseStatus& status) = 0;
  virtual Action OnHeadersReceived(const ResponseHeaders& headers) = 0;
  virtual Action OnBodyPartReceived(std::string_view part) = 0;

  /**
   * @brief The exchange finished: a full response was read, or a handler aborted it
   */
  virtual void OnCompleted() = 0;

  /**
   * @brief The exchange failed before a full response was read: DNS or connect failure, timeout, peer reset
   *
   * @param what human readable description of the failure
   */
  virtual void OnTransportError(const std::string& what) = 0;
};

}  // namespace network
}  // namespace tsink

#endif  // TSINK_NETWORK_RESPONSE_HANDLER_HPP
