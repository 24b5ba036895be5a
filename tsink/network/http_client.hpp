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

#ifndef TSINK_NETWORK_HTTP_CLIENT_HPP
#define TSINK_NETWORK_HTTP_CLIENT_HPP

#include <curl/curl.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "tsink/network/http_request.hpp"
#include "tsink/network/response_handler.hpp"

namespace tsink {
namespace network {

/**
 * @brief Non-blocking HTTP client on top of the libcurl multi interface
 *
 * The client owns one curl multi handle and the thread that drives it. Execute() prepares an easy handle for the
 * request, queues it for that thread and returns immediately. Connecting, sending and reading the response all happen
 * on the I/O thread, where the ResponseHandler receives its events. Connections are pooled by libcurl.
 *
 * Execute() may be called from any thread. Close() must not be called from a ResponseHandler.
 */
class HttpClient {
 public:
  struct Options {
    /// 0 leaves libcurl's built-in connect timeout in place
    unsigned connect_timeout_ms{5000};
    /// 0 disables the whole-request timeout
    unsigned request_timeout_ms{60000};
  };

  HttpClient() : HttpClient(Options{}) {}
  explicit HttpClient(Options options);
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;
  HttpClient(HttpClient&&) = delete;
  HttpClient& operator=(HttpClient&&) = delete;

  /**
   * @brief Submit a request without waiting for its response
   *
   * The request body is copied exactly once, into the transfer that sends it, before this returns. The caller's
   * storage may be reused as soon as Execute() returns.
   *
   * @param request the request to send
   * @param handler observer for the exchange; kept alive until the exchange ends
   * @throws std::invalid_argument if handler is null
   * @throws std::runtime_error if the client has been closed or libcurl cannot allocate a transfer
   */
  void Execute(const HttpRequest& request, std::shared_ptr<ResponseHandler> handler);

  /**
   * @brief Stop the I/O thread, abandoning exchanges that are still in flight
   */
  void Close();

  bool IsClosed() const { return closed_.load(); }

  const Options& GetOptions() const { return options_; }

 private:
  class Transfer;

  void Run();
  void StartPending();
  void FinishDone();

  const Options options_;
  std::atomic<bool> closed_{false};
  CURLM* multi_{nullptr};
  std::mutex mutex_;
  std::vector<std::unique_ptr<Transfer>> pending_;
  // Only touched by the I/O thread
  std::unordered_map<CURL*, std::unique_ptr<Transfer>> active_;
  std::thread io_thread_;
};

}  // namespace network
}  // namespace tsink

#endif  // TSINK_NETWORK_HTTP_CLIENT_HPP
