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

#ifndef TSINK_NETWORK_TEST_MOCK_HTTP_SERVER_HPP
#define TSINK_NETWORK_TEST_MOCK_HTTP_SERVER_HPP

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "tsink/core/event_loop.hpp"
#include "tsink/network/tcp.hpp"

namespace tsink {
namespace network {
namespace test {

/**
 * A request as seen by the mock server. Header names are lowercased.
 */
struct RecordedRequest {
  std::string method;
  std::string target;
  std::map<std::string, std::string> headers;
  std::string body;
};

/**
 * What the mock server does with the next request
 */
struct CannedResponse {
  enum class Action { kRespond = 0, kDrop, kHang };

  Action action{Action::kRespond};
  int status{204};
  std::string reason{"No Content"};
  std::string body;

  static CannedResponse Status(int status, std::string reason, std::string body = "") {
    CannedResponse response;
    response.status = status;
    response.reason = std::move(reason);
    response.body = std::move(body);
    return response;
  }

  /// Close the connection without answering
  static CannedResponse Drop() {
    CannedResponse response;
    response.action = Action::kDrop;
    return response;
  }

  /// Keep the connection open without answering
  static CannedResponse Hang() {
    CannedResponse response;
    response.action = Action::kHang;
    return response;
  }

  std::string Render() const {
    std::string out = fmt::format("HTTP/1.1 {} {}\r\n", status, reason);
    if (status != 204) {
      out += fmt::format("Content-Length: {}\r\n", body.size());
    }
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
  }
};

/**
 * Minimal HTTP/1.1 server on the loopback interface for exercising the client
 *
 * Each connection carries one request. Responses are taken from a queue in arrival order; once the queue is empty the
 * default response is used. IO runs on the server's own thread, the accessors may be called from any thread.
 */
class MockHttpServer {
 public:
  MockHttpServer()
      : server_{loop_, 0, [this](const tsink::core::error_code& error, TCP socket) {
                  if (!error) {
                    std::make_shared<Connection>(*this, std::move(socket))->Start();
                  }
                }},
        thread_{[this]() { loop_.Run(); }} {}

  ~MockHttpServer() {
    loop_.Stop();
    if (thread_.joinable()) {
      thread_.join();
    }
    server_.Close();
    hung_.clear();
  }

  MockHttpServer(const MockHttpServer&) = delete;
  MockHttpServer& operator=(const MockHttpServer&) = delete;

  uint16_t GetPort() const { return server_.GetPort(); }
  std::string Url() const { return fmt::format("http://127.0.0.1:{}", GetPort()); }

  void Enqueue(CannedResponse response) {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(response));
  }

  void SetDefault(CannedResponse response) {
    std::lock_guard lock(mutex_);
    default_ = std::move(response);
  }

  /**
   * Block until at least `count` complete requests have arrived
   *
   * @return false on timeout
   */
  bool WaitForRequests(std::size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, count]() { return requests_.size() >= count; });
  }

  std::vector<RecordedRequest> GetRequests() const {
    std::lock_guard lock(mutex_);
    return requests_;
  }

 private:
  class Connection : public std::enable_shared_from_this<Connection> {
   public:
    Connection(MockHttpServer& owner, TCP tcp) : owner_{owner}, tcp_{std::move(tcp)} {}

    void Start() { Receive(); }

   private:
    void Receive() {
      tcp_.AsyncReceive(read_buffer_.data(), read_buffer_.size(),
                        [self = shared_from_this()](const tsink::core::error_code& error, size_t size) {
                          if (error) {
                            return;
                          }
                          self->buffer_.append(self->read_buffer_.data(), size);
                          if (!self->TryParse()) {
                            self->Receive();
                          }
                        });
    }

    // Returns true once a full request has been read and handed off
    bool TryParse() {
      const auto header_end = buffer_.find("\r\n\r\n");
      if (header_end == std::string::npos) {
        return false;
      }

      RecordedRequest request;
      std::size_t line_begin = 0;
      bool first = true;
      std::size_t content_length = 0;
      while (line_begin < header_end) {
        auto line_end = buffer_.find("\r\n", line_begin);
        const std::string line = buffer_.substr(line_begin, line_end - line_begin);
        line_begin = line_end + 2;
        if (first) {
          const auto sp1 = line.find(' ');
          const auto sp2 = line.find(' ', sp1 + 1);
          request.method = line.substr(0, sp1);
          request.target = line.substr(sp1 + 1, sp2 - sp1 - 1);
          first = false;
          continue;
        }
        const auto colon = line.find(':');
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(' '));
        if (name == "content-length") {
          content_length = std::stoul(value);
        }
        request.headers[name] = value;
      }

      const std::size_t body_begin = header_end + 4;
      if (buffer_.size() < body_begin + content_length) {
        return false;
      }
      request.body = buffer_.substr(body_begin, content_length);
      Reply(owner_.Record(std::move(request)));
      return true;
    }

    void Reply(const CannedResponse& response) {
      switch (response.action) {
        case CannedResponse::Action::kDrop:
          tcp_.Close();
          return;
        case CannedResponse::Action::kHang:
          owner_.hung_.push_back(shared_from_this());
          return;
        case CannedResponse::Action::kRespond:
          break;
      }
      reply_ = response.Render();
      tcp_.AsyncSendAll(reply_.data(), reply_.size(),
                        [self = shared_from_this()](const tsink::core::error_code&, size_t) { self->tcp_.Close(); });
    }

    MockHttpServer& owner_;
    TCP tcp_;
    std::string buffer_;
    std::string reply_;
    std::array<char, 4096> read_buffer_{};
  };

  CannedResponse Record(RecordedRequest request) {
    std::lock_guard lock(mutex_);
    requests_.push_back(std::move(request));
    cv_.notify_all();
    if (queue_.empty()) {
      return default_;
    }
    CannedResponse next = std::move(queue_.front());
    queue_.pop_front();
    return next;
  }

  tsink::core::EventLoop loop_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<RecordedRequest> requests_;
  std::deque<CannedResponse> queue_;
  CannedResponse default_;
  std::vector<std::shared_ptr<Connection>> hung_;
  TCPServer server_;
  std::thread thread_;
};

}  // namespace test
}  // namespace network
}  // namespace tsink

#endif  // TSINK_NETWORK_TEST_MOCK_HTTP_SERVER_HPP
