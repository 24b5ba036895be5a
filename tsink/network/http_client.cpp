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

#include "http_client.hpp"

#include <fmt/core.h>

#include <charconv>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "tsink/core/logging.hpp"

namespace tsink {
namespace network {

using namespace tsink::core;

namespace {

constexpr const char* kUserAgent{"tsink"};

// Upper bound on one wait; libcurl returns earlier for its own timers and for curl_multi_wakeup()
constexpr int kPollTimeoutMs{1000};

std::once_flag g_curl_init;

void InitCurl() {
  std::call_once(g_curl_init, []() {
    const CURLcode result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (result != CURLE_OK) {
      throw std::runtime_error(fmt::format("Cannot initialize libcurl: {}", curl_easy_strerror(result)));
    }
  });
}

std::string_view Trim(std::string_view text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

struct EasyDeleter {
  void operator()(CURL* easy) const { curl_easy_cleanup(easy); }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

/**
 * One request/response exchange
 *
 * Owns the easy handle, its header list and the only copy of the request body. Once queued it is touched by the I/O
 * thread alone, which turns libcurl's header and write callbacks into ResponseHandler events.
 */
class HttpClient::Transfer {
 public:
  Transfer(const HttpRequest& request, std::shared_ptr<ResponseHandler> handler, const Options& options)
      : uri_{request.Uri()}, body_{request.GetBody()}, handler_{std::move(handler)}, easy_{curl_easy_init()} {
    if (!easy_) {
      throw std::runtime_error(fmt::format("Cannot create a transfer for {}", uri_));
    }
    status_.uri = uri_;

    CURL* easy = easy_.get();
    curl_easy_setopt(easy, CURLOPT_URL, uri_.c_str());
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, error_);
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout_ms));
    curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, static_cast<long>(options.request_timeout_ms));
    curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, &Transfer::OnHeader);
    curl_easy_setopt(easy, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &Transfer::OnBody);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, this);

    const std::string& method = request.GetMethod();
    if (method == "GET") {
      curl_easy_setopt(easy, CURLOPT_HTTPGET, 1L);
    } else {
      // libcurl reads the body from our copy without taking another one
      curl_easy_setopt(easy, CURLOPT_POSTFIELDS, body_.data());
      curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body_.size()));
      if (method != "POST") {
        curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, method.c_str());
      }
    }

    for (const auto& [name, value] : request.GetHeaders()) {
      AppendHeader(fmt::format("{}: {}", name, value));
    }
    // No 100-continue round trip for large bodies
    AppendHeader("Expect:");
    curl_easy_setopt(easy, CURLOPT_HTTPHEADER, headers_.get());
  }

  Transfer(const Transfer&) = delete;
  Transfer& operator=(const Transfer&) = delete;

  CURL* Handle() const { return easy_.get(); }
  const std::string& Uri() const { return uri_; }
  std::size_t BodySize() const { return body_.size(); }

  void Finish(CURLcode result) {
    if (aborted_) {
      Log::Debug("HTTP exchange aborted by its handler: {}", uri_);
      handler_->OnCompleted();
      return;
    }
    if (result != CURLE_OK) {
      Fail(error_[0] == '\0' ? std::string{curl_easy_strerror(result)}
                             : fmt::format("{}: {}", curl_easy_strerror(result), error_));
      return;
    }
    if (!head_delivered_) {
      long code = 0;
      curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &code);
      status_.code = static_cast<int>(code);
      DeliverHead();
    }
    Log::Debug("HTTP exchange completed: {} (status {})", uri_, status_.code);
    handler_->OnCompleted();
  }

  void Fail(const std::string& what) {
    Log::Debug("HTTP exchange failed: {}: {}", uri_, what);
    handler_->OnTransportError(what);
  }

 private:
  using Action = ResponseHandler::Action;

  static size_t OnHeader(char* data, size_t size, size_t count, void* user) {
    return static_cast<Transfer*>(user)->HeaderLine({data, size * count}) ? size * count : 0;
  }

  static size_t OnBody(char* data, size_t size, size_t count, void* user) {
    return static_cast<Transfer*>(user)->BodyPart({data, size * count}) ? size * count : 0;
  }

  void AppendHeader(const std::string& line) {
    curl_slist* list = curl_slist_append(headers_.get(), line.c_str());
    if (list == nullptr) {
      throw std::runtime_error(fmt::format("Cannot add header to request for {}", uri_));
    }
    if (!headers_) {
      headers_.reset(list);
    }
  }

  // Returning false stops the transfer
  bool HeaderLine(std::string_view line) {
    if (line.rfind("HTTP/", 0) == 0) {
      // Interim 1xx heads are replaced by the final one
      status_ = ResponseStatus{0, {}, uri_};
      response_headers_.clear();
      const auto space = line.find(' ');
      if (space != std::string_view::npos) {
        const auto rest = Trim(line.substr(space + 1));
        const auto code = rest.substr(0, rest.find(' '));
        std::from_chars(code.data(), code.data() + code.size(), status_.code);
        if (code.size() < rest.size()) {
          status_.text = std::string{Trim(rest.substr(code.size()))};
        }
      }
      return true;
    }

    const auto trimmed = Trim(line);
    if (trimmed.empty()) {
      return status_.code < 200 || DeliverHead();
    }
    const auto colon = trimmed.find(':');
    if (colon != std::string_view::npos && !head_delivered_) {
      response_headers_.emplace_back(std::string{Trim(trimmed.substr(0, colon))},
                                     std::string{Trim(trimmed.substr(colon + 1))});
    }
    return true;
  }

  bool BodyPart(std::string_view part) {
    if (!DeliverHead()) {
      return false;
    }
    if (handler_->OnBodyPartReceived(part) == Action::kAbort) {
      aborted_ = true;
      return false;
    }
    return true;
  }

  bool DeliverHead() {
    if (head_delivered_) {
      return !aborted_;
    }
    head_delivered_ = true;
    if (handler_->OnStatusReceived(status_) == Action::kAbort ||
        handler_->OnHeadersReceived(response_headers_) == Action::kAbort) {
      aborted_ = true;
    }
    return !aborted_;
  }

  const std::string uri_;
  const std::string body_;
  std::shared_ptr<ResponseHandler> handler_;
  // Declared first so the easy handle is cleaned up before its header list
  std::unique_ptr<curl_slist, HeaderListDeleter> headers_;
  std::unique_ptr<CURL, EasyDeleter> easy_;
  char error_[CURL_ERROR_SIZE]{};
  ResponseStatus status_;
  ResponseHeaders response_headers_;
  bool head_delivered_{false};
  bool aborted_{false};
};

HttpClient::HttpClient(Options options) : options_{options} {
  InitCurl();
  multi_ = curl_multi_init();
  if (multi_ == nullptr) {
    throw std::runtime_error("Cannot create the libcurl multi handle");
  }
  io_thread_ = std::thread([this]() { Run(); });
}

HttpClient::~HttpClient() {
  Close();
  pending_.clear();
  curl_multi_cleanup(multi_);
}

void HttpClient::Execute(const HttpRequest& request, std::shared_ptr<ResponseHandler> handler) {
  if (!handler) {
    throw std::invalid_argument("HttpClient::Execute requires a response handler");
  }
  if (closed_) {
    throw std::runtime_error(fmt::format("HttpClient is closed, cannot send {}", request.Uri()));
  }
  auto transfer = std::make_unique<Transfer>(request, std::move(handler), options_);
  Log::Debug("HTTP exchange queued: {} {} ({} byte body)", request.GetMethod(), transfer->Uri(),
             transfer->BodySize());
  {
    std::lock_guard lock(mutex_);
    pending_.push_back(std::move(transfer));
  }
  curl_multi_wakeup(multi_);
}

void HttpClient::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  curl_multi_wakeup(multi_);
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

void HttpClient::Run() {
  while (!closed_) {
    try {
      StartPending();
      int running = 0;
      CURLMcode result = curl_multi_perform(multi_, &running);
      if (result != CURLM_OK) {
        Log::Error("HTTP client I/O loop error: {}", curl_multi_strerror(result));
      }
      FinishDone();
      result = curl_multi_poll(multi_, nullptr, 0, kPollTimeoutMs, nullptr);
      if (result != CURLM_OK) {
        Log::Error("HTTP client I/O loop error: {}", curl_multi_strerror(result));
      }
    } catch (const std::exception& e) {
      Log::Error("HTTP client I/O loop error: {}", e.what());
    }
  }

  if (!active_.empty()) {
    Log::Debug("HTTP client closed with {} exchanges in flight", active_.size());
  }
  for (const auto& [easy, transfer] : active_) {
    curl_multi_remove_handle(multi_, easy);
  }
  active_.clear();
}

void HttpClient::StartPending() {
  std::vector<std::unique_ptr<Transfer>> starting;
  {
    std::lock_guard lock(mutex_);
    starting.swap(pending_);
  }
  for (auto& transfer : starting) {
    CURL* easy = transfer->Handle();
    const CURLMcode result = curl_multi_add_handle(multi_, easy);
    if (result != CURLM_OK) {
      transfer->Fail(fmt::format("Cannot start request to {}: {}", transfer->Uri(), curl_multi_strerror(result)));
      continue;
    }
    active_.emplace(easy, std::move(transfer));
  }
}

void HttpClient::FinishDone() {
  int queued = 0;
  while (CURLMsg* message = curl_multi_info_read(multi_, &queued)) {
    if (message->msg != CURLMSG_DONE) {
      continue;
    }
    CURL* easy = message->easy_handle;
    const CURLcode result = message->data.result;
    curl_multi_remove_handle(multi_, easy);

    auto it = active_.find(easy);
    if (it == active_.end()) {
      continue;
    }
    auto transfer = std::move(it->second);
    active_.erase(it);
    transfer->Finish(result);
  }
}

}  // namespace network
}  // namespace tsink
