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

#ifndef TSINK_NETWORK_HTTP_REQUEST_HPP
#define TSINK_NETWORK_HTTP_REQUEST_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tsink/network/url.hpp"

namespace tsink {
namespace network {

/**
 * @brief An HTTP request under construction
 *
 * Query parameters are kept in insertion order and form-encoded when the request target is rendered. The body is only
 * referenced: the caller's storage must stay untouched until the request has been handed to HttpClient::Execute(),
 * which takes the one copy that is sent.
 */
class HttpRequest {
 public:
  using Header = std::pair<std::string, std::string>;
  using QueryParam = std::pair<std::string, std::string>;

  HttpRequest(std::string method, Url url);

  HttpRequest& AddQueryParam(std::string name, std::string value);
  HttpRequest& AddHeader(std::string name, std::string value);
  HttpRequest& SetBody(std::string_view body);

  const std::string& GetMethod() const { return method_; }
  const Url& GetUrl() const { return url_; }
  const std::vector<Header>& GetHeaders() const { return headers_; }
  std::string_view GetBody() const { return body_; }

  /**
   * @brief The origin-form request target, i.e. path plus encoded query string
   */
  std::string Target() const;

  /**
   * @brief The absolute URI of the request, used when reporting on it
   */
  std::string Uri() const;

 private:
  std::string method_;
  Url url_;
  std::vector<QueryParam> query_;
  std::vector<Header> headers_;
  std::string_view body_;
};

}  // namespace network
}  // namespace tsink

#endif  // TSINK_NETWORK_HTTP_REQUEST_HPP
