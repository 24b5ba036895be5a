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

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "tsink/network/http_request.hpp"

using tsink::network::HttpRequest;
using tsink::network::Url;

TEST(HttpRequestTests, TargetKeepsQueryParamOrder) {
  HttpRequest request("POST", Url::Parse("http://localhost:8086").Join("/write"));
  request.AddQueryParam("db", "kafka").AddQueryParam("precision", "ms").AddQueryParam("rp", "one week");
  ASSERT_EQ(request.Target(), "/write?db=kafka&precision=ms&rp=one+week");
  ASSERT_EQ(request.Uri(), "http://localhost:8086/write?db=kafka&precision=ms&rp=one+week");
}

TEST(HttpRequestTests, TargetWithoutQuery) {
  HttpRequest request("GET", Url::Parse("http://localhost:8086/ping"));
  ASSERT_EQ(request.Target(), "/ping");
}

TEST(HttpRequestTests, HeadersKeepInsertionOrder) {
  HttpRequest request("POST", Url::Parse("http://localhost:8086").Join("/write"));
  request.AddHeader("Authorization", "Basic cm9vdDpyb290").AddHeader("Content-Type", "text/plain; charset=utf-8");
  ASSERT_EQ(request.GetMethod(), "POST");
  ASSERT_EQ(request.GetHeaders().size(), 2U);
  ASSERT_EQ(request.GetHeaders()[0].first, "Authorization");
  ASSERT_EQ(request.GetHeaders()[1].second, "text/plain; charset=utf-8");
}

TEST(HttpRequestTests, BodyRefersToCallerStorage) {
  const std::string storage{"cpu value=1\n"};
  HttpRequest request("POST", Url::Parse("http://localhost"));
  ASSERT_TRUE(request.GetBody().empty());
  request.SetBody(storage);
  ASSERT_EQ(request.GetBody().data(), storage.data());
  ASSERT_EQ(request.GetBody().size(), storage.size());
}

TEST(HttpRequestTests, RejectsHeaderInjection) {
  HttpRequest request("GET", Url::Parse("http://localhost"));
  ASSERT_THROW(request.AddHeader("X-Test", "a\r\nInjected: yes"), std::invalid_argument);
  ASSERT_THROW(request.AddHeader("", "value"), std::invalid_argument);
  ASSERT_THROW(request.AddHeader("X-Test: injected", "value"), std::invalid_argument);
  ASSERT_THROW(HttpRequest("GE T", Url::Parse("http://localhost")), std::invalid_argument);
}
