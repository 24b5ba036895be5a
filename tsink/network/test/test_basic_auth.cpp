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

#include "tsink/network/basic_auth.hpp"

using tsink::network::BasicAuthorization;
using tsink::network::EncodeBasicCredentials;

TEST(BasicAuthTests, EncodeDefaultCredentials) { ASSERT_EQ(EncodeBasicCredentials("root", "root"), "cm9vdDpyb290"); }

TEST(BasicAuthTests, EncodeWithPadding) {
  ASSERT_EQ(EncodeBasicCredentials("Aladdin", "open sesame"), "QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
  ASSERT_EQ(EncodeBasicCredentials("", ""), "Og==");
}

TEST(BasicAuthTests, LongCredentialsStayOnOneLine) {
  const std::string password(200, 'x');
  const auto encoded = EncodeBasicCredentials("user", password);
  ASSERT_EQ(encoded.find('\n'), std::string::npos);
  ASSERT_EQ(encoded.size(), ((4 + 1 + password.size() + 2) / 3) * 4);
}

TEST(BasicAuthTests, AuthorizationHeaderValue) {
  ASSERT_EQ(BasicAuthorization(EncodeBasicCredentials("root", "root")), "Basic cm9vdDpyb290");
}
