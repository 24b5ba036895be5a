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

#ifndef TSINK_CORE_ERROR_CODE_HPP
#define TSINK_CORE_ERROR_CODE_HPP

#include <asio/error_code.hpp>

namespace tsink {
namespace core {

// Error type delivered to asynchronous completion handlers
using error_code = asio::error_code;

}  // namespace core
}  // namespace tsink

#endif  // TSINK_CORE_ERROR_CODE_HPP
