/*
 * Copyright 2025 Hopstrip Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Hopstrip Lambda Response Sanitizer - Header
// Header sanitization for ALB Lambda-target response documents

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <utility>

#include "header_sanitizer.hpp"

namespace hopstrip::gateway {

/// Sanitizes {"statusCode", "headers", "multiValueHeaders", "body", ...}
/// documents returned by a Lambda function behind an ALB.
///
/// Only keys of the "headers" and "multiValueHeaders" objects are examined.
/// Every other member, including a non-object "headers", is left as is.
class LambdaResponseSanitizer {
public:
    LambdaResponseSanitizer() = default;
    explicit LambdaResponseSanitizer(HeaderSanitizer sanitizer) : sanitizer_(std::move(sanitizer)) {}

    /// Remove denylisted header keys in place
    /// Returns number of keys removed across both header objects
    size_t sanitize(nlohmann::json& response) const;

private:
    size_t sanitize_object(nlohmann::json& headers) const;

    HeaderSanitizer sanitizer_;
};

}  // namespace hopstrip::gateway
