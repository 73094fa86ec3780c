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

// Hopstrip Lambda Response Sanitizer - Implementation

#include "lambda_response.hpp"

#include <string>
#include <vector>

namespace hopstrip::gateway {

size_t LambdaResponseSanitizer::sanitize(nlohmann::json& response) const {
    if (!response.is_object()) {
        return 0;
    }

    size_t removed = 0;

    auto headers = response.find("headers");
    if (headers != response.end()) {
        removed += sanitize_object(*headers);
    }

    auto multi_value = response.find("multiValueHeaders");
    if (multi_value != response.end()) {
        removed += sanitize_object(*multi_value);
    }

    return removed;
}

size_t LambdaResponseSanitizer::sanitize_object(nlohmann::json& headers) const {
    if (!headers.is_object()) {
        return 0;
    }

    // Collect first, erasing while iterating invalidates the iterator
    std::vector<std::string> denied;
    for (const auto& item : headers.items()) {
        if (sanitizer_.is_denied(item.key())) {
            denied.push_back(item.key());
        }
    }

    for (const auto& key : denied) {
        headers.erase(key);
    }

    return denied.size();
}

}  // namespace hopstrip::gateway
