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

// Gateway Component Factory - Header
// Factory functions for building gateway components (Sanitizer, Pipeline, Upstream)

#pragma once

#include <memory>

#include "../control/config.hpp"
#include "header_sanitizer.hpp"
#include "pipeline.hpp"
#include "upstream.hpp"

namespace hopstrip::gateway {

/// Build header sanitizer from the sanitizer block
/// Throws std::invalid_argument for an invalid denylist entry
[[nodiscard]] HeaderSanitizer build_header_sanitizer(const control::SanitizerConfig& config);

/// Build middleware pipeline from configuration
[[nodiscard]] std::unique_ptr<Pipeline> build_pipeline(const control::Config& config);

/// Translate the upstream block into client options
[[nodiscard]] UpstreamOptions build_upstream_options(const control::UpstreamConfig& config);

/// Build the per-worker upstream client
[[nodiscard]] std::unique_ptr<UpstreamClient> build_upstream_client(const control::Config& config);

}  // namespace hopstrip::gateway
