/*
 * Copyright 2025 Tokengate Contributors
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
// Builds the authentication gate and pipeline from configuration

#pragma once

#include <memory>
#include <optional>
#include <system_error>

#include "../control/config.hpp"
#include "pipeline.hpp"
#include "token_auth_middleware.hpp"

namespace tokengate::gateway {

/// Translate loaded configuration into middleware configuration
[[nodiscard]] std::optional<TokenAuthMiddleware::Config> build_token_auth_config(
    const control::Config& config, std::error_code& error_out);

/// Build token authentication middleware from configuration
[[nodiscard]] std::unique_ptr<TokenAuthMiddleware> build_token_auth_middleware(
    const control::Config& config, Authenticator authenticator, Authorizer authorizer,
    std::error_code& error_out);

/// Build middleware pipeline with the authentication gate installed
[[nodiscard]] std::unique_ptr<Pipeline> build_pipeline(const control::Config& config,
                                                       Authenticator authenticator,
                                                       Authorizer authorizer,
                                                       std::error_code& error_out);

}  // namespace tokengate::gateway
