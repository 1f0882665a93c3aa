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

// Gateway Component Factory - Implementation

#include "factory.hpp"

#include "../core/logging.hpp"

namespace tokengate::gateway {

std::optional<TokenAuthMiddleware::Config> build_token_auth_config(const control::Config& config,
                                                                   std::error_code& error_out) {
    auto digest = core::parse_digest(config.auth.hash_digest);
    if (!digest) {
        error_out = std::make_error_code(std::errc::invalid_argument);
        return std::nullopt;
    }

    TokenAuthMiddleware::Config auth_config;
    auth_config.realm = config.auth.realm;
    auth_config.header = config.auth.header;
    auth_config.scheme = config.auth.scheme;
    auth_config.query_param = config.auth.query_param;
    // Negative values map to 0 so create() reports invalid_entropy
    auth_config.entropy_bytes =
        config.auth.entropy_bytes > 0 ? static_cast<size_t>(config.auth.entropy_bytes) : 0;
    auth_config.digest = *digest;

    error_out.clear();
    return auth_config;
}

std::unique_ptr<TokenAuthMiddleware> build_token_auth_middleware(const control::Config& config,
                                                                 Authenticator authenticator,
                                                                 Authorizer authorizer,
                                                                 std::error_code& error_out) {
    auto auth_config = build_token_auth_config(config, error_out);
    if (!auth_config) {
        return nullptr;
    }

    auto middleware = TokenAuthMiddleware::create(std::move(*auth_config), std::move(authenticator),
                                                  std::move(authorizer), error_out);
    if (!middleware) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "Token authentication setup failed: error={}", error_out.message());
        }
        return nullptr;
    }

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Token authentication enabled: realm={}, header={}, query_param={}",
                 config.auth.realm, config.auth.header, config.auth.query_param);
    }

    return middleware;
}

std::unique_ptr<Pipeline> build_pipeline(const control::Config& config,
                                         Authenticator authenticator, Authorizer authorizer,
                                         std::error_code& error_out) {
    auto auth = build_token_auth_middleware(config, std::move(authenticator),
                                            std::move(authorizer), error_out);
    if (!auth) {
        return nullptr;
    }

    auto pipeline = std::make_unique<Pipeline>();
    pipeline->use(std::move(auth));
    return pipeline;
}

}  // namespace tokengate::gateway
