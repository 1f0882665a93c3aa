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

// Tokengate Token Authentication Middleware - Implementation

#include "token_auth_middleware.hpp"

#include <exception>

#include <openssl/crypto.h>

#include "../core/base64url.hpp"
#include "../core/logging.hpp"

namespace tokengate::gateway {

namespace {

// Generic body for every rejection (never reveals the cause)
constexpr std::string_view NOT_AUTHORIZED_BODY = R"({"Error":"Not Authorized"})";

/// Render realm as an RFC 7235 quoted-string
std::string quote_realm(std::string_view realm) {
    std::string quoted;
    quoted.reserve(realm.size() + 2);
    quoted.push_back('"');
    for (char c : realm) {
        if (c == '"' || c == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

/// Scrub decoded token bytes once they are no longer needed
void cleanse(std::string& token) noexcept {
    if (!token.empty()) {
        OPENSSL_cleanse(token.data(), token.size());
    }
}

}  // namespace

std::unique_ptr<TokenAuthMiddleware> TokenAuthMiddleware::create(Config config,
                                                                 Authenticator authenticator,
                                                                 Authorizer authorizer,
                                                                 std::error_code& error_out) {
    if (config.realm.empty()) {
        error_out = core::TokenErrc::missing_realm;
        return nullptr;
    }

    if (!authenticator) {
        error_out = core::TokenErrc::missing_authenticator;
        return nullptr;
    }

    if (config.entropy_bytes == 0 || config.entropy_bytes > core::MAX_TOKEN_ENTROPY) {
        error_out = core::TokenErrc::invalid_entropy;
        return nullptr;
    }

    if (config.header.empty() || config.scheme.empty()) {
        error_out = core::TokenErrc::malformed_header;
        return nullptr;
    }

    // Resolve defaults once; the instance is read-only afterwards
    if (!authorizer) {
        authorizer = [](const AuthContext&) { return true; };
    }

    error_out.clear();
    return std::unique_ptr<TokenAuthMiddleware>(
        new TokenAuthMiddleware(std::move(config), std::move(authenticator), std::move(authorizer)));
}

TokenAuthMiddleware::TokenAuthMiddleware(Config config, Authenticator authenticator,
                                         Authorizer authorizer)
    : config_(std::move(config)),
      authenticator_(std::move(authenticator)),
      authorizer_(std::move(authorizer)),
      challenge_(config_.scheme + " realm=" + quote_realm(config_.realm)) {}

MiddlewareResult TokenAuthMiddleware::process_request(RequestContext& ctx) {
    return authenticate(ctx);
}

Handler TokenAuthMiddleware::wrap(Handler next) const {
    return [this, next = std::move(next)](RequestContext& ctx) {
        if (authenticate(ctx) == MiddlewareResult::Continue && next) {
            next(ctx);
        }
    };
}

MiddlewareResult TokenAuthMiddleware::authenticate(RequestContext& ctx) const {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    // STEP 1: Extract and decode credential (query parameter, then header)
    std::string cause;
    auto token = extract_token(ctx, cause);
    if (!token) {
        return send_401(ctx, cause);
    }

    // STEP 2: Resolve identity through the caller's store
    std::string user_id;
    try {
        user_id = authenticator_(*token);
    } catch (const std::exception& e) {
        cleanse(*token);
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "Authenticator threw: what={}, correlation_id={}", e.what(),
                      ctx.correlation_id);
        }
        return send_401(ctx, "authenticator failure");
    } catch (...) {
        cleanse(*token);
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "Authenticator threw a non-standard exception: correlation_id={}",
                      ctx.correlation_id);
        }
        return send_401(ctx, "authenticator failure");
    }
    cleanse(*token);

    if (user_id.empty()) {
        return send_401(ctx, "unknown token");
    }

    // STEP 3: Authorize the authenticated identity for this request
    bool allowed = false;
    try {
        allowed = authorizer_(AuthContext{ctx, user_id});
    } catch (const std::exception& e) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger, "Authorizer threw: what={}, user_id={}, correlation_id={}", e.what(),
                      user_id, ctx.correlation_id);
        }
        return send_401(ctx, "authorizer failure");
    } catch (...) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_ERROR(logger,
                      "Authorizer threw a non-standard exception: user_id={}, correlation_id={}",
                      user_id, ctx.correlation_id);
        }
        return send_401(ctx, "authorizer failure");
    }

    if (!allowed) {
        return send_401(ctx, "authorization denied");
    }

    // STEP 4: Publish identity for downstream handlers
    if (auto* logger = logging::get_current_logger()) {
        LOG_DEBUG(logger, "Token authenticated: user_id={}, client_ip={}, correlation_id={}",
                  user_id, ctx.client_ip, ctx.correlation_id);
    }
    ctx.set_metadata(std::string(REMOTE_USER_KEY), std::move(user_id));

    return MiddlewareResult::Continue;
}

std::optional<std::string> TokenAuthMiddleware::extract_token(const RequestContext& ctx,
                                                              std::string& cause) const {
    // Query parameter wins over the header when configured and non-empty
    if (!config_.query_param.empty() && ctx.request->has_query_param(config_.query_param)) {
        auto value = ctx.request->get_query_param(config_.query_param);
        if (!value) {
            cause = "invalid query escape";
            return std::nullopt;
        }

        if (!value->empty()) {
            auto token = core::base64url_decode(*value);
            if (!token) {
                cause = core::make_error_code(core::TokenErrc::invalid_encoding).message();
                return std::nullopt;
            }
            return token;
        }
    }

    auto header = ctx.request->get_header(config_.header);
    if (header.empty()) {
        cause = "missing credential";
        return std::nullopt;
    }

    std::error_code ec;
    auto token = core::decode_token_header(header, config_.scheme, ec);
    if (!token) {
        cause = ec.message();
        return std::nullopt;
    }

    return token;
}

MiddlewareResult TokenAuthMiddleware::send_401(RequestContext& ctx, std::string_view cause) const {
    // No partial identity survives a rejection
    if (auto it = ctx.metadata.find(REMOTE_USER_KEY); it != ctx.metadata.end()) {
        ctx.metadata.erase(it);
    }

    ctx.response->status = http::StatusCode::Unauthorized;
    ctx.response->set_header("WWW-Authenticate", challenge_);
    ctx.response->set_content_type("application/json");
    ctx.response->body = std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(NOT_AUTHORIZED_BODY.data()), NOT_AUTHORIZED_BODY.size());

    if (auto* logger = logging::get_current_logger()) {
        LOG_AUTH_REJECT(logger, cause, ctx.client_ip, ctx.correlation_id);
    }

    ctx.set_error("Not Authorized");
    return MiddlewareResult::Stop;
}

}  // namespace tokengate::gateway
