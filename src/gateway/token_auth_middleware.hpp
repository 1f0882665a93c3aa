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

// Tokengate Token Authentication Middleware - Header
// "Authorization: Token <base64url>" gate with caller-supplied lookup and authorization

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "../core/auth_header.hpp"
#include "../core/token.hpp"
#include "pipeline.hpp"

namespace tokengate::gateway {

/// Request environment key holding the authenticated identity
constexpr std::string_view REMOTE_USER_KEY = "REMOTE_USER";

/// What an Authorizer sees: the request and the identity resolved for it
struct AuthContext {
    const RequestContext& request;
    std::string_view user_id;
};

/// Resolve decoded token bytes to a user ID; empty string means "not authenticated"
/// Must be safe for concurrent calls. Not-found is a normal return, not an exception.
using Authenticator = std::function<std::string(std::string_view token)>;

/// Decide whether an authenticated request may proceed
/// Called only after authentication succeeded. Must be safe for concurrent calls.
using Authorizer = std::function<bool(const AuthContext& ctx)>;

/// Token authentication middleware
///
/// Per request: extract credential (query parameter first when configured, then
/// header), decode, authenticate, authorize. Success stores the user ID under
/// REMOTE_USER and continues; every failure produces the same 401 challenge.
/// Configuration is immutable after create(), so one instance serves all workers.
class TokenAuthMiddleware : public Middleware {
public:
    struct Config {
        std::string realm;                     // Required
        std::string header = "Authorization";  // Header name
        std::string scheme = std::string(core::DEFAULT_TOKEN_SCHEME);
        std::string query_param;               // Empty = header only
        size_t entropy_bytes = core::DEFAULT_TOKEN_ENTROPY;
        core::TokenDigest digest = core::TokenDigest::Sha256;
    };

    /// Create middleware, validating configuration
    /// @param authorizer Optional; defaults to allowing every authenticated request
    /// @param error_out missing_realm, missing_authenticator, invalid_entropy (0 or above
    ///        MAX_TOKEN_ENTROPY), or
    ///        malformed_header for an empty header name or scheme
    /// @return Middleware or nullptr on configuration error
    [[nodiscard]] static std::unique_ptr<TokenAuthMiddleware> create(Config config,
                                                                     Authenticator authenticator,
                                                                     Authorizer authorizer,
                                                                     std::error_code& error_out);

    ~TokenAuthMiddleware() override = default;

    // Non-copyable, non-movable (wrap() captures this)
    TokenAuthMiddleware(const TokenAuthMiddleware&) = delete;
    TokenAuthMiddleware& operator=(const TokenAuthMiddleware&) = delete;

    /// Process request phase (authenticate and authorize)
    [[nodiscard]] MiddlewareResult process_request(RequestContext& ctx) override;

    /// Get middleware name
    [[nodiscard]] std::string_view name() const override { return "TokenAuthMiddleware"; }

    /// Wrap a handler so it only runs for authenticated, authorized requests
    /// The middleware must outlive the returned handler
    [[nodiscard]] Handler wrap(Handler next) const;

    /// Generate a token with the configured entropy
    [[nodiscard]] std::optional<std::string> generate(std::error_code& error_out) const {
        return core::generate_token(config_.entropy_bytes, error_out);
    }

    /// Constant-time token comparison
    [[nodiscard]] static bool equal(std::string_view a, std::string_view b) noexcept {
        return core::constant_time_equal(a, b);
    }

    /// Storage key for decoded token bytes with the configured digest
    [[nodiscard]] std::string hash(std::string_view token) const {
        return core::hash_token(token, config_.digest);
    }

    /// Issuer bound to the configured entropy and digest
    [[nodiscard]] core::TokenIssuer issuer() const noexcept {
        return core::TokenIssuer(config_.entropy_bytes, config_.digest);
    }

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    /// Challenge header value sent with every rejection
    [[nodiscard]] std::string_view challenge() const noexcept { return challenge_; }

private:
    TokenAuthMiddleware(Config config, Authenticator authenticator, Authorizer authorizer);

    /// Full decision sequence (read-only, safe for concurrent requests)
    [[nodiscard]] MiddlewareResult authenticate(RequestContext& ctx) const;

    /// Extract and decode the credential; cause describes a failure for the log
    [[nodiscard]] std::optional<std::string> extract_token(const RequestContext& ctx,
                                                           std::string& cause) const;

    /// Send uniform 401 Unauthorized response
    [[nodiscard]] MiddlewareResult send_401(RequestContext& ctx, std::string_view cause) const;

    Config config_;
    Authenticator authenticator_;
    Authorizer authorizer_;
    std::string challenge_;  // "<scheme> realm=\"<realm>\""
};

}  // namespace tokengate::gateway
