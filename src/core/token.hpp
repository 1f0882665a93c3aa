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

// Tokengate Credential Primitives - Header
// Bearer token generation, constant-time comparison and storage hashing

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace tokengate::core {

/// Recommended token entropy (32 bytes == 256 bits)
constexpr size_t DEFAULT_TOKEN_ENTROPY = 32;

/// Entropy below this is accepted but flagged by config validation
constexpr size_t MIN_RECOMMENDED_TOKEN_ENTROPY = 16;

/// Largest accepted token entropy (8192 bits)
constexpr size_t MAX_TOKEN_ENTROPY = 1024;

/// Token error codes
enum class TokenErrc {
    entropy_source_failure = 1,  // CSPRNG could not supply bytes
    invalid_entropy,             // Entropy byte count is zero or above MAX_TOKEN_ENTROPY
    malformed_header,            // Not "<scheme> <value>" with the expected scheme
    invalid_encoding,            // Value is not base64url
    missing_realm,               // Gate configured without a realm
    missing_authenticator,       // Gate configured without an Authenticator
    issue_collision,             // Store kept reporting existing keys
    digest_failure,              // OpenSSL digest failed
};

/// Token error category for std::error_code
class TokenErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "token"; }

    [[nodiscard]] std::string message(int ev) const override;
};

/// Get token error category instance
[[nodiscard]] const TokenErrorCategory& token_category() noexcept;

[[nodiscard]] std::error_code make_error_code(TokenErrc e) noexcept;

/// Digest used for at-rest token hashing
/// Fast digests only: tokens are already high-entropy
enum class TokenDigest : uint8_t {
    Sha256,
    Md5,  // Compatibility with stores keyed by MD5
};

/// Parse digest name ("sha256", "md5")
[[nodiscard]] std::optional<TokenDigest> parse_digest(std::string_view name) noexcept;

/// Convert digest to its configuration name
[[nodiscard]] std::string_view to_string(TokenDigest digest) noexcept;

/// Generate a fresh base64url token from entropy_bytes of CSPRNG output
/// @param entropy_bytes Raw token length before encoding (1..MAX_TOKEN_ENTROPY)
/// @param error_out Set to entropy_source_failure or invalid_entropy on failure
/// @return Encoded token or nullopt on error
[[nodiscard]] std::optional<std::string> generate_token(size_t entropy_bytes,
                                                        std::error_code& error_out);

/// Constant-time comparison of two credentials
/// Timing does not depend on the position of the first differing byte
[[nodiscard]] bool constant_time_equal(std::string_view a, std::string_view b) noexcept;

/// One-way storage key for a token (digest, then base64url)
/// Hash the decoded token bytes, not the wire form
/// Returns an empty string only if the digest itself fails
[[nodiscard]] std::string hash_token(std::string_view token,
                                     TokenDigest digest = TokenDigest::Sha256);

/// Freshly issued token with its storage key
struct IssuedToken {
    std::string token;  // Wire form handed to the client
    std::string key;    // hash_token() of the decoded bytes, for the store
};

/// Issues tokens against a caller-managed store
/// The store rejects existing keys; on collision a new token is generated,
/// never overwriting the existing record
class TokenIssuer {
public:
    /// Insert key into the store; return false if the key already exists
    using StoreInsert = std::function<bool(std::string_view key)>;

    static constexpr size_t DEFAULT_MAX_ATTEMPTS = 3;

    TokenIssuer(size_t entropy_bytes, TokenDigest digest,
                size_t max_attempts = DEFAULT_MAX_ATTEMPTS) noexcept
        : entropy_bytes_(entropy_bytes), digest_(digest), max_attempts_(max_attempts) {}

    /// Generate, hash and insert a token
    /// @param error_out entropy errors, or issue_collision when every attempt collided
    [[nodiscard]] std::optional<IssuedToken> issue(const StoreInsert& insert,
                                                   std::error_code& error_out) const;

    [[nodiscard]] size_t entropy_bytes() const noexcept { return entropy_bytes_; }
    [[nodiscard]] TokenDigest digest() const noexcept { return digest_; }

private:
    size_t entropy_bytes_;
    TokenDigest digest_;
    size_t max_attempts_;
};

}  // namespace tokengate::core

template <>
struct std::is_error_code_enum<tokengate::core::TokenErrc> : std::true_type {};
