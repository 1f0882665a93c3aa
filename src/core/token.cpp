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

// Tokengate Credential Primitives - Implementation

#include "token.hpp"

#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include "base64url.hpp"

namespace tokengate::core {

// ============================================================================
// Error Category
// ============================================================================

std::string TokenErrorCategory::message(int ev) const {
    switch (static_cast<TokenErrc>(ev)) {
        case TokenErrc::entropy_source_failure:
            return "secure random source failed to supply bytes";
        case TokenErrc::invalid_entropy:
            return "token entropy must be between 1 and 1024 bytes";
        case TokenErrc::malformed_header:
            return "malformed authorization header";
        case TokenErrc::invalid_encoding:
            return "token is not valid base64url";
        case TokenErrc::missing_realm:
            return "realm is required";
        case TokenErrc::missing_authenticator:
            return "authenticator is required";
        case TokenErrc::issue_collision:
            return "token store reported a key collision on every attempt";
        case TokenErrc::digest_failure:
            return "token digest failed";
    }
    return "unknown token error";
}

const TokenErrorCategory& token_category() noexcept {
    static TokenErrorCategory instance;
    return instance;
}

std::error_code make_error_code(TokenErrc e) noexcept {
    return std::error_code(static_cast<int>(e), token_category());
}

// ============================================================================
// Digest Selection
// ============================================================================

std::optional<TokenDigest> parse_digest(std::string_view name) noexcept {
    if (name == "sha256") {
        return TokenDigest::Sha256;
    } else if (name == "md5") {
        return TokenDigest::Md5;
    }
    return std::nullopt;
}

std::string_view to_string(TokenDigest digest) noexcept {
    switch (digest) {
        case TokenDigest::Sha256:
            return "sha256";
        case TokenDigest::Md5:
            return "md5";
    }
    return "unknown";
}

static const EVP_MD* evp_digest(TokenDigest digest) noexcept {
    switch (digest) {
        case TokenDigest::Sha256:
            return EVP_sha256();
        case TokenDigest::Md5:
            return EVP_md5();
    }
    return nullptr;
}

// ============================================================================
// Primitives
// ============================================================================

std::optional<std::string> generate_token(size_t entropy_bytes, std::error_code& error_out) {
    if (entropy_bytes == 0 || entropy_bytes > MAX_TOKEN_ENTROPY) {
        error_out = TokenErrc::invalid_entropy;
        return std::nullopt;
    }

    std::vector<unsigned char> bytes(entropy_bytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
        error_out = TokenErrc::entropy_source_failure;
        return std::nullopt;
    }

    std::string token = base64url_encode(
        std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    OPENSSL_cleanse(bytes.data(), bytes.size());

    error_out.clear();
    return token;
}

bool constant_time_equal(std::string_view a, std::string_view b) noexcept {
    // Length is not secret; only the content comparison must be constant-time
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string hash_token(std::string_view token, TokenDigest digest) {
    const EVP_MD* md = evp_digest(digest);
    if (!md) {
        return "";
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_Digest(token.data(), token.size(), out, &out_len, md, nullptr) != 1) {
        return "";
    }

    return base64url_encode(std::string_view(reinterpret_cast<const char*>(out), out_len));
}

// ============================================================================
// TokenIssuer Implementation
// ============================================================================

std::optional<IssuedToken> TokenIssuer::issue(const StoreInsert& insert,
                                              std::error_code& error_out) const {
    for (size_t attempt = 0; attempt < max_attempts_; ++attempt) {
        auto token = generate_token(entropy_bytes_, error_out);
        if (!token) {
            return std::nullopt;
        }

        auto raw = base64url_decode(*token);
        if (!raw) {
            error_out = TokenErrc::invalid_encoding;
            return std::nullopt;
        }

        std::string key = hash_token(*raw, digest_);
        OPENSSL_cleanse(raw->data(), raw->size());
        if (key.empty()) {
            error_out = TokenErrc::digest_failure;
            return std::nullopt;
        }

        // Existing key: regenerate instead of overwriting
        if (insert(key)) {
            error_out.clear();
            return IssuedToken{std::move(*token), std::move(key)};
        }
    }

    error_out = TokenErrc::issue_collision;
    return std::nullopt;
}

}  // namespace tokengate::core
