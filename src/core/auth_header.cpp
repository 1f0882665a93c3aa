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

// Tokengate Authorization Header Decoder - Implementation

#include "auth_header.hpp"

#include "base64url.hpp"
#include "token.hpp"

namespace tokengate::core {

namespace {

constexpr bool is_whitespace(char c) noexcept {
    return c == ' ' || c == '\t';
}

}  // namespace

std::optional<std::string> decode_token_header(std::string_view header_value,
                                               std::string_view scheme,
                                               std::error_code& error_out) {
    // STEP 1: Split on the first whitespace into scheme and value
    size_t split = header_value.find_first_of(" \t");
    if (split == std::string_view::npos) {
        error_out = TokenErrc::malformed_header;
        return std::nullopt;
    }

    std::string_view given_scheme = header_value.substr(0, split);
    std::string_view value = header_value.substr(split + 1);

    // STEP 2: Exactly two parts, case-sensitive scheme
    if (given_scheme.empty() || given_scheme != scheme || value.empty()) {
        error_out = TokenErrc::malformed_header;
        return std::nullopt;
    }

    for (char c : value) {
        if (is_whitespace(c)) {
            error_out = TokenErrc::malformed_header;
            return std::nullopt;
        }
    }

    // STEP 3: Value must be base64url
    auto token = base64url_decode(value);
    if (!token) {
        error_out = TokenErrc::invalid_encoding;
        return std::nullopt;
    }

    error_out.clear();
    return token;
}

std::string encode_token_header(std::string_view wire_token, std::string_view scheme) {
    std::string header;
    header.reserve(scheme.size() + 1 + wire_token.size());
    header.append(scheme);
    header.push_back(' ');
    header.append(wire_token);
    return header;
}

}  // namespace tokengate::core
