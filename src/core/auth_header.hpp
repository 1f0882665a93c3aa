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

// Tokengate Authorization Header Decoder - Header

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace tokengate::core {

/// Default authentication scheme ("Authorization: Token <base64url>")
constexpr std::string_view DEFAULT_TOKEN_SCHEME = "Token";

/// Decode "<scheme> <base64url>" into raw token bytes
/// The scheme match is case-sensitive. Pure parse, no side effects.
/// @param error_out malformed_header or invalid_encoding on failure
[[nodiscard]] std::optional<std::string> decode_token_header(
    std::string_view header_value, std::string_view scheme, std::error_code& error_out);

/// Decode with the default "Token" scheme
[[nodiscard]] inline std::optional<std::string> decode_token_header(
    std::string_view header_value, std::error_code& error_out) {
    return decode_token_header(header_value, DEFAULT_TOKEN_SCHEME, error_out);
}

/// Build the header value a client sends for a wire token
[[nodiscard]] std::string encode_token_header(std::string_view wire_token,
                                              std::string_view scheme = DEFAULT_TOKEN_SCHEME);

}  // namespace tokengate::core
