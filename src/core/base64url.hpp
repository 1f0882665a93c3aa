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

// Tokengate Base64url - Header
// RFC 4648 §5 URL-safe alphabet, backed by OpenSSL EVP block codec

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tokengate::core {

/// Encode bytes as base64url without padding
[[nodiscard]] std::string base64url_encode(std::string_view input);

/// Decode base64url (padded or unpadded)
/// Returns nullopt on characters outside the URL-safe alphabet, misplaced
/// padding, or an impossible length
[[nodiscard]] std::optional<std::string> base64url_decode(std::string_view input);

/// Check that input uses only the URL-safe alphabet with valid padding
[[nodiscard]] bool is_base64url(std::string_view input) noexcept;

}  // namespace tokengate::core
