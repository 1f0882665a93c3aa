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

// Tokengate Base64url - Implementation

#include "base64url.hpp"

#include <algorithm>
#include <vector>

#include <openssl/evp.h>

namespace tokengate::core {

namespace {

constexpr bool is_url_safe_char(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_';
}

/// Split input into data part and padding count, validating both
/// Returns false if the input cannot be base64url
bool split_padding(std::string_view input, std::string_view& data, size_t& padding) noexcept {
    padding = 0;
    while (padding < input.size() && input[input.size() - 1 - padding] == '=') {
        ++padding;
    }
    data = input.substr(0, input.size() - padding);

    if (padding > 2) {
        return false;
    }

    // Padded input must be a whole number of quanta
    if (padding > 0 && input.size() % 4 != 0) {
        return false;
    }

    // A single trailing sextet cannot encode a full byte
    if (data.size() % 4 == 1) {
        return false;
    }

    return std::all_of(data.begin(), data.end(), is_url_safe_char);
}

}  // namespace

std::string base64url_encode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    // EVP_EncodeBlock writes 4 chars per 3-byte group plus a NUL terminator
    std::vector<unsigned char> buffer(4 * ((input.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(buffer.data(), reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));

    std::string result(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(written));

    // Standard alphabet to URL-safe alphabet, drop padding
    std::replace(result.begin(), result.end(), '+', '-');
    std::replace(result.begin(), result.end(), '/', '_');
    result.erase(std::remove(result.begin(), result.end(), '='), result.end());

    return result;
}

std::optional<std::string> base64url_decode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    std::string_view data;
    size_t padding = 0;
    if (!split_padding(input, data, padding)) {
        return std::nullopt;
    }

    // Convert to standard alphabet and restore padding for EVP_DecodeBlock
    std::string base64(data);
    std::replace(base64.begin(), base64.end(), '-', '+');
    std::replace(base64.begin(), base64.end(), '_', '/');
    size_t missing = (4 - (base64.size() % 4)) % 4;
    base64.append(missing, '=');

    std::vector<unsigned char> buffer(3 * (base64.size() / 4));
    int decoded_size = EVP_DecodeBlock(buffer.data(),
                                       reinterpret_cast<const unsigned char*>(base64.data()),
                                       static_cast<int>(base64.size()));
    if (decoded_size < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding positions as zero bytes
    size_t length = static_cast<size_t>(decoded_size) - missing;
    return std::string(reinterpret_cast<const char*>(buffer.data()), length);
}

bool is_base64url(std::string_view input) noexcept {
    std::string_view data;
    size_t padding = 0;
    return split_padding(input, data, padding);
}

}  // namespace tokengate::core
