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

// Tokengate HTTP Types - Implementation

#include "http.hpp"

#include <algorithm>
#include <cctype>

namespace tokengate::http {

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? header->value : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

std::optional<std::string> Request::get_query_param(std::string_view name) const {
    std::string_view remaining = query;

    while (!remaining.empty()) {
        size_t amp = remaining.find('&');
        std::string_view pair = remaining.substr(0, amp);
        remaining = (amp == std::string_view::npos) ? std::string_view{}
                                                    : remaining.substr(amp + 1);

        size_t eq = pair.find('=');
        std::string_view key = pair.substr(0, eq);
        if (key != name) {
            continue;
        }

        std::string_view value =
            (eq == std::string_view::npos) ? std::string_view{} : pair.substr(eq + 1);
        return percent_decode(value);
    }

    return std::nullopt;
}

bool Request::has_query_param(std::string_view name) const noexcept {
    std::string_view remaining = query;

    while (!remaining.empty()) {
        size_t amp = remaining.find('&');
        std::string_view pair = remaining.substr(0, amp);
        remaining = (amp == std::string_view::npos) ? std::string_view{}
                                                    : remaining.substr(amp + 1);

        if (pair.substr(0, pair.find('=')) == name) {
            return true;
        }
    }

    return false;
}

// Response helper methods

std::string_view Response::get_header(std::string_view name,
                                      std::string_view default_value) const noexcept {
    for (const auto& [hdr_name, hdr_value] : headers) {
        if (header_name_equals(hdr_name, name)) {
            return hdr_value;
        }
    }
    return default_value;
}

bool Response::has_header(std::string_view name) const noexcept {
    return std::any_of(headers.begin(), headers.end(), [name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
}

void Response::add_header(std::string_view name, std::string_view value) {
    headers.emplace_back(std::string(name), std::string(value));
}

void Response::set_header(std::string_view name, std::string_view value) {
    auto it = std::remove_if(headers.begin(), headers.end(), [name](const auto& pair) {
        return header_name_equals(pair.first, name);
    });
    headers.erase(it, headers.end());
    add_header(name, value);
}

void Response::set_body(std::string_view data) {
    body_storage.assign(data.begin(), data.end());
    body = std::span<const uint8_t>(body_storage.data(), body_storage.size());
}

// Free functions

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

std::optional<std::string> percent_decode(std::string_view input) {
    auto hex_value = [](char c) -> int {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };

    std::string result;
    result.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '+') {
            result.push_back(' ');
        } else if (c == '%') {
            if (i + 2 >= input.size()) {
                return std::nullopt;
            }
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            result.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            result.push_back(c);
        }
    }

    return result;
}

}  // namespace tokengate::http
