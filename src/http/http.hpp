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

// Tokengate HTTP Types - Header
// Request views and owned responses seen by the authentication gate

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tokengate::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP status codes written by the gate and its handlers
enum class StatusCode : uint16_t {
    OK = 200,
    Unauthorized = 401,
};

/// HTTP header (name-value pair)
/// Both name and value are views into the request buffer (zero-copy)
struct Header {
    std::string_view name;
    std::string_view value;
};

/// HTTP request (zero-copy, all views into buffer owned by the transport)
struct Request {
    Method method = Method::UNKNOWN;

    std::string_view path;   // URI without query string
    std::string_view query;  // Query string without '?' (if present)

    std::vector<Header> headers;

    // Helper: Find header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Helper: First value of a query parameter, percent-decoded
    // Returns nullopt if the parameter is absent or its escapes are invalid
    [[nodiscard]] std::optional<std::string> get_query_param(std::string_view name) const;

    // Helper: Check if a query parameter is present (with or without value)
    [[nodiscard]] bool has_query_param(std::string_view name) const noexcept;
};

/// HTTP response (owned storage, filled by middleware and handlers)
struct Response {
    StatusCode status = StatusCode::OK;

    // Owned header pairs in insertion order
    std::vector<std::pair<std::string, std::string>> headers;

    // Body storage for owned data
    std::vector<uint8_t> body_storage;

    // Body (may point into body_storage or static data)
    std::span<const uint8_t> body;

    // Helper: Get header value or default (case-insensitive)
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Helper: Append header (copies name and value)
    void add_header(std::string_view name, std::string_view value);

    // Helper: Replace every header of this name with a single value
    void set_header(std::string_view name, std::string_view value);

    // Helper: Set content type
    void set_content_type(std::string_view content_type) { set_header("Content-Type", content_type); }

    // Helper: Copy body into owned storage
    void set_body(std::string_view data);

    // Helper: Body as text
    [[nodiscard]] std::string_view body_view() const noexcept {
        return {reinterpret_cast<const char*>(body.data()), body.size()};
    }
};

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// Decode %XX escapes and '+' (form encoding) in a query component
[[nodiscard]] std::optional<std::string> percent_decode(std::string_view input);

}  // namespace tokengate::http
