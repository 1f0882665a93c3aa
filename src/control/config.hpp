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

// Tokengate Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/token.hpp"

namespace tokengate::control {

/// Token authentication gate configuration
struct TokenAuthConfig {
    std::string realm;                     // Challenge realm (required)
    std::string header = "Authorization";  // Header carrying the credential
    std::string scheme = "Token";          // "Token <base64url>" (case-sensitive)
    std::string query_param;               // e.g. "token"; empty = header only
    int64_t entropy_bytes = static_cast<int64_t>(core::DEFAULT_TOKEN_ENTROPY);  // Signed: negatives are reported
    std::string hash_digest = "sha256";    // sha256, md5
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";                 // debug, info, warning, error
    std::string format = "json";                // json, text
    std::string output = "/var/log/tokengate";  // Log directory (tokengate_N.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Tokengate configuration
struct Config {
    TokenAuthConfig auth;

    // Observability
    LogConfig logging;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

// All config types use custom from_json/to_json (partial configs fall back to defaults)

inline void to_json(nlohmann::json& j, const TokenAuthConfig& a) {
    j = nlohmann::json{{"realm", a.realm},
                       {"header", a.header},
                       {"scheme", a.scheme},
                       {"query_param", a.query_param},
                       {"entropy_bytes", a.entropy_bytes},
                       {"hash_digest", a.hash_digest}};
}

inline void from_json(const nlohmann::json& j, TokenAuthConfig& a) {
    a.realm = j.value("realm", std::string());
    a.header = j.value("header", std::string("Authorization"));
    a.scheme = j.value("scheme", std::string("Token"));
    a.query_param = j.value("query_param", std::string());
    a.entropy_bytes =
        j.value("entropy_bytes", static_cast<int64_t>(core::DEFAULT_TOKEN_ENTROPY));
    a.hash_digest = j.value("hash_digest", std::string("sha256"));
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("/var/log/tokengate"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{{"auth", c.auth}, {"logging", c.logging}, {"version", c.version}};
    if (c.description) {
        j["description"] = *c.description;
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // Use contains() + get_to() so nested defaults stay in the struct definitions
    if (j.contains("auth")) {
        j.at("auth").get_to(c.auth);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    c.version = j.value("version", std::string("1.0"));
    if (j.contains("description") && j.at("description").is_string()) {
        c.description = j.at("description").get<std::string>();
    }
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Load configuration from JSON file, reporting validation findings
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path,
                                                              ValidationResult& validation);

    /// Load configuration from JSON string, reporting validation findings
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json,
                                                              ValidationResult& validation);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace tokengate::control
