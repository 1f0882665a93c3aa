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

// Tokengate Configuration - Implementation

#include "config.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

#include "../core/logging.hpp"

namespace tokengate::control {

static bool has_control_chars(std::string_view value) {
    for (char c : value) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) {
            return true;
        }
    }
    return false;
}

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    ValidationResult validation;
    return load_from_file(path, validation);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    ValidationResult validation;
    return load_from_json(json, validation);
}

std::optional<Config> ConfigLoader::load_from_file(std::string_view path,
                                                   ValidationResult& validation) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        validation.add_error("Cannot open configuration file '" + path_str + "'");
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json, validation);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json,
                                                   ValidationResult& validation) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        // Parse error - log detailed error message
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        validation.add_error(std::string("JSON parsing error: ") + e.what());
        return std::nullopt;
    }

    validation = validate(config);

    if (validation.has_errors()) {
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;
    const auto& auth = config.auth;

    // Realm is rendered into the challenge header
    if (auth.realm.empty()) {
        result.add_error("auth.realm is required");
    } else if (has_control_chars(auth.realm)) {
        result.add_error("auth.realm must not contain control characters");
    }

    if (auth.header.empty()) {
        result.add_error("auth.header cannot be empty");
    }

    if (auth.scheme.empty()) {
        result.add_error("auth.scheme cannot be empty");
    } else if (auth.scheme.find_first_of(" \t") != std::string::npos) {
        result.add_error("auth.scheme must not contain whitespace");
    }

    if (!auth.query_param.empty() && auth.query_param.find_first_of("&= ") != std::string::npos) {
        result.add_error("auth.query_param '" + auth.query_param + "' is not a valid parameter name");
    }

    if (auth.entropy_bytes <= 0) {
        result.add_error("auth.entropy_bytes must be > 0");
    } else if (auth.entropy_bytes > static_cast<int64_t>(core::MAX_TOKEN_ENTROPY)) {
        result.add_error("auth.entropy_bytes must be <= " +
                         std::to_string(core::MAX_TOKEN_ENTROPY));
    } else if (auth.entropy_bytes < static_cast<int64_t>(core::MIN_RECOMMENDED_TOKEN_ENTROPY)) {
        result.add_warning("auth.entropy_bytes is " + std::to_string(auth.entropy_bytes) +
                           " (below the recommended " +
                           std::to_string(core::MIN_RECOMMENDED_TOKEN_ENTROPY) + " bytes)");
    }

    auto digest = core::parse_digest(auth.hash_digest);
    if (!digest) {
        result.add_error("Unknown auth.hash_digest '" + auth.hash_digest +
                         "' (expected sha256 or md5)");
    } else if (*digest == core::TokenDigest::Md5) {
        result.add_warning("auth.hash_digest md5 is kept for existing stores; prefer sha256");
    }

    // Logging
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("Unknown logging.format '" + config.logging.format +
                         "' (expected json or text)");
    }

    if (!logging::parse_log_level(config.logging.level)) {
        result.add_warning("Unknown logging.level '" + config.logging.level + "', using info");
    }

    if (config.logging.output.empty()) {
        result.add_error("logging.output cannot be empty");
    }

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

}  // namespace tokengate::control
