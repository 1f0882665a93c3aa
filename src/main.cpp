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

// Tokengate - Command Line Entry Point
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include "control/config.hpp"
#include "core/base64url.hpp"
#include "core/logging.hpp"
#include "core/token.hpp"
#include "gateway/factory.hpp"

namespace {

void print_usage(const char* program) {
    fprintf(stderr,
            "Usage: %s --config <config.json> <command>\n"
            "\n"
            "Commands:\n"
            "  generate [count]  Print new tokens with their storage hashes\n"
            "  hash <token>      Print the storage hash of a wire token\n"
            "  check             Validate configuration\n",
            program);
}

void print_validation(const tokengate::control::ValidationResult& validation) {
    if (!validation.warnings.empty()) {
        printf("Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            printf("  - %s\n", warning.c_str());
        }
    }

    if (!validation.errors.empty()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
    }
}

// Logging is best effort for a CLI: an unwritable log directory only disables it
void start_logging(const tokengate::control::LogConfig& log_config) {
    tokengate::logging::init_logging_system();
    try {
        tokengate::logging::init_worker_logger(0, log_config);
    } catch (const std::filesystem::filesystem_error& e) {
        fprintf(stderr, "Logging disabled: %s\n", e.what());
    }
}

int run_generate(const tokengate::gateway::TokenAuthMiddleware& gate, std::string_view count_arg) {
    unsigned long count = 1;
    if (!count_arg.empty()) {
        auto [ptr, ec] =
            std::from_chars(count_arg.data(), count_arg.data() + count_arg.size(), count);
        if (ec != std::errc() || ptr != count_arg.data() + count_arg.size() || count == 0) {
            fprintf(stderr, "Invalid count '%.*s'\n", static_cast<int>(count_arg.size()),
                    count_arg.data());
            return EXIT_FAILURE;
        }
    }

    for (unsigned long i = 0; i < count; ++i) {
        std::error_code ec;
        auto token = gate.generate(ec);
        if (!token) {
            fprintf(stderr, "Token generation failed: %s\n", ec.message().c_str());
            return EXIT_FAILURE;
        }

        // Storage keys are hashed from decoded bytes
        auto raw = tokengate::core::base64url_decode(*token);
        if (!raw) {
            fprintf(stderr, "Token generation produced invalid encoding\n");
            return EXIT_FAILURE;
        }

        printf("%s %s\n", token->c_str(), gate.hash(*raw).c_str());
    }

    return EXIT_SUCCESS;
}

int run_hash(const tokengate::gateway::TokenAuthMiddleware& gate, std::string_view wire_token) {
    auto raw = tokengate::core::base64url_decode(wire_token);
    if (!raw || raw->empty()) {
        fprintf(stderr, "Token is not valid base64url\n");
        return EXIT_FAILURE;
    }

    std::string key = gate.hash(*raw);
    if (key.empty()) {
        fprintf(stderr, "Digest failed\n");
        return EXIT_FAILURE;
    }

    printf("%s\n", key.c_str());
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 4 || std::string_view(argv[1]) != "--config") {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];
    std::string_view command = argv[3];

    tokengate::control::ValidationResult validation;
    auto config = tokengate::control::ConfigLoader::load_from_file(config_path, validation);
    print_validation(validation);
    if (!config) {
        fprintf(stderr, "Failed to load configuration from %s\n", config_path.c_str());
        return EXIT_FAILURE;
    }

    if (command == "check") {
        printf("Configuration OK\n");
        return EXIT_SUCCESS;
    }

    start_logging(config->logging);

    // Lookup is irrelevant for offline commands; the gate still needs one to be valid
    std::error_code ec;
    auto gate = tokengate::gateway::build_token_auth_middleware(
        *config, [](std::string_view) { return std::string(); }, nullptr, ec);
    if (!gate) {
        fprintf(stderr, "Invalid authentication configuration: %s\n", ec.message().c_str());
        tokengate::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    int status = EXIT_FAILURE;
    if (command == "generate") {
        status = run_generate(*gate, argc > 4 ? std::string_view(argv[4]) : std::string_view{});
    } else if (command == "hash" && argc > 4) {
        status = run_hash(*gate, argv[4]);
    } else {
        print_usage(argv[0]);
    }

    tokengate::logging::shutdown_logging();
    return status;
}
