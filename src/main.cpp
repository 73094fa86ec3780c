/*
 * Copyright 2025 Hopstrip Contributors
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

// Hopstrip - Main Entry Point
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "core/server_runner.hpp"
#include "gateway/lambda_response.hpp"

namespace {

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        hopstrip::core::request_shutdown();
    } else if (signal == SIGHUP) {
        hopstrip::core::request_reload();
    }
}

void print_usage(const char* program) {
    fprintf(stderr,
            "Usage: %s --config <config.json> [--single-threaded]\n"
            "       %s --check-config <config.json>\n"
            "       %s --sanitize-lambda-response [<file>]\n",
            program, program, program);
}

void print_validation(const hopstrip::control::ValidationResult& validation) {
    if (!validation.errors.empty()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
    }
    if (!validation.warnings.empty()) {
        printf("Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            printf("  - %s\n", warning.c_str());
        }
    }
}

int check_config(const std::string& path) {
    auto config = hopstrip::control::ConfigLoader::parse_file(path);
    if (!config) {
        fprintf(stderr, "Failed to parse %s\n", path.c_str());
        return EXIT_FAILURE;
    }

    auto validation = hopstrip::control::ConfigLoader::validate(*config);
    print_validation(validation);

    if (validation.has_errors()) {
        return EXIT_FAILURE;
    }
    printf("Configuration OK: %s\n", path.c_str());
    return EXIT_SUCCESS;
}

int sanitize_lambda_response(const char* path) {
    std::string input;
    if (path) {
        std::ifstream file(path);
        if (!file) {
            fprintf(stderr, "Cannot open %s\n", path);
            return EXIT_FAILURE;
        }
        input.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    } else {
        input.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    auto document = nlohmann::json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        fprintf(stderr, "Lambda response must be a JSON object\n");
        return EXIT_FAILURE;
    }

    hopstrip::gateway::LambdaResponseSanitizer sanitizer;
    (void)sanitizer.sanitize(document);

    printf("%s\n", document.dump(2).c_str());
    return EXIT_SUCCESS;
}

int run_proxy(const std::string& config_path, bool single_threaded) {
    printf("Loading configuration from %s...\n", config_path.c_str());
    hopstrip::control::ConfigManager config_manager;

    if (!config_manager.load(config_path)) {
        fprintf(stderr, "Failed to load configuration\n");
        print_validation(config_manager.last_validation());
        return EXIT_FAILURE;
    }
    print_validation(config_manager.last_validation());

    auto config = config_manager.get();
    printf("Listening on %s:%u, upstream %s:%u\n", config->server.listen_address.c_str(),
           config->server.listen_port, config->upstream.host.c_str(), config->upstream.port);

    hopstrip::logging::init_logging_system();

    // Install signal handlers for graceful shutdown and config reload
    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal
    std::signal(SIGHUP, signal_handler);   // Config reload
    std::signal(SIGPIPE, SIG_IGN);

    std::error_code ec;
    if (single_threaded) {
        printf("Starting Hopstrip in single-threaded mode...\n");
        ec = hopstrip::core::run_simple_server(config_manager);
    } else {
        printf("Starting Hopstrip with %u worker threads...\n",
               hopstrip::core::resolve_worker_count(*config));
        ec = hopstrip::core::run_multi_threaded_server(config_manager);
    }

    hopstrip::logging::shutdown_logging();

    if (ec) {
        fprintf(stderr, "Server error: %s\n", ec.message().c_str());
        return EXIT_FAILURE;
    }

    printf("Hopstrip stopped.\n");
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::string command = argv[1];

    if (command == "--sanitize-lambda-response") {
        return sanitize_lambda_response(argc >= 3 ? argv[2] : nullptr);
    }

    if (command == "--check-config") {
        if (argc < 3) {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        return check_config(argv[2]);
    }

    if (command != "--config" || argc < 3) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    bool single_threaded = false;
    for (int i = 3; i < argc; ++i) {
        if (std::string(argv[i]) == "--single-threaded") {
            single_threaded = true;
        } else {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    return run_proxy(argv[2], single_threaded);
}
