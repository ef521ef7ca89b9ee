/*
 * Copyright 2025 httpgate Contributors
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

// httpgate - Main Entry Point
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "runtime/gateway.hpp"

namespace {

std::atomic<bool> g_running{true};
std::atomic<bool> g_reload_requested{false};

// Only async-signal-safe work here: the accept loop picks the flags up
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    } else if (signal == SIGHUP) {
        g_reload_requested.store(true);
    }
}

void print_usage(const char* program) {
    printf("Usage: %s [--config <config.json>]\n\n", program);
    printf("Options:\n");
    printf("  --config <path>  Configuration file (defaults are used when omitted)\n");
    printf("  --help           Show this message\n\n");
    printf("Environment overrides: LISTEN_ADDR (host:port), DOMAIN_SUFFIX, LOG_LEVEL\n");
    printf("Signals: SIGINT/SIGTERM drain and exit, SIGHUP reloads the configuration\n");
}

void print_validation(const httpgate::control::ValidationResult& validation) {
    for (const auto& error : validation.errors) {
        fprintf(stderr, "  - error: %s\n", error.c_str());
    }
    for (const auto& warning : validation.warnings) {
        fprintf(stderr, "  - warning: %s\n", warning.c_str());
    }
}

void reload(httpgate::control::ConfigManager& config_manager, httpgate::runtime::Gateway& gateway) {
    auto* logger = httpgate::logging::get_logger();
    LOG_INFO(logger, "Received SIGHUP, reloading configuration from '{}'",
             config_manager.config_path());

    if (!config_manager.reload()) {
        for (const auto& error : config_manager.last_validation().errors) {
            LOG_ERROR(logger, "Configuration error: {}", error);
        }
        LOG_ERROR(logger, "Reload failed, keeping the previous configuration");
        return;
    }

    for (const auto& warning : config_manager.last_validation().warnings) {
        LOG_WARNING(logger, "Configuration warning: {}", warning);
    }

    auto config = config_manager.get();
    httpgate::logging::set_log_level(config->logging.level);
    gateway.apply(*config);
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }
        fprintf(stderr, "Unknown argument: %s\n\n", argv[i]);
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    auto config_manager = std::make_unique<httpgate::control::ConfigManager>();
    if (!config_manager->load(config_path)) {
        fprintf(stderr, "Failed to load configuration%s%s\n", config_path.empty() ? "" : " from ",
                config_path.c_str());
        print_validation(config_manager->last_validation());
        return EXIT_FAILURE;
    }

    auto config = config_manager->get();

    httpgate::logging::init_logging_system();
    auto* logger = httpgate::logging::init_logger(config->logging);

    LOG_INFO(logger, "httpgate starting (config: {})",
             config_path.empty() ? std::string("built-in defaults") : config_path);
    for (const auto& warning : config_manager->last_validation().warnings) {
        LOG_WARNING(logger, "Configuration warning: {}", warning);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGHUP, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    int exit_code = EXIT_SUCCESS;
    {
        httpgate::runtime::Gateway gateway;
        gateway.apply(*config);

        if (auto ec = gateway.start(config->server)) {
            LOG_ERROR(logger, "Cannot listen on {}:{}: {}", config->server.listen_address,
                      config->server.listen_port, ec.message());
            fprintf(stderr, "Cannot listen on %s:%u: %s\n", config->server.listen_address.c_str(),
                    config->server.listen_port, ec.message().c_str());
            exit_code = EXIT_FAILURE;
        } else {
            auto ec = gateway.run(g_running, [&] {
                if (g_reload_requested.exchange(false)) {
                    reload(*config_manager, gateway);
                }
            });
            if (ec) {
                LOG_ERROR(logger, "Accept loop failed: {}", ec.message());
                exit_code = EXIT_FAILURE;
            }

            LOG_INFO(logger, "Shutting down");
            size_t forced = gateway.shutdown();
            if (forced > 0) {
                LOG_WARNING(logger, "{} connections did not finish within the shutdown timeout",
                            forced);
            }
        }
    }

    LOG_INFO(logger, "httpgate stopped");
    httpgate::logging::shutdown_logging();
    return exit_code;
}
