/*
 * Copyright 2025 Waypoint Contributors
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

// Waypoint Route Resolver - Main Entry Point
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "http/http.hpp"
#include "router/errors.hpp"
#include "router/factory.hpp"
#include "router/router.hpp"

namespace {

void print_usage(const char* program) {
    fprintf(stderr, "Usage: %s --config <routes.json> [METHOD] <path>...\n", program);
}

void print_resolution(waypoint::http::Method method, const std::string& path,
                      const waypoint::router::Resolution<std::string>& resolution) {
    using waypoint::router::Action;

    const auto status = static_cast<unsigned>(waypoint::http::to_number(resolution.status));
    printf("%s %s -> %u %s", std::string(waypoint::http::to_string(method)).c_str(),
           path.c_str(), status,
           std::string(waypoint::router::to_string(resolution.action)).c_str());

    switch (resolution.action) {
        case Action::Handle:
            printf(" handler=%s", resolution.handler->c_str());
            for (const auto& param : resolution.params) {
                printf(" %s=%s", std::string(param.key).c_str(),
                       std::string(param.value).c_str());
            }
            break;
        case Action::Redirect:
            printf(" location=%s", resolution.location.c_str());
            break;
        case Action::Options:
        case Action::MethodNotAllowed:
            printf(" allow=\"%s\"", resolution.allow.c_str());
            break;
        case Action::NotFound:
            break;
    }
    printf("\n");
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 4 || std::string(argv[1]) != "--config") {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];

    auto config_manager = std::make_unique<waypoint::control::ConfigManager>();
    if (!config_manager->load(config_path)) {
        fprintf(stderr, "Failed to load configuration from %s\n", config_path.c_str());

        const auto& validation = config_manager->last_validation();
        if (!validation.errors.empty()) {
            fprintf(stderr, "Configuration validation errors:\n");
            for (const auto& error : validation.errors) {
                fprintf(stderr, "  - %s\n", error.c_str());
            }
        }
        return EXIT_FAILURE;
    }

    auto config_ptr = config_manager->get();
    if (!config_ptr) {
        fprintf(stderr, "Failed to get configuration\n");
        return EXIT_FAILURE;
    }
    const waypoint::control::Config& config = *config_ptr;

    for (const auto& warning : config_manager->last_validation().warnings) {
        fprintf(stderr, "Warning: %s\n", warning.c_str());
    }

    waypoint::logging::init_logging_system();
    auto* logger = waypoint::logging::init_logger(config.logging);

    int first_path = 3;
    auto method = waypoint::http::parse_method(argv[3]);
    if (method == waypoint::http::Method::UNKNOWN) {
        method = waypoint::http::Method::GET;
    } else {
        ++first_path;
    }
    if (first_path >= argc) {
        print_usage(argv[0]);
        waypoint::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    int exit_code = EXIT_SUCCESS;
    try {
        const auto router = waypoint::router::build_router(config);

        for (int i = first_path; i < argc; ++i) {
            std::string path = argv[i];
            auto resolution = router.resolve(method, path);
            if (logger != nullptr) {
                WAYPOINT_LOG_DISPATCH(logger, waypoint::http::to_string(method), path,
                                      waypoint::router::to_string(resolution.action),
                                      waypoint::http::to_number(resolution.status),
                                      resolution.action == waypoint::router::Action::Redirect
                                          ? resolution.location
                                          : (resolution.handler ? *resolution.handler
                                                                : std::string()));
            }
            print_resolution(method, path, resolution);
        }
    } catch (const waypoint::router::RouteError& e) {
        fprintf(stderr, "Route registration failed: %s\n", e.what());
        exit_code = EXIT_FAILURE;
    }

    waypoint::logging::shutdown_logging();
    return exit_code;
}
