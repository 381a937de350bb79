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

// Waypoint Configuration - Implementation

#include "config.hpp"

#include <fmt/format.h>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

#include "../http/http.hpp"
#include "../router/errors.hpp"    // For RouteError
#include "../router/segment.hpp"  // For route pattern syntax checks

namespace waypoint::control {

static void validate_router_config(const RouterConfig& router, ValidationResult& result);
static void validate_log_config(const LogConfig& logging, ValidationResult& result);
static void validate_routes(const std::vector<RouteConfig>& routes, ValidationResult& result);

// ConfigLoader implementation

std::optional<std::string> ConfigLoader::read_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    auto json = read_file(path);
    if (!json) {
        return std::nullopt;
    }
    return load_from_json(*json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    auto config = parse_json(json);
    if (!config) {
        return std::nullopt;
    }

    if (validate(*config).has_errors()) {
        return std::nullopt;
    }
    return config;
}

std::optional<Config> ConfigLoader::parse_json(std::string_view json) {
    try {
        auto j = nlohmann::json::parse(json);
        return j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        // Logging is configured from this file, so report straight to stderr
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    validate_router_config(config.router, result);
    validate_log_config(config.logging, result);
    validate_routes(config.routes, result);

    return result;
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

// Validation helpers

static void validate_router_config(const RouterConfig& router, ValidationResult& result) {
    const auto& redirect = router.redirect;

    if (!http::is_redirect_status(redirect.safe_method_status)) {
        result.add_error(fmt::format(
            "router.redirect.safe_method_status must be one of 301, 302, 303, 307, 308 (got {})",
            redirect.safe_method_status));
    }

    if (!http::is_redirect_status(redirect.other_method_status)) {
        result.add_error(fmt::format(
            "router.redirect.other_method_status must be one of 301, 302, 303, 307, 308 (got {})",
            redirect.other_method_status));
    } else if (redirect.other_method_status < 307) {
        result.add_warning(fmt::format(
            "router.redirect.other_method_status {} lets clients change POST/PUT/... into GET",
            redirect.other_method_status));
    }
}

static void validate_log_config(const LogConfig& logging, ValidationResult& result) {
    static const std::set<std::string> kLevels = {"debug", "info", "warning", "warn", "error"};
    if (kLevels.count(logging.level) == 0) {
        result.add_error("logging.level must be one of debug, info, warning, error (got '" +
                         logging.level + "')");
    }

    if (logging.format != "text" && logging.format != "json") {
        result.add_error("logging.format must be 'text' or 'json' (got '" + logging.format + "')");
    }

    if (logging.format == "json" && logging.output.empty()) {
        result.add_warning("logging.format 'json' only applies to file output; console logs are text");
    }

    if (logging.rotation.max_size_mb == 0) {
        result.add_error("logging.rotation.max_size_mb must be > 0");
    }
    if (logging.rotation.max_files == 0) {
        result.add_error("logging.rotation.max_files must be > 0");
    }
}

static void validate_routes(const std::vector<RouteConfig>& routes, ValidationResult& result) {
    if (routes.empty()) {
        result.add_warning("No routes configured; every request will be answered with 404");
        return;
    }

    std::set<std::pair<std::string, std::string>> seen;

    for (size_t i = 0; i < routes.size(); ++i) {
        const auto& route = routes[i];
        const std::string context = fmt::format("routes[{}] ({} {})", i, route.method, route.path);

        if (http::parse_method(route.method) == http::Method::UNKNOWN) {
            result.add_error(context + ": unknown method '" + route.method + "'");
        }

        if (route.handler.empty()) {
            result.add_error(context + ": handler must not be empty");
        }

        try {
            router::validate_pattern(route.path);
        } catch (const router::RouteError& e) {
            result.add_error(context + ": " + e.what());
            continue;
        }

        if (!seen.emplace(route.method, route.path).second) {
            result.add_error(context + ": duplicate route");
        }
    }
}

// ConfigManager implementation

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;
    return reload();
}

bool ConfigManager::reload() {
    if (config_path_.empty()) {
        return false;
    }

    last_validation_ = ValidationResult{};

    auto json = ConfigLoader::read_file(config_path_);
    if (!json) {
        last_validation_.add_error("Cannot open configuration file '" + config_path_ + "'");
        return false;
    }

    auto maybe_config = ConfigLoader::parse_json(*json);
    if (!maybe_config) {
        last_validation_.add_error("Configuration file '" + config_path_ + "' is not valid JSON");
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    // RCU: readers holding the old snapshot keep it alive
    auto new_config = std::make_shared<const Config>(std::move(*maybe_config));
    std::atomic_store(&current_config_, std::move(new_config));
    return true;
}

std::shared_ptr<const Config> ConfigManager::get() const noexcept {
    return std::atomic_load(&current_config_);
}

}  // namespace waypoint::control
