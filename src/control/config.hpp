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

// Waypoint Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint::control {

/// Redirect status codes chosen by request dispatch
struct RedirectConfig {
    uint16_t safe_method_status = 301;   // GET and HEAD
    uint16_t other_method_status = 308;  // Everything else; 307/308 keep method and body
};

/// Request dispatch behaviour
struct RouterConfig {
    // Redirect /foo/ to /foo (or the reverse) when only the other spelling is routed
    bool redirect_trailing_slash = true;

    // Clean the path and retry case-insensitively, redirecting to the registered spelling
    bool redirect_fixed_path = true;

    // Answer 405 with an Allow list when another method matches the path
    bool handle_method_not_allowed = true;

    // Answer OPTIONS automatically when no OPTIONS route matches
    bool handle_options = true;

    RedirectConfig redirect;
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";  // debug, info, warning, error
    std::string format = "text";  // text, json
    std::string output;          // Log directory (waypoint.log appended); empty = console

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Route definition
struct RouteConfig {
    std::string method = "GET";
    std::string path;     // Pattern, e.g. "/users/:id" or "/static/*filepath"
    std::string handler;  // Handler identifier reported on a match
};

/// Full Waypoint configuration
struct Config {
    RouterConfig router;
    LogConfig logging;
    std::vector<RouteConfig> routes;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

// All config types use custom from_json/to_json so that every field is optional

inline void from_json(const nlohmann::json& j, RedirectConfig& r) {
    r.safe_method_status = j.value("safe_method_status", uint16_t(301));
    r.other_method_status = j.value("other_method_status", uint16_t(308));
}

inline void to_json(nlohmann::json& j, const RedirectConfig& r) {
    j = nlohmann::json{{"safe_method_status", r.safe_method_status},
                       {"other_method_status", r.other_method_status}};
}

inline void from_json(const nlohmann::json& j, RouterConfig& r) {
    r.redirect_trailing_slash = j.value("redirect_trailing_slash", true);
    r.redirect_fixed_path = j.value("redirect_fixed_path", true);
    r.handle_method_not_allowed = j.value("handle_method_not_allowed", true);
    r.handle_options = j.value("handle_options", true);
    if (j.contains("redirect")) {
        j.at("redirect").get_to(r.redirect);
    }
}

inline void to_json(nlohmann::json& j, const RouterConfig& r) {
    j = nlohmann::json{{"redirect_trailing_slash", r.redirect_trailing_slash},
                       {"redirect_fixed_path", r.redirect_fixed_path},
                       {"handle_method_not_allowed", r.handle_method_not_allowed},
                       {"handle_options", r.handle_options},
                       {"redirect", r.redirect}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string());
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, RouteConfig& r) {
    // Required fields
    j.at("path").get_to(r.path);
    j.at("handler").get_to(r.handler);

    r.method = j.value("method", std::string("GET"));
}

inline void to_json(nlohmann::json& j, const RouteConfig& r) {
    j = nlohmann::json{{"method", r.method}, {"path", r.path}, {"handler", r.handler}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("router")) {
        j.at("router").get_to(c.router);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("routes")) {
        j.at("routes").get_to(c.routes);
    }
    c.version = j.value("version", std::string("1.0"));
    if (j.contains("description")) {
        c.description = j.at("description").get<std::string>();
    }
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["version"] = c.version;
    if (c.description) {
        j["description"] = *c.description;
    }
    j["router"] = c.router;
    j["logging"] = c.logging;
    j["routes"] = c.routes;
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
    /// Load and validate configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load and validate configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Parse JSON without validating it
    [[nodiscard]] static std::optional<Config> parse_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);

    /// Read a whole file; nullopt if it cannot be opened
    [[nodiscard]] static std::optional<std::string> read_file(std::string_view path);
};

/// Configuration manager with reload support (RCU pattern)
/// A reload hands out a new snapshot; readers keep the old one until they drop it.
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load initial configuration
    [[nodiscard]] bool load(std::string_view path);

    /// Re-read the file given to load()
    [[nodiscard]] bool reload();

    /// Get current configuration (thread-safe read)
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept;

    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }
    [[nodiscard]] bool is_loaded() const noexcept { return get() != nullptr; }

    /// Get last validation result
    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

}  // namespace waypoint::control
