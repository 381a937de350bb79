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

// Waypoint Router - Implementation

#include "router.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "../core/logging.hpp"

namespace waypoint::router {

std::string_view to_string(Action action) noexcept {
    switch (action) {
        case Action::Handle:
            return "handle";
        case Action::Redirect:
            return "redirect";
        case Action::Options:
            return "options";
        case Action::MethodNotAllowed:
            return "method_not_allowed";
        case Action::NotFound:
            return "not_found";
    }
    return "not_found";
}

namespace detail {

void log_route_registered(http::Method method, std::string_view pattern) {
    if (auto* logger = logging::get_current_logger()) {
        WAYPOINT_LOG_ROUTE(logger, http::to_string(method), pattern);
    }
}

void log_route_rejected(http::Method method, std::string_view pattern, const RouteError& error) {
    if (auto* logger = logging::get_current_logger()) {
        WAYPOINT_LOG_ROUTE_ERROR(logger, http::to_string(method), pattern,
                                 to_string(error.kind()), error.what());
    }
}

http::StatusCode redirect_status(const control::RedirectConfig& config,
                                 http::Method method) noexcept {
    const bool safe = method == http::Method::GET || method == http::Method::HEAD;
    return static_cast<http::StatusCode>(safe ? config.safe_method_status
                                              : config.other_method_status);
}

std::string toggle_trailing_slash(std::string_view path) {
    if (path.size() > 1 && path.back() == '/') {
        return std::string(path.substr(0, path.size() - 1));
    }
    std::string location;
    location.reserve(path.size() + 1);
    location.append(path);
    location.push_back('/');
    return location;
}

std::string format_allow(const std::vector<http::Method>& methods) {
    if (methods.empty()) {
        return {};
    }
    std::vector<std::string_view> names;
    names.reserve(methods.size() + 1);
    for (http::Method method : methods) {
        names.push_back(http::to_string(method));
    }
    names.push_back(http::to_string(http::Method::OPTIONS));
    return fmt::format("{}", fmt::join(names, ", "));
}

}  // namespace detail

}  // namespace waypoint::router
