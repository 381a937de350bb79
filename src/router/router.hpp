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

// Waypoint Router - Header
// Per-method trees behind a build-then-freeze API, and the request decision
// (handle, redirect, OPTIONS, 405, 404) taken on top of them

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../control/config.hpp"
#include "../http/http.hpp"
#include "../http/path.hpp"
#include "errors.hpp"
#include "params.hpp"
#include "tree.hpp"

namespace waypoint::router {

/// What the caller should do with a request
enum class Action : uint8_t { Handle, Redirect, Options, MethodNotAllowed, NotFound };

[[nodiscard]] std::string_view to_string(Action action) noexcept;

/// Request decision
/// Param values view the request path passed to resolve().
template <typename T>
struct Resolution {
    Action action = Action::NotFound;
    http::StatusCode status = http::StatusCode::NotFound;
    const T* handler = nullptr;  // Route handler, or the fallback for action (may be null)
    Params params;               // Handle only
    std::string location;        // Redirect only
    std::string allow;           // Options and MethodNotAllowed only
};

namespace detail {

void log_route_registered(http::Method method, std::string_view pattern);
void log_route_rejected(http::Method method, std::string_view pattern, const RouteError& error);

/// Redirect status for method under config
[[nodiscard]] http::StatusCode redirect_status(const control::RedirectConfig& config,
                                               http::Method method) noexcept;

/// path with its trailing slash removed, or added when it has none
[[nodiscard]] std::string toggle_trailing_slash(std::string_view path);

/// Allow header value: methods joined with ", ", OPTIONS appended when non-empty
[[nodiscard]] std::string format_allow(const std::vector<http::Method>& methods);

}  // namespace detail

template <typename T>
class RouterBuilder;

/// Immutable routing table; every operation is const and thread-safe
template <typename T>
class Router {
public:
    using Tree = Node<T>;

    Router(Router&&) noexcept = default;
    Router& operator=(Router&&) noexcept = default;
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;
    ~Router() = default;

    /// Match path in the tree for method
    [[nodiscard]] RouteLookup<T> lookup(http::Method method, std::string_view path) const;

    /// Methods other than request_method that would match path, as an Allow value.
    /// "*" lists every registered method. Empty when nothing matches.
    [[nodiscard]] std::string allowed(std::string_view path, http::Method request_method) const;

    [[nodiscard]] Resolution<T> resolve(http::Method method, std::string_view path) const;

    /// Tree for method, or null when nothing was registered for it
    [[nodiscard]] const Tree* tree(http::Method method) const noexcept;

    [[nodiscard]] const control::RouterConfig& config() const noexcept { return config_; }

    /// Stats summed over every method tree (max_depth is the deepest tree)
    [[nodiscard]] typename Tree::Stats get_stats() const;

private:
    friend class RouterBuilder<T>;

    explicit Router(control::RouterConfig config) : config_(std::move(config)) {}

    control::RouterConfig config_;
    std::array<std::unique_ptr<Tree>, http::kMethodCount> trees_;
    std::optional<T> not_found_;
    std::optional<T> method_not_allowed_;
    std::optional<T> global_options_;
    std::string global_allowed_;
};

/// Collects routes and fallback handlers, then freezes them into a Router
template <typename T>
class RouterBuilder {
public:
    explicit RouterBuilder(control::RouterConfig config = {}) : router_(std::move(config)) {}

    /// Register handler for method and pattern; throws RouteError
    RouterBuilder& handle(http::Method method, std::string_view pattern, T handler);

    RouterBuilder& get(std::string_view pattern, T handler) {
        return handle(http::Method::GET, pattern, std::move(handler));
    }
    RouterBuilder& head(std::string_view pattern, T handler) {
        return handle(http::Method::HEAD, pattern, std::move(handler));
    }
    RouterBuilder& options(std::string_view pattern, T handler) {
        return handle(http::Method::OPTIONS, pattern, std::move(handler));
    }
    RouterBuilder& post(std::string_view pattern, T handler) {
        return handle(http::Method::POST, pattern, std::move(handler));
    }
    RouterBuilder& put(std::string_view pattern, T handler) {
        return handle(http::Method::PUT, pattern, std::move(handler));
    }
    RouterBuilder& patch(std::string_view pattern, T handler) {
        return handle(http::Method::PATCH, pattern, std::move(handler));
    }
    RouterBuilder& del(std::string_view pattern, T handler) {
        return handle(http::Method::DELETE, pattern, std::move(handler));
    }

    RouterBuilder& not_found(T handler) {
        router_.not_found_ = std::move(handler);
        return *this;
    }
    RouterBuilder& method_not_allowed(T handler) {
        router_.method_not_allowed_ = std::move(handler);
        return *this;
    }
    RouterBuilder& global_options(T handler) {
        router_.global_options_ = std::move(handler);
        return *this;
    }

    [[nodiscard]] Router<T> build() &&;

private:
    Router<T> router_;
};

// ============================
// RouterBuilder Implementation
// ============================

template <typename T>
RouterBuilder<T>& RouterBuilder<T>::handle(http::Method method, std::string_view pattern,
                                           T handler) {
    try {
        if (method == http::Method::UNKNOWN) {
            throw RouteError(RouteErrorKind::InvalidMethod, std::string(pattern),
                             fmt::format("route '{}' needs a concrete HTTP method", pattern));
        }
        auto& tree = router_.trees_[http::method_index(method)];
        if (!tree) {
            tree = std::make_unique<Node<T>>();
        }
        tree->add_route(pattern, std::move(handler));
    } catch (const RouteError& e) {
        detail::log_route_rejected(method, pattern, e);
        throw;
    }
    detail::log_route_registered(method, pattern);
    return *this;
}

template <typename T>
Router<T> RouterBuilder<T>::build() && {
    std::vector<http::Method> methods;
    for (http::Method method : http::kMethods) {
        if (method != http::Method::OPTIONS && router_.tree(method) != nullptr) {
            methods.push_back(method);
        }
    }
    router_.global_allowed_ = detail::format_allow(methods);
    return std::move(router_);
}

// =====================
// Router Implementation
// =====================

template <typename T>
const Node<T>* Router<T>::tree(http::Method method) const noexcept {
    if (method == http::Method::UNKNOWN) {
        return nullptr;
    }
    const auto& tree = trees_[http::method_index(method)];
    // A tree whose only registration was rejected stays empty
    if (!tree || tree->empty()) {
        return nullptr;
    }
    return tree.get();
}

template <typename T>
RouteLookup<T> Router<T>::lookup(http::Method method, std::string_view path) const {
    const Tree* root = tree(method);
    if (root == nullptr) {
        return RouteLookup<T>{};
    }
    return root->get_value(path);
}

template <typename T>
std::string Router<T>::allowed(std::string_view path, http::Method request_method) const {
    if (path == "*") {
        return global_allowed_;
    }

    std::vector<http::Method> methods;
    for (http::Method method : http::kMethods) {
        if (method == request_method || method == http::Method::OPTIONS) {
            continue;
        }
        const Tree* root = tree(method);
        if (root != nullptr && root->get_value(path).matched()) {
            methods.push_back(method);
        }
    }
    return detail::format_allow(methods);
}

template <typename T>
Resolution<T> Router<T>::resolve(http::Method method, std::string_view path) const {
    Resolution<T> resolution;

    if (const Tree* root = tree(method)) {
        RouteLookup<T> match = root->get_value(path);
        if (match.matched()) {
            resolution.action = Action::Handle;
            resolution.status = http::StatusCode::OK;
            resolution.handler = match.value;
            resolution.params = std::move(match.params);
            return resolution;
        }

        if (method != http::Method::CONNECT && path != "/") {
            std::optional<std::string> location;
            if (match.tsr && config_.redirect_trailing_slash) {
                location = detail::toggle_trailing_slash(path);
            } else if (config_.redirect_fixed_path) {
                location = root->find_case_insensitive_path(http::clean_path(path),
                                                            config_.redirect_trailing_slash);
            }
            if (location) {
                resolution.action = Action::Redirect;
                resolution.status = detail::redirect_status(config_.redirect, method);
                resolution.location = std::move(*location);
                return resolution;
            }
        }
    }

    if (method == http::Method::OPTIONS && config_.handle_options) {
        std::string allow = allowed(path, method);
        if (!allow.empty()) {
            resolution.action = Action::Options;
            resolution.status = http::StatusCode::OK;
            resolution.handler = global_options_ ? &*global_options_ : nullptr;
            resolution.allow = std::move(allow);
            return resolution;
        }
    } else if (config_.handle_method_not_allowed) {
        std::string allow = allowed(path, method);
        if (!allow.empty()) {
            resolution.action = Action::MethodNotAllowed;
            resolution.status = http::StatusCode::MethodNotAllowed;
            resolution.handler = method_not_allowed_ ? &*method_not_allowed_ : nullptr;
            resolution.allow = std::move(allow);
            return resolution;
        }
    }

    resolution.handler = not_found_ ? &*not_found_ : nullptr;
    return resolution;
}

template <typename T>
typename Node<T>::Stats Router<T>::get_stats() const {
    typename Tree::Stats total;
    for (http::Method method : http::kMethods) {
        if (const Tree* root = tree(method)) {
            auto stats = root->get_stats();
            total.total_routes += stats.total_routes;
            total.total_nodes += stats.total_nodes;
            total.max_depth = std::max(total.max_depth, stats.max_depth);
        }
    }
    return total;
}

}  // namespace waypoint::router
