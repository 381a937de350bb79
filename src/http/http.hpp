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

// Waypoint HTTP Vocabulary - Header
// Methods and status codes shared by the router and its configuration

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace waypoint::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// Number of routable methods (UNKNOWN excluded)
inline constexpr size_t kMethodCount = static_cast<size_t>(Method::UNKNOWN);

/// Routable methods in declaration order
inline constexpr std::array<Method, kMethodCount> kMethods = {
    Method::GET,     Method::POST,  Method::PUT,     Method::DELETE, Method::HEAD,
    Method::OPTIONS, Method::PATCH, Method::CONNECT, Method::TRACE,
};

/// HTTP status codes produced by request dispatch
enum class StatusCode : uint16_t {
    OK = 200,

    MovedPermanently = 301,
    Found = 302,
    SeeOther = 303,
    TemporaryRedirect = 307,
    PermanentRedirect = 308,

    NotFound = 404,
    MethodNotAllowed = 405,
};

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert string to Method (exact, upper-case token)
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Convert StatusCode to reason phrase
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Numeric value of a status code
[[nodiscard]] constexpr uint16_t to_number(StatusCode code) noexcept {
    return static_cast<uint16_t>(code);
}

/// True for 301, 302, 303, 307 and 308
[[nodiscard]] bool is_redirect_status(uint16_t code) noexcept;

/// Index of a routable method into per-method tables
[[nodiscard]] constexpr size_t method_index(Method method) noexcept {
    return static_cast<size_t>(method);
}

}  // namespace waypoint::http
