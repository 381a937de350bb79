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

// Waypoint Route Segments - Header
// Classifies the bytes of a route pattern into static text and wildcards

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace waypoint::router {

/// Kind of a radix tree node (and of the pattern segment it was built from)
enum class NodeKind : uint8_t {
    Static,    // Literal bytes
    Param,     // :name, matches up to the next '/'
    CatchAll,  // *name, matches the rest of the path
};

/// Wildcard found in a route pattern
struct Wildcard {
    std::string_view token;  // Marker plus name, e.g. ":id" or "*filepath"
    size_t pos = std::string_view::npos;  // Offset of the marker in the scanned pattern
    NodeKind kind = NodeKind::Static;
    bool valid = false;  // False if the name contains another ':' or '*'

    [[nodiscard]] bool found() const noexcept { return pos != std::string_view::npos; }
    [[nodiscard]] size_t end() const noexcept { return pos + token.size(); }
    [[nodiscard]] std::string_view name() const noexcept { return token.substr(1); }
};

/// Upper bound for the cached parameter count of a node
inline constexpr uint8_t kMaxParamCount = UINT8_MAX;

/// Find the first wildcard in pattern at or after from
/// The token runs to the next '/' or to the end of the pattern
[[nodiscard]] Wildcard find_wildcard(std::string_view pattern, size_t from = 0) noexcept;

/// Number of wildcard markers in pattern (saturates at kMaxParamCount)
[[nodiscard]] uint8_t count_params(std::string_view pattern) noexcept;

/// Length of the longest common byte prefix of a and b
[[nodiscard]] size_t longest_common_prefix(std::string_view a, std::string_view b) noexcept;

/// Offset of the next '/' in path, or path.size()
[[nodiscard]] size_t segment_end(std::string_view path) noexcept;

/// Check the syntax of a route pattern before it touches a tree
/// Throws RouteError for an empty pattern, a missing leading '/', an unnamed
/// wildcard, two wildcards in one segment, or a misplaced catch-all
void validate_pattern(std::string_view pattern);

/// ASCII case-insensitive comparison of a against the first a.size() bytes of b
[[nodiscard]] bool has_prefix_ignore_case(std::string_view b, std::string_view a) noexcept;

}  // namespace waypoint::router
