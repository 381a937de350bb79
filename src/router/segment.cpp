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

// Waypoint Route Segments - Implementation

#include "segment.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>

#include "../core/simd.hpp"
#include "errors.hpp"

namespace waypoint::router {

Wildcard find_wildcard(std::string_view pattern, size_t from) noexcept {
    Wildcard wildcard;
    if (from >= pattern.size()) {
        return wildcard;
    }

    const std::string_view rest = pattern.substr(from);
    const size_t start = simd::find_wildcard_marker(rest.data(), rest.size());
    if (start == rest.size()) {
        return wildcard;
    }

    const std::string_view tail = rest.substr(start);
    const size_t end = segment_end(tail);

    wildcard.token = tail.substr(0, end);
    wildcard.pos = from + start;
    wildcard.kind = tail.front() == ':' ? NodeKind::Param : NodeKind::CatchAll;
    wildcard.valid = wildcard.name().find_first_of(":*") == std::string_view::npos;
    return wildcard;
}

uint8_t count_params(std::string_view pattern) noexcept {
    size_t count = 0;
    size_t pos = 0;
    while (pos < pattern.size()) {
        pos += simd::find_wildcard_marker(pattern.data() + pos, pattern.size() - pos);
        if (pos == pattern.size()) {
            break;
        }
        ++count;
        ++pos;
    }
    return static_cast<uint8_t>(std::min<size_t>(count, kMaxParamCount));
}

size_t longest_common_prefix(std::string_view a, std::string_view b) noexcept {
    return simd::common_prefix_length(a.data(), b.data(), std::min(a.size(), b.size()));
}

size_t segment_end(std::string_view path) noexcept {
    return simd::find_char(path.data(), path.size(), '/');
}

void validate_pattern(std::string_view pattern) {
    if (pattern.empty()) {
        throw RouteError(RouteErrorKind::EmptyPattern, std::string(pattern),
                         "route pattern must not be empty");
    }
    if (pattern.front() != '/') {
        throw RouteError(RouteErrorKind::MissingLeadingSlash, std::string(pattern),
                         fmt::format("path must begin with '/' in path '{}'", pattern));
    }

    for (Wildcard wildcard = find_wildcard(pattern); wildcard.found();
         wildcard = find_wildcard(pattern, wildcard.end())) {
        if (!wildcard.valid) {
            throw RouteError(RouteErrorKind::MultipleWildcardsInSegment, std::string(pattern),
                             fmt::format("only one wildcard per path segment is allowed, has: "
                                         "'{}' in path '{}'",
                                         wildcard.token, pattern));
        }
        if (wildcard.name().empty()) {
            throw RouteError(RouteErrorKind::UnnamedWildcard, std::string(pattern),
                             fmt::format("wildcards must be named with a non-empty name in path '{}'",
                                         pattern));
        }
        if (wildcard.kind != NodeKind::CatchAll) {
            continue;
        }
        if (wildcard.end() != pattern.size()) {
            throw RouteError(RouteErrorKind::CatchAllNotAtEnd, std::string(pattern),
                             fmt::format("catch-all routes are only allowed at the end of the path "
                                         "in path '{}'",
                                         pattern));
        }
        // pos >= 1 here: pattern[0] is '/'
        if (pattern[wildcard.pos - 1] != '/') {
            throw RouteError(RouteErrorKind::MissingSlashBeforeCatchAll, std::string(pattern),
                             fmt::format("no / before catch-all in path '{}'", pattern));
        }
    }
}

bool has_prefix_ignore_case(std::string_view b, std::string_view a) noexcept {
    return b.size() >= a.size() && simd::equals_ignore_case(a.data(), b.data(), a.size());
}

}  // namespace waypoint::router
