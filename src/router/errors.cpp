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

// Waypoint Route Errors - Implementation

#include "errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace waypoint::router {

RouteError::RouteError(RouteErrorKind kind, std::string pattern, const std::string& message)
    : std::runtime_error(fmt::format("{}: {}", to_string(kind), message)),
      kind_(kind),
      pattern_(std::move(pattern)) {}

std::string_view to_string(RouteErrorKind kind) noexcept {
    switch (kind) {
        case RouteErrorKind::EmptyPattern:
            return "empty_pattern";
        case RouteErrorKind::MissingLeadingSlash:
            return "missing_leading_slash";
        case RouteErrorKind::InvalidMethod:
            return "invalid_method";
        case RouteErrorKind::UnnamedWildcard:
            return "unnamed_wildcard";
        case RouteErrorKind::MultipleWildcardsInSegment:
            return "multiple_wildcards_in_segment";
        case RouteErrorKind::CatchAllNotAtEnd:
            return "catch_all_not_at_end";
        case RouteErrorKind::MissingSlashBeforeCatchAll:
            return "missing_slash_before_catch_all";
        case RouteErrorKind::WildcardConflict:
            return "wildcard_conflict";
        case RouteErrorKind::DuplicateRoute:
            return "duplicate_route";
    }
    return "unknown";
}

}  // namespace waypoint::router
