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

// Waypoint Path Cleaning - Implementation

#include "path.hpp"

namespace waypoint::http {

std::string clean_path(std::string_view path) {
    if (path.empty()) {
        return "/";
    }

    const size_t n = path.size();
    std::string out;
    out.reserve(n + 1);
    out.push_back('/');

    // r: next byte to read; out never carries a trailing '/' past the root
    size_t r = path[0] == '/' ? 1 : 0;
    bool trailing = n > 1 && path[n - 1] == '/';

    while (r < n) {
        if (path[r] == '/') {
            // Empty element
            ++r;
        } else if (path[r] == '.' && r + 1 == n) {
            trailing = true;
            ++r;
        } else if (path[r] == '.' && path[r + 1] == '/') {
            r += 2;
        } else if (path[r] == '.' && path[r + 1] == '.' && (r + 2 == n || path[r + 2] == '/')) {
            r += 3;
            if (out.size() > 1) {
                const size_t slash = out.rfind('/');
                out.resize(slash == 0 ? 1 : slash);
            }
        } else {
            if (out.size() > 1) {
                out.push_back('/');
            }
            while (r < n && path[r] != '/') {
                out.push_back(path[r++]);
            }
        }
    }

    if (trailing && out.size() > 1) {
        out.push_back('/');
    }
    return out;
}

}  // namespace waypoint::http
