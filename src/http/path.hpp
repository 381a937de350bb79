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

// Waypoint Path Cleaning - Header

#pragma once

#include <string>
#include <string_view>

namespace waypoint::http {

/// Lexically canonicalize a URL path
///
/// 1. Replace multiple slashes with a single slash
/// 2. Drop each "." path element
/// 3. Drop each ".." element together with the element before it
/// 4. Drop ".." elements that would climb above the root
///
/// The result always starts with '/'; an empty input becomes "/". A trailing
/// slash on the input (or a trailing "." element) is kept.
[[nodiscard]] std::string clean_path(std::string_view path);

}  // namespace waypoint::http
