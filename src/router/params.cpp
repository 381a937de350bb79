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

// Waypoint Route Parameters - Implementation

#include "params.hpp"

namespace waypoint::router {

std::optional<std::string_view> Params::by_name(std::string_view name) const noexcept {
    for (const auto& param : params_) {
        if (param.key == name) {
            return param.value;
        }
    }
    return std::nullopt;
}

}  // namespace waypoint::router
