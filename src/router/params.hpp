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

// Waypoint Route Parameters - Header

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace waypoint::router {

/// Route parameter extracted from a request path
/// key views into the router, value views into the request path
struct Param {
    std::string_view key;    // Parameter name (e.g., "id" from /:id)
    std::string_view value;  // Bytes matched in the request path

    bool operator==(const Param&) const = default;
};

/// Parameters of one lookup, in left-to-right path order
class Params {
public:
    using const_iterator = std::vector<Param>::const_iterator;

    Params() = default;

    /// Value of the first parameter called name
    [[nodiscard]] std::optional<std::string_view> by_name(std::string_view name) const noexcept;

    [[nodiscard]] const Param& operator[](size_t index) const { return params_[index]; }
    [[nodiscard]] size_t size() const noexcept { return params_.size(); }
    [[nodiscard]] bool empty() const noexcept { return params_.empty(); }
    [[nodiscard]] size_t capacity() const noexcept { return params_.capacity(); }

    [[nodiscard]] const_iterator begin() const noexcept { return params_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return params_.end(); }

    void reserve(size_t count) { params_.reserve(count); }
    void push_back(Param param) { params_.push_back(param); }
    void clear() noexcept { params_.clear(); }

    bool operator==(const Params&) const = default;

private:
    std::vector<Param> params_;
};

}  // namespace waypoint::router
