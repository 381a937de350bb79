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

// Waypoint Radix Tree - Header
// Compressing trie of route patterns for one HTTP method
//
// Build phase: add_route() mutates the tree and is not thread-safe.
// Serve phase: get_value() and find_case_insensitive_path() never mutate and
// may run concurrently once registration has finished.

#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../core/simd.hpp"
#include "errors.hpp"
#include "params.hpp"
#include "segment.hpp"

namespace waypoint::router {

/// Result of a tree lookup
/// On a miss, value is null and tsr tells whether the same path with a
/// trailing slash added or removed would match
template <typename T>
struct RouteLookup {
    const T* value = nullptr;  // Owned by the tree
    Params params;
    bool tsr = false;

    [[nodiscard]] bool matched() const noexcept { return value != nullptr; }

    bool operator==(const RouteLookup&) const = default;
};

/// Radix tree node
/// The root node is the tree; every node exclusively owns its children.
template <typename T>
class Node {
public:
    struct Stats {
        size_t total_routes = 0;
        size_t total_nodes = 0;
        size_t max_depth = 0;
    };

    Node() = default;
    ~Node() = default;

    // Non-copyable, movable
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;
    Node(Node&&) noexcept = default;
    Node& operator=(Node&&) noexcept = default;

    /// Register handler for pattern; throws RouteError on any conflict
    void add_route(std::string_view pattern, T handler);

    /// Match a request path
    [[nodiscard]] RouteLookup<T> get_value(std::string_view path) const;

    /// Find the registered spelling of path, comparing ASCII case-insensitively.
    /// Parameter values are copied from path as-is. With fix_trailing_slash, a
    /// path that only matches after adding or removing a trailing '/' is accepted.
    [[nodiscard]] std::optional<std::string> find_case_insensitive_path(
        std::string_view path, bool fix_trailing_slash) const;

    [[nodiscard]] bool empty() const noexcept { return fragment_.empty() && children_.empty(); }
    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const std::string& fragment() const noexcept { return fragment_; }
    [[nodiscard]] NodeKind kind() const noexcept { return kind_; }
    [[nodiscard]] uint32_t priority() const noexcept { return priority_; }
    [[nodiscard]] uint8_t max_params() const noexcept { return max_params_; }

private:
    static RouteLookup<T> miss(bool tsr) {
        RouteLookup<T> result;
        result.tsr = tsr;
        return result;
    }

    void insert_child(uint8_t num_params, std::string_view path, std::string_view full, T handler);
    void split(size_t pos);
    size_t increment_child_priority(size_t pos);
    void set_handler(T handler, std::string_view full);

    // Catch-all wildcard child, if any
    [[nodiscard]] const Node* catch_all_child() const noexcept;

    // True if the path ending exactly at this node matches a route
    [[nodiscard]] bool terminates() const noexcept;

    // Some route registered at or below this node (for error messages)
    [[nodiscard]] std::string_view first_route() const noexcept;

    bool find_case_insensitive(std::string_view path, bool fix_trailing_slash, const Node* parent,
                               std::string& out) const;

    void collect_stats(Stats& stats, size_t depth) const;

    std::string fragment_;  // Static bytes, or the wildcard token for Param/CatchAll
    std::string name_;      // Parameter name (Param/CatchAll)
    std::string indices_;   // First byte of each static child, parallel to children_
    std::vector<std::unique_ptr<Node>> children_;
    std::optional<T> handler_;
    std::string pattern_;  // Full pattern registered at this node
    uint32_t priority_ = 0;
    uint8_t max_params_ = 0;
    NodeKind kind_ = NodeKind::Static;
    bool wild_child_ = false;  // children_ holds exactly one Param/CatchAll node
};

// Insertion

template <typename T>
void Node<T>::add_route(std::string_view pattern, T handler) {
    validate_pattern(pattern);

    const std::string_view full = pattern;
    std::string_view path = pattern;
    uint8_t num_params = count_params(path);

    Node* n = this;
    n->priority_++;

    if (n->empty()) {
        n->max_params_ = num_params;
        n->insert_child(num_params, path, full, std::move(handler));
        return;
    }

    while (true) {
        n->max_params_ = std::max(n->max_params_, num_params);

        // The common prefix never contains ':' or '*': stored fragments of
        // static nodes are wildcard-free
        const size_t common = longest_common_prefix(path, n->fragment_);
        if (common < n->fragment_.size()) {
            n->split(common);
        }

        if (common == path.size()) {
            if (n->handler_) {
                throw RouteError(RouteErrorKind::DuplicateRoute, std::string(full),
                                 fmt::format("a handler is already registered for path '{}'", full));
            }
            if (const Node* catch_all = n->catch_all_child()) {
                throw RouteError(RouteErrorKind::WildcardConflict, std::string(full),
                                 fmt::format("path '{}' conflicts with catch-all route '{}'", full,
                                             catch_all->pattern_));
            }
            n->set_handler(std::move(handler), full);
            return;
        }

        path.remove_prefix(common);

        if (n->wild_child_) {
            Node* wild = n->children_.front().get();
            wild->priority_++;
            wild->max_params_ = std::max(wild->max_params_, num_params);
            if (num_params > 0) {
                --num_params;
            }

            const std::string_view token = wild->fragment_;
            if (wild->kind_ == NodeKind::Param && path.starts_with(token) &&
                (path.size() == token.size() || path[token.size()] == '/')) {
                n = wild;
                continue;
            }
            if (wild->kind_ == NodeKind::CatchAll && path == token) {
                throw RouteError(RouteErrorKind::DuplicateRoute, std::string(full),
                                 fmt::format("a handler is already registered for path '{}'", full));
            }

            const std::string_view segment =
                wild->kind_ == NodeKind::CatchAll ? path : path.substr(0, segment_end(path));
            const auto consumed = static_cast<size_t>(path.data() - full.data());
            throw RouteError(
                RouteErrorKind::WildcardConflict, std::string(full),
                fmt::format("'{}' in new path '{}' conflicts with existing wildcard '{}' in existing "
                            "prefix '{}{}' (route '{}')",
                            segment, full, token, full.substr(0, consumed), token, wild->first_route()));
        }

        const char c = path.front();

        // '/' after a parameter: the parameter has exactly one static child
        if (n->kind_ == NodeKind::Param && c == '/' && n->children_.size() == 1) {
            n = n->children_.front().get();
            n->priority_++;
            continue;
        }

        const size_t index = n->indices_.find(c);
        if (index != std::string::npos) {
            n = n->children_[n->increment_child_priority(index)].get();
            continue;
        }

        if (c != ':' && c != '*') {
            n->indices_.push_back(c);
            auto child = std::make_unique<Node>();
            child->max_params_ = num_params;
            n->children_.push_back(std::move(child));
            n = n->children_[n->increment_child_priority(n->indices_.size() - 1)].get();
        }
        n->insert_child(num_params, path, full, std::move(handler));
        return;
    }
}

template <typename T>
void Node<T>::insert_child(uint8_t num_params, std::string_view path, std::string_view full,
                           T handler) {
    Node* n = this;
    size_t offset = 0;  // Bytes of path already stored in ancestors of n

    for (Wildcard wildcard = find_wildcard(path); wildcard.found();
         wildcard = find_wildcard(path, offset)) {
        // A wildcard must be the only way forward from its parent
        if (!n->children_.empty()) {
            throw RouteError(RouteErrorKind::WildcardConflict, std::string(full),
                             fmt::format("wildcard route '{}' conflicts with existing children in "
                                         "path '{}' (route '{}')",
                                         wildcard.token, full, n->first_route()));
        }

        auto child = std::make_unique<Node>();
        child->kind_ = wildcard.kind;
        child->fragment_ = std::string(wildcard.token);
        child->name_ = std::string(wildcard.name());

        if (wildcard.kind == NodeKind::CatchAll) {
            if (wildcard.pos == 0) {
                // n already ends with the '/' in front of the catch-all
                if (n->handler_) {
                    throw RouteError(RouteErrorKind::WildcardConflict, std::string(full),
                                     fmt::format("catch-all conflicts with existing handle for the "
                                                 "path segment root in path '{}' (route '{}')",
                                                 full, n->pattern_));
                }
            } else {
                n->fragment_ = std::string(path.substr(offset, wildcard.pos - offset));
            }

            child->max_params_ = 1;
            child->priority_ = 1;
            child->set_handler(std::move(handler), full);

            n->max_params_ = std::max<uint8_t>(n->max_params_, 1);
            n->wild_child_ = true;
            n->children_.push_back(std::move(child));
            return;
        }

        if (wildcard.pos > 0) {
            n->fragment_ = std::string(path.substr(offset, wildcard.pos - offset));
        }

        child->max_params_ = num_params;
        n->wild_child_ = true;
        n->children_.push_back(std::move(child));
        n = n->children_.front().get();
        n->priority_++;
        if (num_params > 0) {
            --num_params;
        }

        offset = wildcard.end();
        if (offset < path.size()) {
            // Static continuation, always starting with '/'
            auto next = std::make_unique<Node>();
            next->max_params_ = num_params;
            next->priority_ = 1;
            n->children_.push_back(std::move(next));
            n = n->children_.front().get();
        }
    }

    if (n->kind_ == NodeKind::Static) {
        n->fragment_ = std::string(path.substr(offset));
    }
    n->set_handler(std::move(handler), full);
}

template <typename T>
void Node<T>::split(size_t pos) {
    auto child = std::make_unique<Node>();
    child->fragment_ = fragment_.substr(pos);
    child->wild_child_ = wild_child_;
    child->indices_ = std::move(indices_);
    child->children_ = std::move(children_);
    child->handler_ = std::exchange(handler_, std::nullopt);
    child->pattern_ = std::exchange(pattern_, std::string());
    child->priority_ = priority_ - 1;
    for (const auto& grandchild : child->children_) {
        child->max_params_ = std::max(child->max_params_, grandchild->max_params_);
    }

    indices_.assign(1, fragment_[pos]);
    fragment_.resize(pos);
    children_.clear();
    children_.push_back(std::move(child));
    wild_child_ = false;
}

template <typename T>
size_t Node<T>::increment_child_priority(size_t pos) {
    const uint32_t priority = ++children_[pos]->priority_;

    // Move towards the front past lower-priority siblings; equal ones keep their order
    size_t new_pos = pos;
    while (new_pos > 0 && children_[new_pos - 1]->priority_ < priority) {
        --new_pos;
    }

    if (new_pos != pos) {
        std::rotate(children_.begin() + new_pos, children_.begin() + pos, children_.begin() + pos + 1);
        std::rotate(indices_.begin() + new_pos, indices_.begin() + pos, indices_.begin() + pos + 1);
    }
    return new_pos;
}

template <typename T>
void Node<T>::set_handler(T handler, std::string_view full) {
    handler_.emplace(std::move(handler));
    pattern_ = std::string(full);
}

template <typename T>
const Node<T>* Node<T>::catch_all_child() const noexcept {
    if (wild_child_ && children_.front()->kind_ == NodeKind::CatchAll) {
        return children_.front().get();
    }
    return nullptr;
}

template <typename T>
bool Node<T>::terminates() const noexcept {
    return handler_.has_value() || catch_all_child() != nullptr;
}

template <typename T>
std::string_view Node<T>::first_route() const noexcept {
    if (handler_) {
        return pattern_;
    }
    for (const auto& child : children_) {
        const std::string_view route = child->first_route();
        if (!route.empty()) {
            return route;
        }
    }
    return {};
}

// Lookup

template <typename T>
RouteLookup<T> Node<T>::get_value(std::string_view path) const {
    RouteLookup<T> result;
    const Node* n = this;
    const Node* parent = nullptr;

    while (true) {
        const std::string_view fragment = n->fragment_;

        if (path.size() > fragment.size()) {
            if (!path.starts_with(fragment)) {
                break;
            }
            path.remove_prefix(fragment.size());

            if (!n->wild_child_) {
                const size_t index = n->indices_.find(path.front());
                if (index != std::string::npos) {
                    parent = n;
                    n = n->children_[index].get();
                    continue;
                }
                // Nothing below; the path without its trailing slash may exist
                return miss(path == "/" && n->handler_.has_value());
            }

            const Node* wild = n->children_.front().get();
            if (result.params.capacity() == 0) {
                result.params.reserve(wild->max_params_);
            }

            if (wild->kind_ == NodeKind::CatchAll) {
                // Value starts at the '/' that closes the parent fragment
                result.params.push_back({wild->name_, std::string_view(path.data() - 1, path.size() + 1)});
                result.value = &*wild->handler_;
                return result;
            }

            const size_t end = segment_end(path);
            if (end == 0) {
                // Empty parameter value
                return miss(path == "/" && n->handler_.has_value());
            }
            result.params.push_back({wild->name_, path.substr(0, end)});

            if (end < path.size()) {
                if (!wild->children_.empty()) {
                    path.remove_prefix(end);
                    parent = wild;
                    n = wild->children_.front().get();
                    continue;
                }
                return miss(path.size() == end + 1 && wild->handler_.has_value());
            }

            if (wild->handler_) {
                result.value = &*wild->handler_;
                return result;
            }
            if (wild->children_.size() == 1) {
                const Node* next = wild->children_.front().get();
                return miss(next->fragment_ == "/" && next->terminates());
            }
            return miss(false);
        }

        if (path == fragment) {
            if (n->handler_) {
                result.value = &*n->handler_;
                return result;
            }
            if (const Node* catch_all = n->catch_all_child(); catch_all != nullptr && !path.empty()) {
                result.params.reserve(1);
                result.params.push_back({catch_all->name_, path.substr(path.size() - 1)});
                result.value = &*catch_all->handler_;
                return result;
            }
            if (path == "/") {
                return miss(parent != nullptr && parent->handler_.has_value());
            }
            const size_t index = n->indices_.find('/');
            if (index != std::string::npos) {
                const Node* next = n->children_[index].get();
                return miss(next->fragment_ == "/" && next->terminates());
            }
            return miss(false);
        }

        break;
    }

    // The path ends inside this fragment or diverges from it
    const std::string_view fragment = n->fragment_;
    const bool strip_slash = path == "/" && parent != nullptr && parent->handler_.has_value();
    const bool add_slash = fragment.size() == path.size() + 1 && fragment.back() == '/' &&
                           fragment.starts_with(path) && n->terminates();
    return miss(strip_slash || add_slash);
}

// Case-insensitive lookup

template <typename T>
std::optional<std::string> Node<T>::find_case_insensitive_path(std::string_view path,
                                                              bool fix_trailing_slash) const {
    std::string out;
    out.reserve(path.size() + 1);
    if (find_case_insensitive(path, fix_trailing_slash, nullptr, out)) {
        return out;
    }
    return std::nullopt;
}

template <typename T>
bool Node<T>::find_case_insensitive(std::string_view path, bool fix_trailing_slash,
                                    const Node* parent, std::string& out) const {
    const Node* n = this;

    while (has_prefix_ignore_case(path, n->fragment_)) {
        path.remove_prefix(n->fragment_.size());
        out.append(n->fragment_);

        if (path.empty()) {
            if (n->terminates()) {
                return true;
            }
            if (!fix_trailing_slash) {
                return false;
            }
            if (n->fragment_ == "/" && parent != nullptr && parent->handler_) {
                out.pop_back();
                return true;
            }
            const size_t index = n->indices_.find('/');
            if (index != std::string::npos) {
                const Node* next = n->children_[index].get();
                if (next->fragment_ == "/" && next->terminates()) {
                    out.push_back('/');
                    return true;
                }
            }
            return false;
        }

        if (!n->wild_child_) {
            // Both spellings of a letter may be registered, so every candidate is tried
            const char lower = simd::to_lower(path.front());
            for (size_t i = 0; i < n->indices_.size(); ++i) {
                if (simd::to_lower(n->indices_[i]) != lower) {
                    continue;
                }
                const size_t mark = out.size();
                if (n->children_[i]->find_case_insensitive(path, fix_trailing_slash, n, out)) {
                    return true;
                }
                out.resize(mark);
            }
            return fix_trailing_slash && path == "/" && n->handler_.has_value();
        }

        const Node* wild = n->children_.front().get();
        if (wild->kind_ == NodeKind::CatchAll) {
            out.append(path);
            return true;
        }

        const size_t end = segment_end(path);
        if (end == 0) {
            return fix_trailing_slash && path == "/" && n->handler_.has_value();
        }
        out.append(path.substr(0, end));

        if (end < path.size()) {
            if (!wild->children_.empty()) {
                path.remove_prefix(end);
                parent = wild;
                n = wild->children_.front().get();
                continue;
            }
            return fix_trailing_slash && path.size() == end + 1 && wild->handler_.has_value();
        }

        if (wild->handler_) {
            return true;
        }
        if (fix_trailing_slash && wild->children_.size() == 1) {
            const Node* next = wild->children_.front().get();
            if (next->fragment_ == "/" && next->terminates()) {
                out.push_back('/');
                return true;
            }
        }
        return false;
    }

    if (!fix_trailing_slash) {
        return false;
    }
    if (path == "/" && parent != nullptr && parent->handler_) {
        return true;
    }
    const std::string_view fragment = n->fragment_;
    if (path.size() + 1 == fragment.size() && fragment.back() == '/' &&
        has_prefix_ignore_case(fragment, path) && n->terminates()) {
        out.append(fragment);
        return true;
    }
    return false;
}

// Statistics

template <typename T>
typename Node<T>::Stats Node<T>::get_stats() const {
    Stats stats;
    collect_stats(stats, 0);
    return stats;
}

template <typename T>
void Node<T>::collect_stats(Stats& stats, size_t depth) const {
    stats.total_nodes++;
    if (handler_) {
        stats.total_routes++;
    }
    stats.max_depth = std::max(stats.max_depth, depth);

    for (const auto& child : children_) {
        child->collect_stats(stats, depth + 1);
    }
}

}  // namespace waypoint::router
