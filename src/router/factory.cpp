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

// Waypoint Router Factory - Implementation

#include "factory.hpp"

#include "../core/logging.hpp"
#include "../http/http.hpp"

namespace waypoint::router {

Router<std::string> build_router(const control::Config& config) {
    RouterBuilder<std::string> builder(config.router);

    for (const auto& route : config.routes) {
        builder.handle(http::parse_method(route.method), route.path, route.handler);
    }

    builder.not_found("not_found").method_not_allowed("method_not_allowed").global_options(
        "options");

    auto router = std::move(builder).build();

    if (auto* logger = logging::get_current_logger()) {
        const auto stats = router.get_stats();
        LOG_INFO(logger, "Router built: routes={}, nodes={}, max_depth={}", stats.total_routes,
                 stats.total_nodes, stats.max_depth);
    }
    return router;
}

}  // namespace waypoint::router
