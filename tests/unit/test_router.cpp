// Waypoint Router Dispatch Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "../../src/router/factory.hpp"
#include "../../src/router/router.hpp"

using namespace waypoint;
using namespace waypoint::router;
using http::Method;
using http::StatusCode;

namespace {

RouterBuilder<std::string> blog_builder(control::RouterConfig config = {}) {
    RouterBuilder<std::string> builder(config);
    builder.get("/", "index")
        .get("/users/:id", "get_user")
        .post("/users", "create_user")
        .put("/users/:id", "update_user")
        .del("/users/:id", "delete_user")
        .get("/static/*filepath", "assets")
        .get("/Docs/Guide", "guide")
        .get("/about/", "about")
        .options("/opt", "opt");
    return builder;
}

Router<std::string> blog_router(control::RouterConfig config = {}) {
    return blog_builder(config).build();
}

}  // namespace

TEST_CASE("Router lookup per method", "[router]") {
    const auto router = blog_router();

    auto match = router.lookup(Method::GET, "/users/7");
    REQUIRE(match.matched());
    REQUIRE(*match.value == "get_user");
    REQUIRE(match.params.by_name("id") == "7");

    REQUIRE(*router.lookup(Method::PUT, "/users/7").value == "update_user");
    REQUIRE_FALSE(router.lookup(Method::POST, "/users/7").matched());
    REQUIRE_FALSE(router.lookup(Method::PATCH, "/users/7").matched());
    REQUIRE_FALSE(router.lookup(Method::UNKNOWN, "/users/7").matched());

    REQUIRE(router.tree(Method::GET) != nullptr);
    REQUIRE(router.tree(Method::PATCH) == nullptr);
    REQUIRE(router.get_stats().total_routes == 9);
}

TEST_CASE("Allowed methods", "[router]") {
    const auto router = blog_router();

    REQUIRE(router.allowed("/users/7", Method::GET) == "PUT, DELETE, OPTIONS");
    REQUIRE(router.allowed("/users/7", Method::POST) == "GET, PUT, DELETE, OPTIONS");
    REQUIRE(router.allowed("/users", Method::GET) == "POST, OPTIONS");
    REQUIRE(router.allowed("/nothing", Method::GET).empty());

    // OPTIONS routes never show up in the list itself
    REQUIRE(router.allowed("/opt", Method::GET).empty());

    SECTION("server-wide") {
        REQUIRE(router.allowed("*", Method::OPTIONS) == "GET, POST, PUT, DELETE, OPTIONS");
        REQUIRE(router.allowed("*", Method::GET) == "GET, POST, PUT, DELETE, OPTIONS");
    }
}

TEST_CASE("Resolve a matching route", "[router]") {
    const auto router = blog_router();
    std::string path = "/static/css/site.css";

    auto resolution = router.resolve(Method::GET, path);
    REQUIRE(resolution.action == Action::Handle);
    REQUIRE(resolution.status == StatusCode::OK);
    REQUIRE(*resolution.handler == "assets");
    REQUIRE(resolution.params.by_name("filepath") == "/css/site.css");
    REQUIRE(resolution.location.empty());
    REQUIRE(resolution.allow.empty());

    auto options = router.resolve(Method::OPTIONS, "/opt");
    REQUIRE(options.action == Action::Handle);
    REQUIRE(*options.handler == "opt");
}

TEST_CASE("Resolve redirects", "[router]") {
    SECTION("trailing slash added for GET") {
        auto resolution = blog_router().resolve(Method::GET, "/about");
        REQUIRE(resolution.action == Action::Redirect);
        REQUIRE(resolution.status == StatusCode::MovedPermanently);
        REQUIRE(resolution.location == "/about/");
        REQUIRE(resolution.handler == nullptr);
    }

    SECTION("trailing slash removed for POST keeps the method") {
        auto resolution = blog_router().resolve(Method::POST, "/users/");
        REQUIRE(resolution.action == Action::Redirect);
        REQUIRE(resolution.status == StatusCode::PermanentRedirect);
        REQUIRE(resolution.location == "/users");
    }

    SECTION("case and dot segments fixed") {
        const auto router = blog_router();
        auto resolution = router.resolve(Method::GET, "/docs/guide");
        REQUIRE(resolution.action == Action::Redirect);
        REQUIRE(resolution.location == "/Docs/Guide");

        resolution = router.resolve(Method::GET, "/about/../DOCS//guide/");
        REQUIRE(resolution.action == Action::Redirect);
        REQUIRE(resolution.location == "/Docs/Guide");
    }

    SECTION("configured statuses") {
        control::RouterConfig config;
        config.redirect.safe_method_status = 302;
        config.redirect.other_method_status = 307;
        const auto router = blog_router(config);

        REQUIRE(router.resolve(Method::GET, "/about").status == StatusCode::Found);
        REQUIRE(router.resolve(Method::POST, "/users/").status == StatusCode::TemporaryRedirect);
    }

    SECTION("HEAD is a safe method") {
        RouterBuilder<std::string> builder;
        builder.head("/ping/", "ping");
        auto resolution = std::move(builder).build().resolve(Method::HEAD, "/ping");
        REQUIRE(resolution.action == Action::Redirect);
        REQUIRE(resolution.status == StatusCode::MovedPermanently);
    }

    SECTION("CONNECT is never redirected") {
        RouterBuilder<std::string> builder;
        builder.handle(Method::CONNECT, "/tunnel/", "tunnel");
        auto resolution = std::move(builder).build().resolve(Method::CONNECT, "/tunnel");
        REQUIRE(resolution.action == Action::NotFound);
    }

    SECTION("disabled trailing slash redirect") {
        control::RouterConfig config;
        config.redirect_trailing_slash = false;
        const auto router = blog_router(config);

        REQUIRE(router.resolve(Method::GET, "/about").action == Action::NotFound);
        // Case fixing alone still applies
        REQUIRE(router.resolve(Method::GET, "/DOCS/GUIDE").location == "/Docs/Guide");
        REQUIRE(router.resolve(Method::GET, "/DOCS/GUIDE/").action == Action::NotFound);
    }

    SECTION("disabled fixed path redirect") {
        control::RouterConfig config;
        config.redirect_fixed_path = false;
        const auto router = blog_router(config);

        REQUIRE(router.resolve(Method::GET, "/docs/guide").action == Action::NotFound);
        REQUIRE(router.resolve(Method::GET, "/about").action == Action::Redirect);
    }
}

TEST_CASE("Resolve OPTIONS, 405 and 404", "[router]") {
    SECTION("OPTIONS lists the allowed methods") {
        auto resolution = blog_router().resolve(Method::OPTIONS, "/users/7");
        REQUIRE(resolution.action == Action::Options);
        REQUIRE(resolution.status == StatusCode::OK);
        REQUIRE(resolution.allow == "GET, PUT, DELETE, OPTIONS");
        REQUIRE(resolution.handler == nullptr);
    }

    SECTION("server-wide OPTIONS") {
        auto resolution = blog_router().resolve(Method::OPTIONS, "*");
        REQUIRE(resolution.action == Action::Options);
        REQUIRE(resolution.allow == "GET, POST, PUT, DELETE, OPTIONS");
    }

    SECTION("method not allowed") {
        auto resolution = blog_router().resolve(Method::POST, "/users/7");
        REQUIRE(resolution.action == Action::MethodNotAllowed);
        REQUIRE(resolution.status == StatusCode::MethodNotAllowed);
        REQUIRE(resolution.allow == "GET, PUT, DELETE, OPTIONS");
    }

    SECTION("method without any routes") {
        auto resolution = blog_router().resolve(Method::PATCH, "/users/7");
        REQUIRE(resolution.action == Action::MethodNotAllowed);
        REQUIRE(resolution.allow == "GET, PUT, DELETE, OPTIONS");
    }

    SECTION("not found") {
        auto resolution = blog_router().resolve(Method::GET, "/nothing/here");
        REQUIRE(resolution.action == Action::NotFound);
        REQUIRE(resolution.status == StatusCode::NotFound);
        REQUIRE(resolution.handler == nullptr);
        REQUIRE(resolution.allow.empty());
    }

    SECTION("fallback handlers") {
        auto builder = blog_builder();
        builder.not_found("nf").method_not_allowed("nope").global_options("preflight");
        auto router = std::move(builder).build();

        REQUIRE(*router.resolve(Method::GET, "/nothing").handler == "nf");
        REQUIRE(*router.resolve(Method::POST, "/users/7").handler == "nope");
        REQUIRE(*router.resolve(Method::OPTIONS, "/users/7").handler == "preflight");
    }

    SECTION("disabled OPTIONS handling falls back to 405") {
        control::RouterConfig config;
        config.handle_options = false;
        auto resolution = blog_router(config).resolve(Method::OPTIONS, "/users/7");
        REQUIRE(resolution.action == Action::MethodNotAllowed);
    }

    SECTION("disabled 405 handling") {
        control::RouterConfig config;
        config.handle_method_not_allowed = false;
        auto resolution = blog_router(config).resolve(Method::POST, "/users/7");
        REQUIRE(resolution.action == Action::NotFound);
        REQUIRE(resolution.allow.empty());
    }
}

TEST_CASE("Builder rejects bad registrations", "[router]") {
    RouterBuilder<std::string> builder;
    builder.get("/user/:id", "id");

    try {
        builder.get("/user/:name", "name");
        FAIL("expected RouteError");
    } catch (const RouteError& e) {
        REQUIRE(e.kind() == RouteErrorKind::WildcardConflict);
    }

    try {
        builder.handle(Method::UNKNOWN, "/x", "x");
        FAIL("expected RouteError");
    } catch (const RouteError& e) {
        REQUIRE(e.kind() == RouteErrorKind::InvalidMethod);
        REQUIRE(e.pattern() == "/x");
    }

    REQUIRE_THROWS_AS(builder.patch("no-slash", "p"), RouteError);

    auto router = std::move(builder).build();
    REQUIRE(router.tree(Method::PATCH) == nullptr);
    REQUIRE(router.allowed("*", Method::OPTIONS) == "GET, OPTIONS");
    REQUIRE(*router.lookup(Method::GET, "/user/3").value == "id");
}

TEST_CASE("Router is shareable across threads", "[router]") {
    const auto router = blog_router();
    std::atomic<size_t> handled{0};
    std::atomic<size_t> redirected{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 1000; ++i) {
                if (router.resolve(Method::GET, "/users/42").action == Action::Handle) {
                    handled++;
                }
                if (router.resolve(Method::GET, "/DOCS/guide").action == Action::Redirect) {
                    redirected++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(handled.load() == 4000);
    REQUIRE(redirected.load() == 4000);
}

TEST_CASE("Router built from configuration", "[router][config]") {
    control::Config config;
    config.routes = {
        {"GET", "/", "index"},
        {"GET", "/blog/:category/:post", "show_post"},
        {"POST", "/blog/:category", "create_post"},
    };

    const auto router = build_router(config);

    auto resolution = router.resolve(Method::GET, "/blog/rust/request-routers");
    REQUIRE(resolution.action == Action::Handle);
    REQUIRE(*resolution.handler == "show_post");
    REQUIRE(resolution.params.by_name("category") == "rust");

    REQUIRE(*router.resolve(Method::GET, "/missing").handler == "not_found");
    REQUIRE(*router.resolve(Method::GET, "/blog/rust").handler == "method_not_allowed");
    REQUIRE(*router.resolve(Method::OPTIONS, "/blog/rust").handler == "options");

    SECTION("conflicting routes abort the build") {
        config.routes.push_back({"GET", "/blog/:slug", "other"});
        REQUIRE_THROWS_AS(build_router(config), RouteError);
    }

    SECTION("unknown methods abort the build") {
        config.routes.push_back({"FETCH", "/x", "x"});
        REQUIRE_THROWS_AS(build_router(config), RouteError);
    }
}

TEST_CASE("Action names", "[router]") {
    REQUIRE(to_string(Action::Handle) == "handle");
    REQUIRE(to_string(Action::MethodNotAllowed) == "method_not_allowed");
    REQUIRE(to_string(Action::NotFound) == "not_found");
}
