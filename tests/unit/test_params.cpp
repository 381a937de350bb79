// Waypoint Route Parameter Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "../../src/router/params.hpp"

using namespace waypoint::router;

TEST_CASE("Params lookup by name", "[router][params]") {
    Params params;
    REQUIRE(params.empty());
    REQUIRE_FALSE(params.by_name("id").has_value());

    params.reserve(2);
    params.push_back({"user", "gopher"});
    params.push_back({"repo", "httprouter"});

    REQUIRE(params.size() == 2);
    REQUIRE(params.capacity() >= 2);
    REQUIRE(params[0].key == "user");
    REQUIRE(params[1].value == "httprouter");
    REQUIRE(params.by_name("repo") == "httprouter");
    REQUIRE_FALSE(params.by_name("missing").has_value());
}

TEST_CASE("Params keep path order and first match wins", "[router][params]") {
    Params params;
    params.push_back({"id", "1"});
    params.push_back({"id", "2"});

    REQUIRE(params.by_name("id") == "1");

    std::string joined;
    for (const auto& param : params) {
        joined += param.value;
    }
    REQUIRE(joined == "12");

    params.clear();
    REQUIRE(params.empty());
}

TEST_CASE("Params compare by content", "[router][params]") {
    std::string path = "/users/42";
    Params a;
    a.push_back({"id", std::string_view(path).substr(7)});
    Params b;
    b.push_back({"id", "42"});

    REQUIRE(a == b);

    b.push_back({"tab", "posts"});
    REQUIRE_FALSE(a == b);
}
