// Waypoint Configuration Layer Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>

#include "../../src/control/config.hpp"

using namespace waypoint::control;

namespace {

bool has_message(const std::vector<std::string>& messages, std::string_view needle) {
    for (const auto& message : messages) {
        if (message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

Config config_with_route(std::string method, std::string path, std::string handler) {
    Config config;
    RouteConfig route;
    route.method = std::move(method);
    route.path = std::move(path);
    route.handler = std::move(handler);
    config.routes.push_back(route);
    return config;
}

}  // namespace

TEST_CASE("Config defaults", "[control][config]") {
    Config config;
    REQUIRE(config.version == "1.0");
    REQUIRE(config.router.redirect_trailing_slash);
    REQUIRE(config.router.redirect_fixed_path);
    REQUIRE(config.router.handle_method_not_allowed);
    REQUIRE(config.router.handle_options);
    REQUIRE(config.router.redirect.safe_method_status == 301);
    REQUIRE(config.router.redirect.other_method_status == 308);
    REQUIRE(config.logging.level == "info");
    REQUIRE(config.logging.output.empty());
}

TEST_CASE("Config JSON deserialization", "[control][config]") {
    const char* json = R"({
        "version": "2.0",
        "description": "blog routes",
        "router": {
            "redirect_fixed_path": false,
            "redirect": { "other_method_status": 307 }
        },
        "logging": { "level": "debug" },
        "routes": [
            { "path": "/", "handler": "index" },
            { "method": "POST", "path": "/blog/:category", "handler": "create_post" },
            { "path": "/static/*filepath", "handler": "assets" }
        ]
    })";

    auto maybe_config = ConfigLoader::load_from_json(json);
    REQUIRE(maybe_config.has_value());

    const auto& config = *maybe_config;
    REQUIRE(config.version == "2.0");
    REQUIRE(config.description == "blog routes");
    REQUIRE_FALSE(config.router.redirect_fixed_path);
    REQUIRE(config.router.redirect_trailing_slash);
    REQUIRE(config.router.redirect.safe_method_status == 301);
    REQUIRE(config.router.redirect.other_method_status == 307);
    REQUIRE(config.logging.level == "debug");
    REQUIRE(config.logging.format == "text");

    REQUIRE(config.routes.size() == 3);
    REQUIRE(config.routes[0].method == "GET");
    REQUIRE(config.routes[1].method == "POST");
    REQUIRE(config.routes[1].handler == "create_post");
    REQUIRE(config.routes[2].path == "/static/*filepath");
}

TEST_CASE("Config JSON serialization", "[control][config]") {
    Config config = config_with_route("PUT", "/users/:id", "update_user");
    config.router.handle_options = false;

    std::string json = ConfigLoader::to_json(config);
    REQUIRE_FALSE(json.empty());
    REQUIRE(json.find("\"handle_options\": false") != std::string::npos);
    REQUIRE(json.find("\"/users/:id\"") != std::string::npos);
    REQUIRE(json.find("\"description\"") == std::string::npos);

    auto reparsed = ConfigLoader::load_from_json(json);
    REQUIRE(reparsed.has_value());
    REQUIRE_FALSE(reparsed->router.handle_options);
    REQUIRE(reparsed->routes.size() == 1);
    REQUIRE(reparsed->routes[0].method == "PUT");
}

TEST_CASE("Config JSON rejects malformed input", "[control][config]") {
    SECTION("not JSON") {
        REQUIRE_FALSE(ConfigLoader::load_from_json("{ routes: [").has_value());
    }

    SECTION("route without a path") {
        REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"routes": [{"handler": "x"}]})").has_value());
    }

    SECTION("wrong type") {
        REQUIRE_FALSE(
            ConfigLoader::load_from_json(R"({"router": {"handle_options": "yes"}})").has_value());
    }
}

TEST_CASE("Config validation - valid config", "[control][config]") {
    Config config = config_with_route("GET", "/users/:id", "get_user");

    auto validation = ConfigLoader::validate(config);
    REQUIRE(validation.valid);
    REQUIRE_FALSE(validation.has_errors());
    REQUIRE(validation.warnings.empty());
}

TEST_CASE("Config validation - routes", "[control][config]") {
    SECTION("unknown method") {
        auto validation = ConfigLoader::validate(config_with_route("FETCH", "/x", "x"));
        REQUIRE(validation.has_errors());
        REQUIRE(has_message(validation.errors, "unknown method 'FETCH'"));
    }

    SECTION("empty handler") {
        auto validation = ConfigLoader::validate(config_with_route("GET", "/x", ""));
        REQUIRE(has_message(validation.errors, "handler must not be empty"));
    }

    SECTION("malformed patterns") {
        for (const char* path : {"", "x", "/:", "/a/*rest/b", "/a*rest", "/:a:b"}) {
            INFO("path: " << path);
            auto validation = ConfigLoader::validate(config_with_route("GET", path, "h"));
            REQUIRE(validation.has_errors());
        }
    }

    SECTION("duplicate method and path") {
        Config config = config_with_route("GET", "/x", "a");
        config.routes.push_back({"GET", "/x", "b"});
        config.routes.push_back({"POST", "/x", "c"});

        auto validation = ConfigLoader::validate(config);
        REQUIRE(validation.errors.size() == 1);
        REQUIRE(has_message(validation.errors, "routes[1] (GET /x): duplicate route"));
    }

    SECTION("no routes is only a warning") {
        auto validation = ConfigLoader::validate(Config{});
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE(has_message(validation.warnings, "No routes configured"));
    }
}

TEST_CASE("Config validation - redirects and logging", "[control][config]") {
    Config config = config_with_route("GET", "/", "index");

    SECTION("redirect status must be a redirect") {
        config.router.redirect.safe_method_status = 200;
        auto validation = ConfigLoader::validate(config);
        REQUIRE(has_message(validation.errors, "safe_method_status"));
    }

    SECTION("method-changing redirect for unsafe methods warns") {
        config.router.redirect.other_method_status = 301;
        auto validation = ConfigLoader::validate(config);
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE(has_message(validation.warnings, "other_method_status 301"));
    }

    SECTION("log level and format") {
        config.logging.level = "verbose";
        config.logging.format = "xml";
        auto validation = ConfigLoader::validate(config);
        REQUIRE(validation.errors.size() == 2);
    }

    SECTION("json format on the console warns") {
        config.logging.format = "json";
        auto validation = ConfigLoader::validate(config);
        REQUIRE_FALSE(validation.has_errors());
        REQUIRE(has_message(validation.warnings, "json"));
    }

    SECTION("rotation limits") {
        config.logging.rotation.max_size_mb = 0;
        config.logging.rotation.max_files = 0;
        auto validation = ConfigLoader::validate(config);
        REQUIRE(validation.errors.size() == 2);
    }
}

TEST_CASE("ConfigManager loads and reloads", "[control][config]") {
    auto dir = std::filesystem::temp_directory_path() / "waypoint_config_test";
    std::filesystem::create_directories(dir);
    auto path = dir / "routes.json";

    {
        std::ofstream out(path);
        out << R"({"routes": [{"path": "/a", "handler": "a"}]})";
    }

    ConfigManager manager;
    REQUIRE_FALSE(manager.is_loaded());
    REQUIRE(manager.load(path.string()));
    REQUIRE(manager.is_loaded());
    REQUIRE(manager.config_path() == path.string());

    auto first = manager.get();
    REQUIRE(first->routes.size() == 1);

    SECTION("a valid file replaces the snapshot") {
        {
            std::ofstream out(path);
            out << R"({"routes": [{"path": "/a", "handler": "a"}, {"path": "/b", "handler": "b"}]})";
        }
        REQUIRE(manager.reload());
        REQUIRE(manager.get()->routes.size() == 2);
        // Readers keep their snapshot
        REQUIRE(first->routes.size() == 1);
    }

    SECTION("an invalid file keeps the old snapshot") {
        {
            std::ofstream out(path);
            out << R"({"routes": [{"path": "a", "handler": "a"}]})";
        }
        REQUIRE_FALSE(manager.reload());
        REQUIRE(manager.last_validation().has_errors());
        REQUIRE(manager.get() == first);
    }

    SECTION("a missing file is reported") {
        ConfigManager missing;
        REQUIRE_FALSE(missing.load((dir / "does_not_exist.json").string()));
        REQUIRE(has_message(missing.last_validation().errors, "Cannot open"));
    }

    std::filesystem::remove_all(dir);
}
