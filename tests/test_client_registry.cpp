/**
 * @file test_client_registry.cpp
 * @brief Unit tests for ClientRegistry
 */

#include <catch2/catch_test_macros.hpp>
#include "api/client_registry.hpp"
#include "errors.hpp"
#include "scripted_transport.hpp"
#include <map>
#include <string>
#include <vector>

using namespace tabfetch;
using namespace tabfetch::testing;

namespace {

ClientRegistry::Factory scripted_factory(std::shared_ptr<Script> script, int* built = nullptr) {
    return [script, built](const ClientConfig& config) {
        if (built) {
            ++*built;
        }
        return make_client(script, config);
    };
}

ClientConfig with_header(const std::string& name, const std::string& value) {
    ClientConfig config = test_client_config();
    config.headers[name] = value;
    return config;
}

} // namespace

TEST_CASE("ClientRegistry lookup", "[client_registry]") {
    auto script = std::make_shared<Script>();
    script->otherwise = ScriptedReply::ok("body");
    ClientRegistry registry(scripted_factory(script));

    SECTION("get before generate is a state error") {
        REQUIRE_THROWS_AS(registry.get(), StateError);
        REQUIRE_THROWS_AS(registry.get("census"), StateError);
    }

    registry.generate(test_client_config(),
                      {{"census", with_header("X-Service", "census")},
                       {"weather", with_header("X-Service", "weather")}});

    SECTION("Default and custom clients are registered") {
        REQUIRE(registry.names() == std::vector<std::string>{"census", "default", "weather"});
        REQUIRE(registry.contains("census"));
        REQUIRE_FALSE(registry.contains("unknown"));
    }

    SECTION("Custom clients carry their own configuration") {
        REQUIRE(registry.get("census").context().headers.at("X-Service") == "census");
        REQUIRE(registry.get("weather").context().headers.at("X-Service") == "weather");
        REQUIRE(registry.get().context().headers.count("X-Service") == 0);
    }

    SECTION("Unknown and empty names fall back to the default client") {
        HttpClient& fallback = registry.get("unknown");
        REQUIRE(&fallback == &registry.get("default"));
        REQUIRE(&registry.get() == &registry.get("default"));
        REQUIRE(&registry.get("census") != &registry.get("default"));
    }

    SECTION("Clients issue requests independently") {
        registry.get("census").request("http://x/a");
        REQUIRE(script->requests.back().headers.at("X-Service") == "census");
        registry.get().request("http://x/b");
        REQUIRE(script->requests.back().headers.count("X-Service") == 0);
    }
}

TEST_CASE("ClientRegistry generation", "[client_registry]") {
    auto script = std::make_shared<Script>();
    int built = 0;
    ClientRegistry registry(scripted_factory(script, &built));

    SECTION("Generating again replaces the previous clients") {
        registry.generate(test_client_config(), {{"census", test_client_config()}});
        registry.generate(test_client_config(), {{"weather", test_client_config()}});
        REQUIRE(registry.names() == std::vector<std::string>{"default", "weather"});
        REQUIRE(built == 4);
    }

    SECTION("A custom client cannot be named default") {
        REQUIRE_THROWS_AS(registry.generate(test_client_config(), {{"default", test_client_config()}}),
                          ConfigurationError);
        REQUIRE(built == 0);
    }

    SECTION("Invalid custom configuration keeps the previous clients") {
        registry.generate(test_client_config(), {{"census", test_client_config()}});

        ClientConfig invalid = test_client_config();
        invalid.rate_limit = RateLimitSpec{0, 1.0};
        REQUIRE_THROWS_AS(registry.generate(test_client_config(), {{"broken", invalid}}), ConfigurationError);
        REQUIRE(registry.names() == std::vector<std::string>{"census", "default"});
    }

    SECTION("clear drops every client") {
        registry.generate(test_client_config());
        registry.clear();
        REQUIRE(registry.names().empty());
        REQUIRE_THROWS_AS(registry.get(), StateError);
    }
}
