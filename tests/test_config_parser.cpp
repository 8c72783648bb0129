#include <catch2/catch_test_macros.hpp>
#include "config/config_parser.hpp"
#include "errors.hpp"
#include "test_env.hpp"
#include <filesystem>
#include <set>
#include <string>
#include <variant>

using namespace tabfetch;
using namespace tabfetch::testing;
namespace fs = std::filesystem;

TEST_CASE("Environment variable expansion", "[config_parser]") {
    set_env("TABFETCH_TEST_HOST", "data.example.org");

    SECTION("Braced and bare forms") {
        REQUIRE(expand_environment_variables("https://${TABFETCH_TEST_HOST}/x") == "https://data.example.org/x");
        REQUIRE(expand_environment_variables("$TABFETCH_TEST_HOST/x") == "data.example.org/x");
    }

    SECTION("Unset variable expands to nothing") {
        unset_env("TABFETCH_TEST_UNSET");
        REQUIRE(expand_environment_variables("a${TABFETCH_TEST_UNSET}b") == "ab");
    }

    SECTION("Lone dollar is literal") {
        REQUIRE(expand_environment_variables("cost $ 5") == "cost $ 5");
        REQUIRE(expand_environment_variables("end$") == "end$");
    }

    SECTION("Unterminated brace fails") {
        REQUIRE_THROWS_AS(expand_environment_variables("${TABFETCH_TEST_HOST"), ConfigurationError);
    }

    unset_env("TABFETCH_TEST_HOST");
}

TEST_CASE("Relative path resolution", "[config_parser]") {
    REQUIRE(resolve_relative_path("", "/etc/tabfetch/config.json").empty());
    REQUIRE(resolve_relative_path("/abs/file", "/etc/tabfetch/config.json") == "/abs/file");
    REQUIRE(resolve_relative_path("saved", "/etc/tabfetch/config.json") ==
            (fs::path("/etc/tabfetch") / "saved").string());
}

TEST_CASE("Client configuration parsing", "[config_parser]") {
    SECTION("Empty object gives defaults") {
        FetchConfig config = parse_fetch_config_from_string("{}");
        REQUIRE(std::holds_alternative<std::monostate>(config.client.auth.auth));
        REQUIRE(config.client.auth.use_env);
        REQUIRE_FALSE(config.client.rate_limit.has_value());
        REQUIRE(config.client.retry.max_attempts == 5);
        REQUIRE_FALSE(config.retrieval.save);
    }

    SECTION("Full configuration") {
        set_env("TABFETCH_TEST_TOKEN", "secret");
        FetchConfig config = parse_fetch_config_from_string(R"({
            "bearer_token": "${TABFETCH_TEST_TOKEN}",
            "extra_params_dict": {"key": "abc", "page": 2},
            "extra_params_lookup": "site",
            "use_auth": "bearer_token",
            "use_env": false,
            "fail_on_missing_file": false,
            "user_agent": "my-app",
            "user_agent_lookup": "prod",
            "headers": {"Accept": "text/csv"},
            "rate_limit": {"calls": 3, "period": 2.5},
            "retry": {"statuses": [503], "methods": ["GET"], "max_attempts": 2,
                      "backoff_factor": 0.5, "max_backoff": 10},
            "timeout_ms": 30000,
            "connect_timeout_ms": 5000,
            "retrieval": {"fallback_dir": "static", "saved_dir": "saved", "save": true}
        })");
        unset_env("TABFETCH_TEST_TOKEN");

        const ClientConfig& client = config.client;
        REQUIRE(std::get<BearerToken>(client.auth.auth).token == "secret");
        const QueryParams& params = std::get<ParamsDict>(client.auth.extra_params).params;
        REQUIRE(params.size() == 2);
        REQUIRE(client.auth.extra_params_lookup == "site");
        REQUIRE(client.auth.use_auth == "bearer_token");
        REQUIRE_FALSE(client.auth.use_env);
        REQUIRE_FALSE(client.auth.fail_on_missing_file);
        REQUIRE(client.user_agent.user_agent == "my-app");
        REQUIRE(client.user_agent.lookup == "prod");
        REQUIRE(client.headers.at("Accept") == "text/csv");
        REQUIRE(client.rate_limit->calls == 3);
        REQUIRE(client.rate_limit->period == 2.5);
        REQUIRE(client.retry.statuses == std::set<long>{503});
        REQUIRE(client.retry.methods == std::set<std::string>{"GET"});
        REQUIRE(client.retry.max_attempts == 2);
        REQUIRE(client.retry.backoff_factor == 0.5);
        REQUIRE(client.retry.max_backoff == 10.0);
        REQUIRE(client.timeout_ms == 30000);
        REQUIRE(client.connect_timeout_ms == 5000);
        REQUIRE(config.retrieval.fallback_dir == "static");
        REQUIRE(config.retrieval.saved_dir == "saved");
        REQUIRE(config.retrieval.save);
    }

    SECTION("User and password pair") {
        ClientConfig client = parse_client_config_from_string(R"({"auth": ["user", "pass"]})");
        const UserPassword& pair = std::get<UserPassword>(client.auth.auth);
        REQUIRE(pair.username == "user");
        REQUIRE(pair.password == "pass");
    }

    SECTION("Malformed auth pair") {
        REQUIRE_THROWS_AS(parse_client_config_from_string(R"({"auth": ["user"]})"), ConfigurationError);
    }

    SECTION("Conflicting auth sources") {
        REQUIRE_THROWS_AS(parse_client_config_from_string(R"({"basic_auth": "x", "bearer_token": "y"})"),
                          ConfigurationError);
    }

    SECTION("Conflicting parameter sources") {
        REQUIRE_THROWS_AS(parse_client_config_from_string(
                              R"({"extra_params_dict": {"a": "1"}, "extra_params_yaml": "p.yaml"})"),
                          ConfigurationError);
    }

    SECTION("Save and use saved together") {
        REQUIRE_THROWS_AS(parse_fetch_config_from_string(R"({"retrieval": {"save": true, "use_saved": true}})"),
                          ConfigurationError);
    }

    SECTION("Invalid JSON") {
        REQUIRE_THROWS_AS(parse_fetch_config_from_string("{not json"), ConfigurationError);
    }

    SECTION("Wrong value type") {
        REQUIRE_THROWS_AS(parse_fetch_config_from_string(R"({"timeout_ms": "soon"})"), ConfigurationError);
    }

    SECTION("Top level must be an object") {
        REQUIRE_THROWS_AS(parse_fetch_config_from_string("[1, 2]"), ConfigurationError);
    }
}

TEST_CASE("Named client configurations", "[config_parser]") {
    SECTION("Custom keys override the top-level client keys") {
        FetchConfig config = parse_fetch_config_from_string(R"({
            "user_agent": "my-app",
            "headers": {"Accept": "text/csv"},
            "timeout_ms": 1000,
            "clients": {
                "census": {"headers": {"X-Service": "census"}, "bearer_token": "abc"},
                "slow": {"timeout_ms": 60000}
            },
            "retrieval": {"save": true, "saved_dir": "saved"}
        })");

        REQUIRE(config.clients.size() == 2);
        const ClientConfig& census = config.clients.at("census");
        REQUIRE(census.user_agent.user_agent == "my-app");
        REQUIRE(census.headers.size() == 1);
        REQUIRE(census.headers.at("X-Service") == "census");
        REQUIRE(std::get<BearerToken>(census.auth.auth).token == "abc");
        REQUIRE(census.timeout_ms == 1000);

        const ClientConfig& slow = config.clients.at("slow");
        REQUIRE(slow.headers.at("Accept") == "text/csv");
        REQUIRE(slow.timeout_ms == 60000);

        REQUIRE(std::holds_alternative<std::monostate>(config.client.auth.auth));
        REQUIRE(config.retrieval.save);
    }

    SECTION("No clients key leaves the map empty") {
        REQUIRE(parse_fetch_config_from_string("{}").clients.empty());
    }

    SECTION("clients must hold objects") {
        REQUIRE_THROWS_AS(parse_fetch_config_from_string(R"({"clients": []})"), ConfigurationError);
        REQUIRE_THROWS_AS(parse_fetch_config_from_string(R"({"clients": {"a": 1}})"), ConfigurationError);
    }

    SECTION("Conflicting auth in a custom client names the client") {
        try {
            parse_fetch_config_from_string(R"({
                "basic_auth": "Basic eDp5",
                "clients": {"census": {"bearer_token": "abc"}}
            })");
            FAIL("expected a ConfigurationError");
        } catch (const ConfigurationError& e) {
            REQUIRE(std::string(e.what()).find("census") != std::string::npos);
        }
    }
}

TEST_CASE("Configuration files", "[config_parser]") {
    ScratchDir dir("config-files");

    SECTION("Paths resolve against the config file folder") {
        std::string path = dir.write("conf/fetch.json", R"({
            "basic_auth_file": "secrets/basic.txt",
            "extra_params_json": "/etc/params.json",
            "user_agent_config_yaml": "ua.yml",
            "retrieval": {"fallback_dir": "static", "saved_dir": "saved", "temp_dir": "tmp"}
        })");
        fs::path base = fs::path(path).parent_path();

        FetchConfig config = parse_fetch_config_from_file(path);
        REQUIRE(std::get<BasicAuthFile>(config.client.auth.auth).path == (base / "secrets/basic.txt").string());
        REQUIRE(std::get<ParamsJsonFile>(config.client.auth.extra_params).path == "/etc/params.json");
        REQUIRE(config.client.user_agent.config_yaml == (base / "ua.yml").string());
        REQUIRE(config.retrieval.fallback_dir == (base / "static").string());
        REQUIRE(config.retrieval.saved_dir == (base / "saved").string());
        REQUIRE(config.retrieval.temp_dir == (base / "tmp").string());
    }

    SECTION("Custom client paths resolve against the config file folder") {
        std::string path = dir.write("conf/clients.json", R"({
            "bearer_token_file": "token.txt",
            "clients": {"census": {"basic_auth_file": "census.txt"}, "plain": {}}
        })");
        fs::path base = fs::path(path).parent_path();

        FetchConfig config = parse_fetch_config_from_file(path);
        REQUIRE(std::get<BasicAuthFile>(config.clients.at("census").auth.auth).path ==
                (base / "census.txt").string());
        REQUIRE(std::get<BearerTokenFile>(config.clients.at("plain").auth.auth).path ==
                (base / "token.txt").string());
    }

    SECTION("Bearer token file") {
        std::string path = dir.write("token.json", R"({"bearer_token_file": "token.txt"})");
        ClientConfig client = parse_client_config_from_file(path);
        REQUIRE(std::get<BearerTokenFile>(client.auth.auth).path == dir.file("token.txt"));
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(parse_fetch_config_from_file(dir.file("absent.json")), ConfigurationError);
    }
}
