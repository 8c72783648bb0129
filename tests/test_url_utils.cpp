/**
 * @file test_url_utils.cpp
 * @brief Unit tests for URL helpers
 */

#include <catch2/catch_test_macros.hpp>
#include "api/url_utils.hpp"
#include <optional>
#include <string>

using namespace tabfetch;

TEST_CASE("URL splitting", "[url_utils]") {
    SECTION("All parts are recognised") {
        UrlParts parts = split_url("https://example.org:8080/a/b.csv?x=1&y=2#top");
        REQUIRE(parts.scheme == "https");
        REQUIRE(parts.authority == "example.org:8080");
        REQUIRE(parts.path == "/a/b.csv");
        REQUIRE(parts.query == "x=1&y=2");
        REQUIRE(parts.fragment == "top");
        REQUIRE(join_url(parts) == "https://example.org:8080/a/b.csv?x=1&y=2#top");
    }

    SECTION("Relative path has no scheme") {
        UrlParts parts = split_url("data/file.csv");
        REQUIRE(parts.scheme.empty());
        REQUIRE(parts.path == "data/file.csv");
    }

    SECTION("has_scheme ignores drive letters") {
        REQUIRE(has_scheme("http://x"));
        REQUIRE(has_scheme("file:///tmp/a"));
        REQUIRE_FALSE(has_scheme("C:/data/a.csv"));
        REQUIRE_FALSE(has_scheme("/tmp/a.csv"));
    }

    SECTION("file: URLs map to local paths") {
        REQUIRE(file_url_path("file:///tmp/a%20b+c.csv") == std::optional<std::string>("/tmp/a b+c.csv"));
        REQUIRE(file_url_path("FILE://localhost/tmp/a.csv") == std::optional<std::string>("/tmp/a.csv"));
        REQUIRE_FALSE(file_url_path("file://server/share/a.csv").has_value());
        REQUIRE_FALSE(file_url_path("http://x/a.csv").has_value());
        REQUIRE_FALSE(file_url_path("/tmp/a.csv").has_value());
    }
}

TEST_CASE("Query encoding", "[url_utils]") {
    SECTION("Reserved characters are escaped and spaces become plus") {
        REQUIRE(url_encode("a b&c=d") == "a+b%26c%3Dd");
        REQUIRE(url_decode("a+b%26c%3Dd") == "a b&c=d");
    }

    SECTION("Malformed escapes are kept literally") {
        REQUIRE(url_decode("100%") == "100%");
        REQUIRE(url_decode("%zz") == "%zz");
    }

    SECTION("Later duplicates override earlier values") {
        QueryParams params = parse_query("a=1&b=2&a=3");
        REQUIRE(params.size() == 2);
        REQUIRE(params[0] == std::make_pair(std::string("a"), std::string("3")));
        REQUIRE(params[1] == std::make_pair(std::string("b"), std::string("2")));
    }
}

TEST_CASE("GET and POST URL construction", "[url_utils]") {
    SECTION("Parameters override the URL query") {
        std::string url = url_for_get("http://x/y?a=1&b=2", {{"b", "3"}, {"c", "4"}});
        REQUIRE(url == "http://x/y?a=1&b=3&c=4");
    }

    SECTION("No parameters leaves the URL unchanged") {
        REQUIRE(url_for_get("http://x/y") == "http://x/y");
    }

    SECTION("POST moves the query into the parameters") {
        auto [url, params] = url_params_for_post("http://x/y?a=1", {{"b", "2"}});
        REQUIRE(url == "http://x/y");
        REQUIRE(params.size() == 2);
        REQUIRE(params[0].first == "a");
        REQUIRE(params[1].second == "2");
    }
}

TEST_CASE("File names from URLs", "[url_utils]") {
    SECTION("Last path segment") {
        REQUIRE(filename_from_url("http://x/y.csv") == "y.csv");
        REQUIRE(filename_from_url("http://x/dir/data%20file.csv?dl=1") == "data file.csv");
    }

    SECTION("Query is slugified when the path ends with a slash") {
        REQUIRE(filename_from_url("http://x/api/?Format=CSV&id=7") == "format-csv-id-7");
    }

    SECTION("Parent segment when nothing else is available") {
        REQUIRE(filename_from_url("http://x/dataset/") == "dataset");
    }
}

TEST_CASE("URL truncation for logs", "[url_utils]") {
    std::string short_url = "http://x/y";
    REQUIRE(truncate_for_log(short_url) == short_url);

    std::string long_url = "http://x/" + std::string(200, 'a');
    std::string truncated = truncate_for_log(long_url);
    REQUIRE(truncated.size() == 103);
    REQUIRE(truncated.substr(100) == "...");
    REQUIRE(truncated.substr(0, 100) == long_url.substr(0, 100));
}
