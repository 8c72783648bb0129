/**
 * @file test_cache_key.cpp
 * @brief Unit tests for CacheKey and TempDir
 */

#include <catch2/catch_test_macros.hpp>
#include "cache/cache_key.hpp"
#include "cache/temp_dir.hpp"
#include "errors.hpp"
#include "test_env.hpp"
#include <filesystem>
#include <stdexcept>

using namespace tabfetch;
using namespace tabfetch::testing;
namespace fs = std::filesystem;

TEST_CASE("CacheKey paths", "[cache_key]") {
    SECTION("Derived name is deterministic") {
        std::string first = CacheKey::path("/root-a", "http://x/y.csv");
        std::string second = CacheKey::path("/root-a", "http://x/y.csv");
        REQUIRE(first == second);
        REQUIRE(first == (fs::path("/root-a") / "y_47f3c241.csv").string());
    }

    SECTION("Explicit filename wins") {
        REQUIRE(CacheKey::path("/root-a", "http://x/y.csv", "z.json") == (fs::path("/root-a") / "z.json").string());
    }

    SECTION("URLs sharing a basename get distinct names") {
        REQUIRE(CacheKey::derived_filename("http://x/a/data.csv") == "data_a66b0af6.csv");
        REQUIRE(CacheKey::derived_filename("http://x/b/data.csv") == "data_1c5edf4d.csv");
    }

    SECTION("Names do not depend on call order") {
        std::string second_alone = CacheKey::path("/root-b", "http://x/b/data.csv");
        CacheKey::path("/root-b", "http://x/a/data.csv");
        REQUIRE(CacheKey::path("/root-b", "http://x/b/data.csv") == second_alone);
        REQUIRE(CacheKey::path("/root-c", "http://x/b/data.csv") == (fs::path("/root-c") / "data_1c5edf4d.csv").string());
    }

    SECTION("URL without a usable name") {
        REQUIRE(CacheKey::derived_filename("http://x/") == "download_6e8eb82d");
    }

    SECTION("Extension splitting") {
        REQUIRE(CacheKey::split_extension("a.tar.gz") == std::make_pair(std::string("a.tar"), std::string(".gz")));
        REQUIRE(CacheKey::split_extension("noext") == std::make_pair(std::string("noext"), std::string()));
        REQUIRE(CacheKey::split_extension(".hidden") == std::make_pair(std::string(".hidden"), std::string()));
    }
}

TEST_CASE("CacheKey unique download paths", "[cache_key]") {
    ScratchDir dir("cache-key-unique");

    SECTION("Free path is used as is") {
        REQUIRE(CacheKey::unique_path_for_url("http://x/f.csv", dir.path()) == dir.file("f.csv"));
    }

    SECTION("Taken paths get a counter") {
        dir.write("f.csv", "1");
        dir.write("f1.csv", "2");
        REQUIRE(CacheKey::unique_path_for_url("http://x/f.csv", dir.path()) == dir.file("f2.csv"));
    }

    SECTION("Explicit filename") {
        REQUIRE(CacheKey::unique_path_for_url("http://x/f.csv", dir.path(), "g.txt") == dir.file("g.txt"));
    }

    SECTION("Overwrite removes the existing file") {
        dir.write("f.csv", "1");
        REQUIRE(CacheKey::unique_path_for_url("http://x/f.csv", dir.path(), "", "", true) == dir.file("f.csv"));
        REQUIRE_FALSE(fs::exists(dir.file("f.csv")));
    }

    SECTION("path excludes folder and filename") {
        REQUIRE_THROWS_AS(CacheKey::unique_path_for_url("http://x/f.csv", dir.path(), "", dir.file("a.csv")),
                          ConfigurationError);
        REQUIRE_THROWS_AS(CacheKey::unique_path_for_url("http://x/f.csv", "", "b.csv", dir.file("a.csv")),
                          ConfigurationError);
    }

    SECTION("Empty folder uses TEMP_DIR") {
        set_env("TEMP_DIR", dir.path().c_str());
        REQUIRE(CacheKey::unique_path_for_url("http://x/t.csv") == dir.file("t.csv"));
        unset_env("TEMP_DIR");
    }
}

TEST_CASE("TempDir lifecycle", "[temp_dir]") {
    ScratchDir root("temp-dir-root");
    set_env("TEMP_DIR", root.path().c_str());

    SECTION("temp_root honours TEMP_DIR") {
        REQUIRE(temp_root() == root.path());
    }

    SECTION("Removed on normal exit") {
        std::string path;
        {
            TempDir temp;
            path = temp.path();
            REQUIRE(fs::is_directory(path));
            REQUIRE(fs::path(path).parent_path() == fs::path(root.path()));
        }
        REQUIRE_FALSE(fs::exists(path));
    }

    SECTION("Kept on normal exit when asked") {
        {
            TempDir temp("kept", false, true);
        }
        REQUIRE(fs::is_directory(root.file("kept")));
    }

    SECTION("Kept on failure when asked") {
        try {
            TempDir temp("failed", true, false);
            throw std::runtime_error("boom");
        } catch (const std::runtime_error&) {
        }
        REQUIRE(fs::is_directory(root.file("failed")));
    }

    SECTION("Removed on failure by default") {
        try {
            TempDir temp("failed-default");
            throw std::runtime_error("boom");
        } catch (const std::runtime_error&) {
        }
        REQUIRE_FALSE(fs::exists(root.file("failed-default")));
    }

    unset_env("TEMP_DIR");
}
