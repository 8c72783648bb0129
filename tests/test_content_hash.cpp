/**
 * @file test_content_hash.cpp
 * @brief Unit tests for MD5 hashing
 */

#include <catch2/catch_test_macros.hpp>
#include "errors.hpp"
#include "io/content_hash.hpp"
#include "test_env.hpp"

using namespace tabfetch;
using namespace tabfetch::testing;

TEST_CASE("Md5Hasher digests", "[content_hash]") {
    SECTION("Empty input") {
        Md5Hasher hasher;
        REQUIRE(hasher.hex_digest() == "d41d8cd98f00b204e9800998ecf8427e");
    }

    SECTION("Incremental updates match a single update") {
        Md5Hasher whole;
        whole.update("The quick brown fox jumps over the lazy dog");

        Md5Hasher parts;
        parts.update("The quick brown ");
        parts.update("fox jumps over the lazy dog");

        REQUIRE(whole.hex_digest() == "9e107d9d372bb6826bd81d3542a419d6");
        REQUIRE(parts.hex_digest() == "9e107d9d372bb6826bd81d3542a419d6");
    }

    SECTION("Updating after the digest is a state error") {
        Md5Hasher hasher;
        hasher.update("x");
        hasher.hex_digest();
        REQUIRE_THROWS_AS(hasher.update("y"), StateError);
    }
}

TEST_CASE("md5_file", "[content_hash]") {
    ScratchDir dir("content-hash");

    SECTION("File larger than one chunk") {
        std::string path = dir.write("big.bin", std::string(25000, 'a'));
        REQUIRE(md5_file(path) == "c54a530fc004316a1679cf3353a83484");
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(md5_file(dir.file("absent.bin")), TabfetchError);
    }
}
