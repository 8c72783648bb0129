/**
 * @file test_curl_transport.cpp
 * @brief CurlTransport and HttpClient over large file: URLs; no network needed
 */

#include <catch2/catch_test_macros.hpp>
#include "api/curl_transport.hpp"
#include "api/http_client.hpp"
#include "errors.hpp"
#include "io/content_hash.hpp"
#include "io/tabular_reader.hpp"
#include "scripted_transport.hpp"
#include "test_env.hpp"
#include <array>
#include <string>

using namespace tabfetch;
using namespace tabfetch::testing;

namespace {

// Well above the transport's 64 KiB pending buffer
std::string large_csv(int rows) {
    std::string csv = "id,value\n";
    for (int i = 0; i < rows; ++i) {
        csv += std::to_string(i) + ",value-" + std::to_string(i) + "\n";
    }
    return csv;
}

std::string file_url(const std::string& path) {
    return "file://" + path;
}

std::string read_body(BodyStream& body) {
    std::string data;
    std::array<char, 4096> chunk;
    std::size_t count;
    while ((count = body.read(chunk.data(), chunk.size())) > 0) {
        data.append(chunk.data(), count);
    }
    return data;
}

} // namespace

TEST_CASE("CurlTransport file transfers", "[curl_transport]") {
    ScratchDir dir("curl-transport");
    const std::string content = large_csv(20000);
    REQUIRE(content.size() > 64 * 1024);
    std::string path = dir.write("big.csv", content);

    CurlTransport transport;
    TransportRequest request;
    request.url = file_url(path);

    SECTION("Body larger than the pending buffer is read in full") {
        TransportResponse response = transport.perform(request);
        REQUIRE(response.status == 200);
        REQUIRE(read_body(*response.body) == content);
    }

    SECTION("Body of a superseded transfer cannot be read") {
        TransportResponse first = transport.perform(request);
        TransportResponse second = transport.perform(request);
        std::array<char, 16> chunk;
        REQUIRE_THROWS_AS(first.body->read(chunk.data(), chunk.size()), StateError);
        REQUIRE(read_body(*second.body) == content);
    }

    SECTION("Released body cannot be read") {
        TransportResponse response = transport.perform(request);
        transport.release();
        std::array<char, 16> chunk;
        REQUIRE_THROWS_AS(response.body->read(chunk.data(), chunk.size()), StateError);
    }

    SECTION("Missing file is a transport failure") {
        request.url = file_url(dir.file("absent.csv"));
        REQUIRE_THROWS_AS(transport.perform(request), NetworkError);
    }
}

TEST_CASE("HttpClient with large file URLs", "[curl_transport][http_client]") {
    ScratchDir dir("curl-client");
    const std::string content = large_csv(20000);
    std::string path = dir.write("big.csv", content);
    const std::string url = file_url(path);

    HttpClient client(test_client_config());

    SECTION("Buffered download") {
        REQUIRE(client.download_text(url) == content);
    }

    SECTION("Streaming to disk keeps the content hash") {
        client.request(url, RequestOptions());
        StreamResult result = client.stream_to_file(dir.file("copy.csv"));
        REQUIRE(read_file(result.path) == content);
        REQUIRE(result.content_hash == md5_file(path));
    }

    SECTION("Rows stream through the cursor") {
        TabularReader reader(client);
        RowCursor<RowDict> cursor = reader.open_dict_rows(url);
        int rows = 0;
        std::string last_value;
        while (std::optional<RowDict> row = cursor.next()) {
            last_value = (*row)["value"];
            ++rows;
        }
        REQUIRE(rows == 20000);
        REQUIRE(last_value == "value-19999");
    }

    SECTION("Cursor superseded by a new request") {
        TabularReader reader(client);
        RowCursor<Row> cursor = reader.open_rows(url);
        REQUIRE(cursor.next().has_value());
        client.request(url, RequestOptions());
        REQUIRE_THROWS_AS(cursor.next(), StateError);
    }

    SECTION("Missing file fails without retrying") {
        REQUIRE_THROWS_AS(client.download_text(file_url(dir.file("absent.csv"))), NetworkError);
    }
}
