/**
 * @file live_response.hpp
 * @brief The current response of an HttpClient
 */

#ifndef TABFETCH_API_LIVE_RESPONSE_HPP
#define TABFETCH_API_LIVE_RESPONSE_HPP

#include "api/transport.hpp"
#include "api/types.hpp"
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <memory>
#include <optional>
#include <string>

namespace tabfetch {

/**
 * @brief Strip a leading UTF-8 byte order mark
 */
std::string strip_bom(const std::string& text);

/**
 * @throws DecodeError with the byte offset of the failure
 */
nlohmann::json decode_json(const std::string& text, const std::string& origin);

/**
 * @throws DecodeError with the 1-based line of the failure
 */
YAML::Node decode_yaml(const std::string& text, const std::string& origin);

/**
 * @brief Status, headers and body of one request
 *
 * The body is either pulled incrementally with read() or buffered in full by
 * body() and the decoded views; mixing the two after streaming has begun is
 * a StateError. A closed response rejects every body access.
 */
class LiveResponse {
public:
    LiveResponse(long status, HeaderMap headers, std::string url, std::unique_ptr<BodyStream> body);

    LiveResponse(const LiveResponse&) = delete;
    LiveResponse& operator=(const LiveResponse&) = delete;

    long status() const { return status_; }
    bool ok() const { return is_success_status(status_); }
    const HeaderMap& headers() const { return headers_; }
    const std::string& url() const { return url_; }

    /**
     * @brief Header value by case-insensitive name, empty if absent
     */
    std::string header(const std::string& name) const;

    /**
     * @brief Read up to `size` body bytes; 0 at end of body
     *
     * @throws StateError if closed
     * @throws NetworkError if the transfer fails
     */
    std::size_t read(char* buffer, std::size_t size);

    /**
     * @brief Whole body, buffered on first use
     *
     * @throws StateError if closed or already partly streamed
     */
    const std::string& body();

    /** @brief Body as text without a UTF-8 BOM */
    const std::string& text();
    const nlohmann::json& json();
    const YAML::Node& yaml();

    void close();
    bool closed() const { return closed_; }

    bool cursor_open() const { return cursor_open_; }
    void set_cursor_open(bool open) { cursor_open_ = open; }

private:
    long status_;
    HeaderMap headers_;
    std::string url_;
    std::unique_ptr<BodyStream> stream_;
    bool streamed_;
    bool closed_;
    bool cursor_open_;

    std::optional<std::string> buffered_;
    std::size_t buffered_offset_;
    std::optional<std::string> text_;
    std::optional<nlohmann::json> json_;
    std::optional<YAML::Node> yaml_;

    void ensure_open() const;
};

} // namespace tabfetch

#endif // TABFETCH_API_LIVE_RESPONSE_HPP
