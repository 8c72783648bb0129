/**
 * @file transport.hpp
 * @brief Abstract request/response seam below HttpClient
 *
 * HttpClient owns retry, rate limiting and auth decoration; a Transport only
 * moves one request over the wire. CurlTransport is the production
 * implementation. Tests substitute a scripted one.
 */

#ifndef TABFETCH_API_TRANSPORT_HPP
#define TABFETCH_API_TRANSPORT_HPP

#include "api/types.hpp"
#include <cstddef>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace tabfetch {

/**
 * @brief Pull-based response body
 */
class BodyStream {
public:
    virtual ~BodyStream() = default;

    /**
     * @brief Read up to `size` bytes into `buffer`
     *
     * @return Number of bytes read; 0 at end of body
     * @throws NetworkError if the underlying transfer fails
     */
    virtual std::size_t read(char* buffer, std::size_t size) = 0;
};

/**
 * @brief Body already held in memory
 */
class StringBodyStream : public BodyStream {
public:
    explicit StringBodyStream(std::string data);
    std::size_t read(char* buffer, std::size_t size) override;

private:
    std::string data_;
    std::size_t position_;
};

/**
 * @brief Body read from a local file
 */
class FileBodyStream : public BodyStream {
public:
    /**
     * @throws NetworkError if the file cannot be opened
     */
    explicit FileBodyStream(const std::string& path);
    std::size_t read(char* buffer, std::size_t size) override;

private:
    std::string path_;
    std::ifstream file_;
};

/**
 * @brief One outbound call, fully decorated
 */
struct TransportRequest {
    std::string method = "GET";
    std::string url;
    std::string body;                      ///< Form-encoded body for POST
    HeaderMap headers;
    std::optional<std::pair<std::string, std::string>> credentials;  ///< Basic auth user/password
    std::string user_agent;
    long timeout_ms = 0;                   ///< 0 means no limit
    long connect_timeout_ms = 0;
};

struct TransportResponse {
    long status = 0;
    HeaderMap headers;
    std::string effective_url;
    std::unique_ptr<BodyStream> body;
};

class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Issue the request and return once the status and headers are known
     *
     * The returned body stream is valid until the next perform() or
     * release() on the same transport.
     *
     * @throws NetworkError on connection, DNS or timeout failures
     */
    virtual TransportResponse perform(const TransportRequest& request) = 0;

    /**
     * @brief Abandon any transfer still in progress
     */
    virtual void release() {}
};

} // namespace tabfetch

#endif // TABFETCH_API_TRANSPORT_HPP
