/**
 * @file curl_transport.hpp
 * @brief libcurl-backed Transport with pull-based body streaming
 *
 * The easy handle is driven through a multi handle so the body can be pulled
 * by the caller: the write callback buffers at most kMaxPendingBytes and
 * pauses the transfer until the reader drains it. file: transfers cannot be
 * paused and are buffered whole. One easy handle is reused
 * for every request, which keeps connections alive between calls.
 */

#ifndef TABFETCH_API_CURL_TRANSPORT_HPP
#define TABFETCH_API_CURL_TRANSPORT_HPP

#include "api/transport.hpp"
#include <curl/curl.h>
#include <array>
#include <cstdint>
#include <string>

namespace tabfetch {

/**
 * @brief Reference-counted guard for curl_global_init / curl_global_cleanup
 */
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
    CurlGlobal(CurlGlobal&&) = delete;
    CurlGlobal& operator=(CurlGlobal&&) = delete;
};

class CurlTransport : public Transport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    TransportResponse perform(const TransportRequest& request) override;
    void release() override;

private:
    friend class CurlBodyStream;

    static constexpr std::size_t kMaxPendingBytes = 64 * 1024;

    CurlGlobal global_;
    CURL* easy_;
    CURLM* multi_;
    curl_slist* headers_;
    std::array<char, CURL_ERROR_SIZE> error_buf_;

    std::string url_;
    std::string pending_;          ///< Bytes received but not yet read
    std::size_t pending_offset_;
    HeaderMap response_headers_;
    bool attached_;
    bool done_;
    bool paused_;
    bool pausable_;                ///< libcurl cannot pause file: transfers
    CURLcode result_;
    std::uint64_t generation_;

    std::size_t read_body(std::uint64_t generation, char* buffer, std::size_t size);
    void configure(const TransportRequest& request);
    void pump();
    void detach();
    std::string transfer_error() const;

    static std::size_t write_cb(char* data, std::size_t size, std::size_t n_items, void* userdata);
    static std::size_t header_cb(char* buffer, std::size_t size, std::size_t n_items, void* userdata);
};

} // namespace tabfetch

#endif // TABFETCH_API_CURL_TRANSPORT_HPP
