/**
 * @file response_streambuf.hpp
 * @brief std::streambuf reading a LiveResponse body on demand
 */

#ifndef TABFETCH_IO_RESPONSE_STREAMBUF_HPP
#define TABFETCH_IO_RESPONSE_STREAMBUF_HPP

#include "api/live_response.hpp"
#include <memory>
#include <streambuf>
#include <string>
#include <vector>

namespace tabfetch {

/**
 * @brief Input buffer pulling 10240 byte chunks from a response
 *
 * Errors raised by the response propagate out of underflow(); pair it with
 * an istream that has badbit set in exceptions() to see them.
 */
class ResponseStreamBuf : public std::streambuf {
public:
    explicit ResponseStreamBuf(std::shared_ptr<LiveResponse> response);

    /**
     * @brief Bytes available without consuming them, filling the buffer if empty
     */
    std::string sample();

protected:
    int_type underflow() override;

private:
    std::shared_ptr<LiveResponse> response_;
    std::vector<char> buffer_;
};

} // namespace tabfetch

#endif // TABFETCH_IO_RESPONSE_STREAMBUF_HPP
