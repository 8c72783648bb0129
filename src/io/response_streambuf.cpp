#include "io/response_streambuf.hpp"

namespace tabfetch {

namespace {

constexpr std::size_t kChunkSize = 10240;

} // namespace

ResponseStreamBuf::ResponseStreamBuf(std::shared_ptr<LiveResponse> response)
    : response_(std::move(response)), buffer_(kChunkSize)
{
    setg(buffer_.data(), buffer_.data(), buffer_.data());
}

ResponseStreamBuf::int_type ResponseStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    std::size_t count = response_->read(buffer_.data(), buffer_.size());
    if (count == 0) {
        return traits_type::eof();
    }
    setg(buffer_.data(), buffer_.data(), buffer_.data() + count);
    return traits_type::to_int_type(*gptr());
}

std::string ResponseStreamBuf::sample() {
    if (gptr() == egptr() && underflow() == traits_type::eof()) {
        return std::string();
    }
    return std::string(gptr(), egptr());
}

} // namespace tabfetch
