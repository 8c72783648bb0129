#include "api/transport.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstring>

namespace tabfetch {

StringBodyStream::StringBodyStream(std::string data)
    : data_(std::move(data)), position_(0) {}

std::size_t StringBodyStream::read(char* buffer, std::size_t size) {
    std::size_t count = std::min(size, data_.size() - position_);
    if (count > 0) {
        std::memcpy(buffer, data_.data() + position_, count);
        position_ += count;
    }
    return count;
}

FileBodyStream::FileBodyStream(const std::string& path)
    : path_(path), file_(path, std::ios::binary)
{
    if (!file_.is_open()) {
        throw NetworkError("Cannot open local file: " + path, 0, path);
    }
}

std::size_t FileBodyStream::read(char* buffer, std::size_t size) {
    if (size == 0 || file_.eof()) {
        return 0;
    }
    file_.read(buffer, static_cast<std::streamsize>(size));
    if (file_.bad()) {
        throw NetworkError("Error reading local file: " + path_, 0, path_);
    }
    return static_cast<std::size_t>(file_.gcount());
}

} // namespace tabfetch
