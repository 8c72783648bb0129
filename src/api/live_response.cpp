#include "api/live_response.hpp"
#include "errors.hpp"
#include <algorithm>
#include <array>
#include <cstring>

namespace tabfetch {

namespace {

constexpr std::size_t kReadChunkSize = 10240;

} // namespace

std::string strip_bom(const std::string& text) {
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        return text.substr(3);
    }
    return text;
}

nlohmann::json decode_json(const std::string& text, const std::string& origin) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError("Invalid JSON from " + origin + ": " + e.what(), e.byte);
    }
}

YAML::Node decode_yaml(const std::string& text, const std::string& origin) {
    try {
        return YAML::Load(text);
    } catch (const YAML::Exception& e) {
        std::size_t offset = e.mark.pos >= 0 ? static_cast<std::size_t>(e.mark.pos) : DecodeError::npos;
        std::size_t line = e.mark.line >= 0 ? static_cast<std::size_t>(e.mark.line + 1) : 0;
        throw DecodeError("Invalid YAML from " + origin + ": " + e.what(), offset, line);
    }
}

LiveResponse::LiveResponse(long status, HeaderMap headers, std::string url, std::unique_ptr<BodyStream> body)
    : status_(status)
    , headers_(std::move(headers))
    , url_(std::move(url))
    , stream_(std::move(body))
    , streamed_(false)
    , closed_(false)
    , cursor_open_(false)
    , buffered_offset_(0)
{
}

std::string LiveResponse::header(const std::string& name) const {
    auto it = headers_.find(name);
    return it == headers_.end() ? std::string() : it->second;
}

void LiveResponse::ensure_open() const {
    if (closed_) {
        throw StateError("Response for " + url_ + " is closed");
    }
}

std::size_t LiveResponse::read(char* buffer, std::size_t size) {
    ensure_open();

    if (buffered_) {
        std::size_t count = std::min(size, buffered_->size() - buffered_offset_);
        std::memcpy(buffer, buffered_->data() + buffered_offset_, count);
        buffered_offset_ += count;
        return count;
    }

    if (!stream_) {
        return 0;
    }
    streamed_ = true;
    return stream_->read(buffer, size);
}

const std::string& LiveResponse::body() {
    ensure_open();
    if (buffered_) {
        return *buffered_;
    }
    if (streamed_) {
        throw StateError("Response body for " + url_ + " has already been streamed");
    }

    std::string data;
    if (stream_) {
        std::array<char, kReadChunkSize> chunk;
        std::size_t count;
        while ((count = stream_->read(chunk.data(), chunk.size())) > 0) {
            data.append(chunk.data(), count);
        }
        stream_.reset();
    }
    buffered_ = std::move(data);
    return *buffered_;
}

const std::string& LiveResponse::text() {
    if (!text_) {
        text_ = strip_bom(body());
    }
    ensure_open();
    return *text_;
}

const nlohmann::json& LiveResponse::json() {
    if (!json_) {
        json_ = decode_json(text(), url_);
    }
    ensure_open();
    return *json_;
}

const YAML::Node& LiveResponse::yaml() {
    if (!yaml_) {
        yaml_ = decode_yaml(text(), url_);
    }
    ensure_open();
    return *yaml_;
}

void LiveResponse::close() {
    closed_ = true;
    cursor_open_ = false;
    stream_.reset();
}

} // namespace tabfetch
