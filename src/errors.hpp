/**
 * @file errors.hpp
 * @brief Error taxonomy for the retrieval subsystem
 *
 * Every error raised by tabfetch derives from TabfetchError so callers can
 * catch the whole family, while still branching on the concrete cause:
 * - ConfigurationError: bad or missing auth/client configuration (never retried)
 * - NetworkError: transport failure or retry exhaustion
 * - DecodeError: malformed JSON/YAML/tabular payload
 * - StateError: protocol violation (second cursor, streaming before request)
 * - CacheMissError: cache-only read found nothing
 */

#ifndef TABFETCH_ERRORS_HPP
#define TABFETCH_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tabfetch {

class TabfetchError : public std::runtime_error {
public:
    explicit TabfetchError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigurationError : public TabfetchError {
public:
    explicit ConfigurationError(const std::string& message)
        : TabfetchError(message) {}

    ConfigurationError annotated(const std::string& note) const {
        return ConfigurationError(std::string(what()) + " (" + note + ")");
    }
};

/**
 * @brief Transport-level failure or retry exhaustion
 *
 * status_code() is the last HTTP status seen, or 0 when the failure happened
 * below HTTP (connection refused, timeout, DNS).
 */
class NetworkError : public TabfetchError {
public:
    NetworkError(const std::string& message, long status_code = 0, const std::string& url = "")
        : TabfetchError(message), status_code_(status_code), url_(url) {}

    long status_code() const { return status_code_; }
    const std::string& url() const { return url_; }

    NetworkError annotated(const std::string& note) const {
        return NetworkError(std::string(what()) + " (" + note + ")", status_code_, url_);
    }

private:
    long status_code_;
    std::string url_;
};

/**
 * @brief Payload could not be decoded
 *
 * offset() is the byte offset of the failure (npos if unknown), line() the
 * 1-based line (0 if unknown).
 */
class DecodeError : public TabfetchError {
public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    explicit DecodeError(const std::string& message, std::size_t offset = npos, std::size_t line = 0)
        : TabfetchError(message), offset_(offset), line_(line) {}

    std::size_t offset() const { return offset_; }
    std::size_t line() const { return line_; }

    DecodeError annotated(const std::string& note) const {
        return DecodeError(std::string(what()) + " (" + note + ")", offset_, line_);
    }

private:
    std::size_t offset_;
    std::size_t line_;
};

class StateError : public TabfetchError {
public:
    explicit StateError(const std::string& message)
        : TabfetchError(message) {}
};

class CacheMissError : public TabfetchError {
public:
    CacheMissError(const std::string& message, const std::string& path)
        : TabfetchError(message), path_(path) {}

    const std::string& path() const { return path_; }

    CacheMissError annotated(const std::string& note) const {
        return CacheMissError(std::string(what()) + " (" + note + ")", path_);
    }

private:
    std::string path_;
};

} // namespace tabfetch

#endif // TABFETCH_ERRORS_HPP
