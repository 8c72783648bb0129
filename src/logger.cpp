/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "api/url_utils.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace tabfetch {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_request_attempt(const std::string& url, const std::string& method, int attempt) {
    std::map<std::string, std::string> fields;
    fields["event"] = "request_attempt";
    fields["url"] = truncate_for_log(url);
    fields["method"] = method;
    fields["attempt"] = std::to_string(attempt);

    log(LogLevel::INFO, "Requesting " + truncate_for_log(url), fields);
}

void Logger::log_retry(const std::string& url, int attempt, const std::string& reason, double delay_seconds) {
    std::map<std::string, std::string> fields;
    fields["event"] = "retry";
    fields["url"] = truncate_for_log(url);
    fields["attempt"] = std::to_string(attempt);
    fields["reason"] = reason;
    fields["delay_seconds"] = std::to_string(delay_seconds);

    log(LogLevel::WARN, "Retrying request", fields);
}

void Logger::log_failure(const std::string& url, int attempts, const std::string& message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "request_failed";
    fields["url"] = truncate_for_log(url);
    fields["attempts"] = std::to_string(attempts);
    fields["error_message"] = message;

    log(LogLevel::ERROR, "Request failed", fields);
}

void Logger::log_retrieval(const std::string& event, const std::string& logstr,
                           const std::string& url, const std::string& path) {
    std::map<std::string, std::string> fields;
    fields["event"] = "retrieval_" + event;
    fields["url"] = truncate_for_log(url);
    if (!logstr.empty()) {
        fields["resource"] = logstr;
    }
    if (!path.empty()) {
        fields["path"] = path;
    }

    std::string subject = logstr.empty() ? truncate_for_log(url) : logstr;
    std::string message;
    if (event == "download") {
        message = "Downloading " + subject;
    } else if (event == "saved") {
        message = "Using saved " + subject;
    } else if (event == "fallback") {
        message = "Using fallback " + subject;
    } else if (event == "save") {
        message = "Saving " + subject;
    } else {
        message = event + " " + subject;
    }

    log(LogLevel::INFO, message, fields);
}

void Logger::log_debug(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::DEBUG, message, fields);
}

void Logger::log_info(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, message, fields);
}

void Logger::log_warning(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::WARN, message, fields);
}

void Logger::log_error(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::ERROR, message, fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::mask_token(const std::string& token) {
    if (token.size() <= 8) {
        return "***";
    }
    return token.substr(0, 4) + "..." + token.substr(token.size() - 4);
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace tabfetch
