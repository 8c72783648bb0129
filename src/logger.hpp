/**
 * @file logger.hpp
 * @brief Structured logging for the retrieval client with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text output
 * - Request attempt, retry and terminal failure events
 * - Retrieval events (network, saved copy, fallback)
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef TABFETCH_LOGGER_HPP
#define TABFETCH_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <string>

namespace tabfetch {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (resolved parameters, header rows)
    INFO,    ///< Informational messages (request attempts, retrieval source)
    WARN,    ///< Warning messages (retries, skipped configuration files)
    ERROR    ///< Error messages (terminal failures)
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string, defaulting to INFO
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("tabfetch.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_json = false;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   logger.log_request_attempt("https://example.org/data.csv", "GET", 1);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Reopens the log file when file output is enabled.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log one outbound call (INFO)
     *
     * @param url Request URL, truncated for display
     * @param method HTTP method
     * @param attempt 1-based attempt number
     */
    void log_request_attempt(const std::string& url, const std::string& method, int attempt);

    /**
     * @brief Log a retry decision (WARN)
     *
     * @param url Request URL
     * @param attempt Attempt that failed
     * @param reason HTTP status or transport error text
     * @param delay_seconds Backoff before the next attempt
     */
    void log_retry(const std::string& url, int attempt, const std::string& reason, double delay_seconds);

    /**
     * @brief Log a terminal request failure (ERROR)
     */
    void log_failure(const std::string& url, int attempts, const std::string& message);

    /**
     * @brief Log where a retrieval was served from (INFO)
     *
     * @param event One of "download", "saved", "fallback", "save"
     * @param logstr Caller supplied description of the resource
     * @param url Source URL
     * @param path Local file involved, if any
     */
    void log_retrieval(const std::string& event, const std::string& logstr,
                       const std::string& url, const std::string& path = "");

    void log_debug(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void log_info(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void log_warning(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void log_error(const std::string& message, const std::map<std::string, std::string>& fields = {});

    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

    /**
     * @brief Mask a credential for safe logging (show first/last 4 chars)
     */
    static std::string mask_token(const std::string& token);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace tabfetch

#endif // TABFETCH_LOGGER_HPP
