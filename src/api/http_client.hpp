/**
 * @file http_client.hpp
 * @brief HTTP client with auth decoration, rate limiting, retry and streaming
 */

#ifndef TABFETCH_API_HTTP_CLIENT_HPP
#define TABFETCH_API_HTTP_CLIENT_HPP

#include "api/live_response.hpp"
#include "api/rate_limiter.hpp"
#include "api/request_context.hpp"
#include "api/retry_policy.hpp"
#include "api/transport.hpp"
#include "auth/auth_resolver.hpp"
#include "auth/user_agent.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace tabfetch {

/**
 * @brief Client construction options
 */
struct ClientConfig {
    AuthOptions auth;
    UserAgentOptions user_agent;
    HeaderMap headers;                       ///< Sent with every request
    std::optional<RateLimitSpec> rate_limit;
    RetrySpec retry;
    long timeout_ms = 0;                     ///< Whole-transfer limit, 0 for none
    long connect_timeout_ms = 0;
};

struct RequestOptions {
    std::string method = "GET";
    QueryParams params;
    HeaderMap headers;                       ///< Override the client headers
    long timeout_ms = 0;                     ///< 0 uses the client default
    bool stream = false;                     ///< Leave the body on the wire until read
};

struct StreamResult {
    std::string path;
    std::string content_hash;                ///< MD5 hex digest of the bytes written
};

struct DownloadFileOptions {
    std::string folder;                      ///< Empty uses the temporary directory
    std::string filename;                    ///< Empty derives the name from the URL
    std::string path;                        ///< Full path; excludes folder and filename
    bool overwrite = false;
    RequestOptions request;
};

/**
 * @brief Sequential HTTP client holding at most one current response
 *
 * Features:
 * - Basic or bearer auth and extra query parameters resolved once at construction
 * - Rate limiting per outbound attempt
 * - Exponential backoff retry on configured statuses and transport failures
 * - Streaming of bodies to disk with an MD5 content hash
 * - Local files served directly for scheme-less paths and file: URLs
 *
 * A new request closes the previous response. The client is not thread-safe;
 * use one instance per caller.
 */
class HttpClient {
public:
    /**
     * @brief Client over libcurl
     *
     * @throws ConfigurationError on invalid auth, user agent, rate limit or retry configuration
     */
    explicit HttpClient(ClientConfig config = ClientConfig());

    /**
     * @brief Client over a caller supplied transport
     *
     * @param sleep Used for rate limiting and retry backoff; defaults to a real sleep
     */
    HttpClient(ClientConfig config, std::unique_ptr<Transport> transport,
               RateLimiter::SleepFunction sleep = RateLimiter::SleepFunction());

    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * @brief Issue a request, retrying per the retry policy
     *
     * @return The new current response, which may carry a non-2xx status
     * @throws NetworkError on transport failure or when retries are exhausted
     */
    LiveResponse& request(const std::string& url, const RequestOptions& options = RequestOptions());

    /**
     * @brief Shared handle on the current response, null if none
     */
    std::shared_ptr<LiveResponse> current_response() const { return response_; }

    /**
     * @brief Copy the current body to disk in 10240 byte chunks while hashing it
     *
     * The file appears under its final name only once complete. The response is
     * closed afterwards.
     *
     * @throws StateError if there is no open response
     * @throws NetworkError if reading the body fails
     */
    StreamResult stream_to_file(const std::string& destination);

    /**
     * @brief MD5 hex digest of the remaining current body; closes the response
     */
    std::string hash_stream();

    /**
     * @brief Streaming request saved to a path chosen by CacheKey::unique_path_for_url
     *
     * @throws ConfigurationError if path is combined with folder or filename
     * @throws NetworkError on failure or a non-2xx status
     */
    StreamResult download_file(const std::string& url, const DownloadFileOptions& options = DownloadFileOptions());

    const std::string& decoded_text();
    const nlohmann::json& decoded_json();
    const YAML::Node& decoded_yaml();

    /**
     * @brief Buffered request decoded as text; non-2xx raises NetworkError
     */
    std::string download_text(const std::string& url, const RequestOptions& options = RequestOptions());
    nlohmann::json download_json(const std::string& url, const RequestOptions& options = RequestOptions());
    YAML::Node download_yaml(const std::string& url, const RequestOptions& options = RequestOptions());

    long status() const;
    const HeaderMap& headers() const;
    std::string header(const std::string& name) const;

    /**
     * @brief URL with the session extra parameters appended to its query
     */
    std::string full_url(const std::string& url) const;

    static std::string url_for_get(const std::string& url, const QueryParams& params = QueryParams());
    static std::pair<std::string, QueryParams> url_params_for_post(const std::string& url,
                                                                   const QueryParams& params = QueryParams());

    /**
     * @brief Close the current response; idempotent
     */
    void close();

    const RequestContext& context() const { return context_; }

private:
    ClientConfig config_;
    RequestContext context_;
    std::unique_ptr<Transport> transport_;
    RateLimiter::SleepFunction sleep_;
    RetryPolicy retry_policy_;
    RateLimiter rate_limiter_;
    std::shared_ptr<LiveResponse> response_;

    static RequestContext build_context(const ClientConfig& config);
    LiveResponse& current() const;
    TransportRequest prepare(const std::string& url, const RequestOptions& options) const;
    LiveResponse& open_local_file(const std::string& path);
    LiveResponse& execute_with_retry(const TransportRequest& request, bool stream);
    void require_success(const std::string& url) const;
};

} // namespace tabfetch

#endif // TABFETCH_API_HTTP_CLIENT_HPP
