#include "api/http_client.hpp"
#include "api/curl_transport.hpp"
#include "api/url_utils.hpp"
#include "cache/cache_key.hpp"
#include "errors.hpp"
#include "io/content_hash.hpp"
#include "logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace tabfetch {

namespace {

constexpr std::size_t kStreamChunkSize = 10240;

std::string read_all(BodyStream& body) {
    std::string data;
    std::array<char, kStreamChunkSize> chunk;
    std::size_t count;
    while ((count = body.read(chunk.data(), chunk.size())) > 0) {
        data.append(chunk.data(), count);
    }
    return data;
}

} // namespace

HttpClient::HttpClient(ClientConfig config)
    : HttpClient(std::move(config), std::make_unique<CurlTransport>())
{
}

HttpClient::HttpClient(ClientConfig config, std::unique_ptr<Transport> transport,
                       RateLimiter::SleepFunction sleep)
    : config_(std::move(config))
    , context_(build_context(config_))
    , transport_(std::move(transport))
    , sleep_(sleep ? std::move(sleep)
                   : RateLimiter::SleepFunction([](RateLimiter::Clock::duration d) {
                         std::this_thread::sleep_for(d);
                     }))
    , retry_policy_(context_.retry)
    , rate_limiter_(context_.rate_limit, sleep_)
{
    if (!transport_) {
        throw ConfigurationError("HttpClient requires a transport");
    }
}

HttpClient::~HttpClient() {
    close();
}

RequestContext HttpClient::build_context(const ClientConfig& config) {
    RequestContext context = AuthResolver(config.auth).resolve(config.headers);
    context.rate_limit = config.rate_limit;
    context.retry = config.retry;
    context.user_agent = UserAgent::get(config.user_agent);
    return context;
}

void HttpClient::close() {
    if (response_) {
        response_->close();
        response_.reset();
    }
    if (transport_) {
        transport_->release();
    }
}

LiveResponse& HttpClient::current() const {
    if (!response_) {
        throw StateError("No current response; issue a request first");
    }
    return *response_;
}

std::string HttpClient::url_for_get(const std::string& url, const QueryParams& params) {
    return tabfetch::url_for_get(url, params);
}

std::pair<std::string, QueryParams> HttpClient::url_params_for_post(const std::string& url,
                                                                    const QueryParams& params) {
    return tabfetch::url_params_for_post(url, params);
}

std::string HttpClient::full_url(const std::string& url) const {
    if (context_.extra_params.empty()) {
        return url;
    }
    UrlParts parts = split_url(url);
    std::string extra = encode_query(context_.extra_params);
    parts.query = parts.query.empty() ? extra : parts.query + "&" + extra;
    return join_url(parts);
}

TransportRequest HttpClient::prepare(const std::string& url, const RequestOptions& options) const {
    TransportRequest request;
    request.method = options.method;
    std::transform(request.method.begin(), request.method.end(), request.method.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::string target = has_scheme(url) ? url : "http://" + url;
    if (request.method == "POST") {
        auto [post_url, params] = url_params_for_post(target, options.params);
        for (const auto& param : context_.extra_params) {
            params.push_back(param);
        }
        request.url = post_url;
        request.body = encode_query(params);
    } else {
        request.url = full_url(url_for_get(target, options.params));
    }

    request.headers = context_.headers;
    for (const auto& [name, value] : options.headers) {
        request.headers[name] = value;
    }
    if (context_.basic_auth) {
        request.credentials = std::make_pair(context_.basic_auth->username, context_.basic_auth->password);
    }
    request.user_agent = context_.user_agent;
    request.timeout_ms = options.timeout_ms > 0 ? options.timeout_ms : config_.timeout_ms;
    request.connect_timeout_ms = config_.connect_timeout_ms;
    return request;
}

LiveResponse& HttpClient::open_local_file(const std::string& path) {
    Logger::get_instance().log_debug("Reading local file", {{"path", path}});
    response_ = std::make_shared<LiveResponse>(200, HeaderMap(), path, std::make_unique<FileBodyStream>(path));
    return *response_;
}

LiveResponse& HttpClient::execute_with_retry(const TransportRequest& request, bool stream) {
    Logger& logger = Logger::get_instance();
    int attempt = 0;

    while (true) {
        ++attempt;
        rate_limiter_.acquire();
        logger.log_request_attempt(request.url, request.method, attempt);

        std::optional<NetworkError> failure;
        TransportResponse response;
        RetryOutcome outcome = RetryOutcome::failure();
        try {
            response = transport_->perform(request);
            if (!stream && response.body) {
                // Buffer inside the attempt so a body failure is retried too
                response.body = std::make_unique<StringBodyStream>(read_all(*response.body));
            }
            outcome = RetryOutcome::response(response.status);
        } catch (const NetworkError& e) {
            failure = e;
        }

        RetryDecision decision = retry_policy_.should_retry(attempt, request.method, outcome);
        if (!decision.retry) {
            if (failure) {
                logger.log_failure(request.url, attempt, failure->what());
                transport_->release();
                throw *failure;
            }
            if (retry_policy_.is_retryable(request.method, outcome)) {
                std::string message = "HTTP " + std::to_string(response.status) + " from " +
                                      truncate_for_log(request.url) + " after " +
                                      std::to_string(attempt) + " attempts";
                logger.log_failure(request.url, attempt, message);
                transport_->release();
                throw NetworkError(message, response.status, request.url);
            }

            std::string effective = response.effective_url.empty() ? request.url : response.effective_url;
            response_ = std::make_shared<LiveResponse>(response.status, std::move(response.headers),
                                                       effective, std::move(response.body));
            return *response_;
        }

        std::string reason = failure ? std::string(failure->what())
                                     : "HTTP " + std::to_string(response.status);
        logger.log_retry(request.url, attempt, reason, decision.delay_seconds);
        response.body.reset();
        transport_->release();
        if (decision.delay_seconds > 0.0) {
            sleep_(std::chrono::duration_cast<RateLimiter::Clock::duration>(
                std::chrono::duration<double>(decision.delay_seconds)));
        }
    }
}

LiveResponse& HttpClient::request(const std::string& url, const RequestOptions& options) {
    close();

    std::error_code ec;
    if (!has_scheme(url) && fs::is_regular_file(url, ec)) {
        return open_local_file(url);
    }
    if (std::optional<std::string> local = file_url_path(url)) {
        return open_local_file(*local);
    }
    return execute_with_retry(prepare(url, options), options.stream);
}

StreamResult HttpClient::stream_to_file(const std::string& destination) {
    LiveResponse& response = current();
    if (response.closed()) {
        throw StateError("Current response is closed; issue a new request first");
    }

    fs::path target(destination);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            close();
            throw TabfetchError("Cannot create folder " + target.parent_path().string() + ": " + ec.message());
        }
    }
    fs::path partial = target;
    partial += ".part";

    Md5Hasher hasher;
    {
        std::ofstream file(partial, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw TabfetchError("Cannot open " + partial.string() + " for writing");
        }

        std::array<char, kStreamChunkSize> chunk;
        try {
            std::size_t count;
            while ((count = response.read(chunk.data(), chunk.size())) > 0) {
                hasher.update(chunk.data(), count);
                file.write(chunk.data(), static_cast<std::streamsize>(count));
                if (!file) {
                    throw TabfetchError("Failed writing to " + partial.string());
                }
            }
        } catch (const TabfetchError&) {
            file.close();
            std::error_code ec;
            fs::remove(partial, ec);
            close();
            throw;
        }
    }

    std::error_code ec;
    fs::rename(partial, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(partial, ignored);
        close();
        throw TabfetchError("Cannot move " + partial.string() + " to " + target.string() + ": " + ec.message());
    }
    response.close();
    transport_->release();
    return StreamResult{target.string(), hasher.hex_digest()};
}

std::string HttpClient::hash_stream() {
    LiveResponse& response = current();
    Md5Hasher hasher;
    std::array<char, kStreamChunkSize> chunk;
    std::size_t count;
    while ((count = response.read(chunk.data(), chunk.size())) > 0) {
        hasher.update(chunk.data(), count);
    }
    response.close();
    transport_->release();
    return hasher.hex_digest();
}

StreamResult HttpClient::download_file(const std::string& url, const DownloadFileOptions& options) {
    std::string path = CacheKey::unique_path_for_url(url, options.folder, options.filename,
                                                     options.path, options.overwrite);
    RequestOptions request_options = options.request;
    request_options.stream = true;
    request(url, request_options);
    require_success(url);
    return stream_to_file(path);
}

void HttpClient::require_success(const std::string& url) const {
    const LiveResponse& response = current();
    if (!response.ok()) {
        throw NetworkError("HTTP " + std::to_string(response.status()) + " downloading " +
                           truncate_for_log(url), response.status(), url);
    }
}

const std::string& HttpClient::decoded_text() {
    return current().text();
}

const nlohmann::json& HttpClient::decoded_json() {
    return current().json();
}

const YAML::Node& HttpClient::decoded_yaml() {
    return current().yaml();
}

std::string HttpClient::download_text(const std::string& url, const RequestOptions& options) {
    request(url, options);
    require_success(url);
    return decoded_text();
}

nlohmann::json HttpClient::download_json(const std::string& url, const RequestOptions& options) {
    request(url, options);
    require_success(url);
    return decoded_json();
}

YAML::Node HttpClient::download_yaml(const std::string& url, const RequestOptions& options) {
    request(url, options);
    require_success(url);
    return decoded_yaml();
}

long HttpClient::status() const {
    return current().status();
}

const HeaderMap& HttpClient::headers() const {
    return current().headers();
}

std::string HttpClient::header(const std::string& name) const {
    return current().header(name);
}

} // namespace tabfetch
