#include "api/curl_transport.hpp"
#include "api/url_utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>

namespace tabfetch {

namespace {

struct CurlDefaults {
    static constexpr long FOLLOW_LOCATION = 1L;
    static constexpr long MAX_REDIRECTS = 10L;
    static constexpr long NO_PROGRESS = 1L;
    static constexpr long NO_SIGNAL = 1L;
    static constexpr long TCP_KEEPALIVE = 1L;
    static constexpr const char* ACCEPT_ENCODING = "";
    static constexpr int POLL_TIMEOUT_MS = 1000;
};

std::mutex g_curl_global_mutex;
int g_curl_global_count = 0;

template <typename T>
void set_option(CURL* handle, CURLoption option, T value) {
    CURLcode rc = curl_easy_setopt(handle, option, value);
    if (rc != CURLE_OK) {
        throw ConfigurationError(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
    }
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

CurlGlobal::CurlGlobal() {
    std::lock_guard<std::mutex> lock(g_curl_global_mutex);
    if (g_curl_global_count == 0) {
        CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw NetworkError(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
        }
    }
    ++g_curl_global_count;
}

CurlGlobal::~CurlGlobal() {
    std::lock_guard<std::mutex> lock(g_curl_global_mutex);
    if (--g_curl_global_count == 0) {
        curl_global_cleanup();
    }
}

/**
 * @brief Body stream bound to one transfer generation of a CurlTransport
 */
class CurlBodyStream : public BodyStream {
public:
    CurlBodyStream(CurlTransport* transport, std::uint64_t generation)
        : transport_(transport), generation_(generation) {}

    std::size_t read(char* buffer, std::size_t size) override {
        return transport_->read_body(generation_, buffer, size);
    }

private:
    CurlTransport* transport_;
    std::uint64_t generation_;
};

CurlTransport::CurlTransport()
    : easy_(nullptr)
    , multi_(nullptr)
    , headers_(nullptr)
    , pending_offset_(0)
    , attached_(false)
    , done_(true)
    , paused_(false)
    , pausable_(true)
    , result_(CURLE_OK)
    , generation_(0)
{
    error_buf_[0] = '\0';

    easy_ = curl_easy_init();
    if (!easy_) {
        throw NetworkError("Failed to create CURL easy handle");
    }
    multi_ = curl_multi_init();
    if (!multi_) {
        curl_easy_cleanup(easy_);
        throw NetworkError("Failed to create CURL multi handle");
    }
}

CurlTransport::~CurlTransport() {
    detach();
    if (headers_) {
        curl_slist_free_all(headers_);
    }
    curl_multi_cleanup(multi_);
    curl_easy_cleanup(easy_);
}

void CurlTransport::configure(const TransportRequest& request) {
    // Reset clears options but keeps live connections and the DNS cache
    curl_easy_reset(easy_);
    error_buf_[0] = '\0';

    set_option(easy_, CURLOPT_ERRORBUFFER, error_buf_.data());
    set_option(easy_, CURLOPT_URL, request.url.c_str());

    std::string scheme = split_url(request.url).scheme;
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    pausable_ = scheme != "file";
    set_option(easy_, CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
    set_option(easy_, CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
    set_option(easy_, CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
    set_option(easy_, CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);
    set_option(easy_, CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
    set_option(easy_, CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);

    if (request.timeout_ms > 0) {
        set_option(easy_, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    }
    if (request.connect_timeout_ms > 0) {
        set_option(easy_, CURLOPT_CONNECTTIMEOUT_MS, request.connect_timeout_ms);
    }
    if (!request.user_agent.empty()) {
        set_option(easy_, CURLOPT_USERAGENT, request.user_agent.c_str());
    }
    if (request.credentials) {
        set_option(easy_, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        set_option(easy_, CURLOPT_USERNAME, request.credentials->first.c_str());
        set_option(easy_, CURLOPT_PASSWORD, request.credentials->second.c_str());
    }

    if (request.method == "GET") {
        set_option(easy_, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "POST") {
        set_option(easy_, CURLOPT_POST, 1L);
        set_option(easy_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        set_option(easy_, CURLOPT_COPYPOSTFIELDS, request.body.c_str());
    } else if (request.method == "HEAD") {
        set_option(easy_, CURLOPT_NOBODY, 1L);
    } else {
        set_option(easy_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    if (headers_) {
        curl_slist_free_all(headers_);
        headers_ = nullptr;
    }
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(headers_, line.c_str());
        if (!appended) {
            throw ConfigurationError("Failed to build request header list");
        }
        headers_ = appended;
    }
    if (headers_) {
        set_option(easy_, CURLOPT_HTTPHEADER, headers_);
    }

    set_option(easy_, CURLOPT_WRITEFUNCTION, &CurlTransport::write_cb);
    set_option(easy_, CURLOPT_WRITEDATA, this);
    set_option(easy_, CURLOPT_HEADERFUNCTION, &CurlTransport::header_cb);
    set_option(easy_, CURLOPT_HEADERDATA, this);
}

TransportResponse CurlTransport::perform(const TransportRequest& request) {
    release();

    url_ = request.url;
    configure(request);

    CURLMcode mc = curl_multi_add_handle(multi_, easy_);
    if (mc != CURLM_OK) {
        throw NetworkError(std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(mc), 0, url_);
    }
    attached_ = true;
    done_ = false;
    result_ = CURLE_OK;

    // Status and headers are final once body bytes arrive or the transfer ends
    while (!done_ && pending_.empty()) {
        pump();
    }

    if (done_ && result_ != CURLE_OK) {
        std::string message = transfer_error();
        release();
        throw NetworkError(message, 0, request.url);
    }

    long status = 0;
    curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status);
    char* effective = nullptr;
    curl_easy_getinfo(easy_, CURLINFO_EFFECTIVE_URL, &effective);

    TransportResponse response;
    response.effective_url = effective ? effective : request.url;
    // file:// transfers report no status code
    if (status == 0 && response.effective_url.compare(0, 5, "file:") == 0) {
        status = 200;
    }
    response.status = status;
    response.headers = response_headers_;
    response.body = std::make_unique<CurlBodyStream>(this, generation_);
    return response;
}

void CurlTransport::release() {
    detach();
    ++generation_;
    pending_.clear();
    pending_offset_ = 0;
    response_headers_.clear();
    paused_ = false;
    done_ = true;
    result_ = CURLE_OK;
}

void CurlTransport::detach() {
    if (attached_) {
        curl_multi_remove_handle(multi_, easy_);
        attached_ = false;
    }
}

void CurlTransport::pump() {
    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_, &running);
    if (mc != CURLM_OK) {
        throw NetworkError(std::string("curl_multi_perform failed: ") + curl_multi_strerror(mc), 0, url_);
    }

    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
        if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
            result_ = msg->data.result;
            done_ = true;
        }
    }

    if (done_) {
        detach();
        return;
    }
    if (running > 0 && pending_.empty()) {
        mc = curl_multi_poll(multi_, nullptr, 0, CurlDefaults::POLL_TIMEOUT_MS, nullptr);
        if (mc != CURLM_OK) {
            throw NetworkError(std::string("curl_multi_poll failed: ") + curl_multi_strerror(mc), 0, url_);
        }
    }
}

std::size_t CurlTransport::read_body(std::uint64_t generation, char* buffer, std::size_t size) {
    if (generation != generation_) {
        throw StateError("Response body belongs to a superseded request");
    }

    while (pending_offset_ >= pending_.size()) {
        pending_.clear();
        pending_offset_ = 0;

        if (done_) {
            if (result_ != CURLE_OK) {
                throw NetworkError(transfer_error(), 0, url_);
            }
            return 0;
        }

        if (paused_) {
            paused_ = false;
            // Unpausing may deliver buffered data through write_cb synchronously
            CURLcode rc = curl_easy_pause(easy_, CURLPAUSE_CONT);
            if (rc != CURLE_OK) {
                throw NetworkError(std::string("curl_easy_pause failed: ") + curl_easy_strerror(rc), 0, url_);
            }
            continue;
        }

        pump();
    }

    std::size_t count = std::min(size, pending_.size() - pending_offset_);
    std::memcpy(buffer, pending_.data() + pending_offset_, count);
    pending_offset_ += count;
    return count;
}

std::string CurlTransport::transfer_error() const {
    std::string message = "CURL error: ";
    message += curl_easy_strerror(result_);
    if (error_buf_[0] != '\0') {
        message += " (";
        message += error_buf_.data();
        message += ")";
    }
    return message;
}

std::size_t CurlTransport::write_cb(char* data, std::size_t size, std::size_t n_items, void* userdata) {
    auto* self = static_cast<CurlTransport*>(userdata);
    std::size_t bytes = size * n_items;

    if (self->pausable_ && self->pending_.size() - self->pending_offset_ >= kMaxPendingBytes) {
        self->paused_ = true;
        return CURL_WRITEFUNC_PAUSE;
    }

    self->pending_.append(data, bytes);
    return bytes;
}

std::size_t CurlTransport::header_cb(char* buffer, std::size_t size, std::size_t n_items, void* userdata) {
    auto* self = static_cast<CurlTransport*>(userdata);
    std::size_t bytes = size * n_items;
    std::string line(buffer, bytes);

    // A new status line starts a new header block (redirects, 100-continue)
    if (line.compare(0, 5, "HTTP/") == 0) {
        self->response_headers_.clear();
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        self->response_headers_[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    return bytes;
}

} // namespace tabfetch
