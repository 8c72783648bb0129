/**
 * @file scripted_transport.hpp
 * @brief In-process Transport replaying canned replies for tests
 */

#ifndef TABFETCH_TESTS_SCRIPTED_TRANSPORT_HPP
#define TABFETCH_TESTS_SCRIPTED_TRANSPORT_HPP

#include "api/http_client.hpp"
#include "api/transport.hpp"
#include "errors.hpp"
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace tabfetch {
namespace testing {

struct ScriptedReply {
    long status = 200;
    std::string body;
    HeaderMap headers;
    bool fail = false;           ///< Throw NetworkError instead of replying
    std::string error = "connection refused";

    static ScriptedReply ok(const std::string& body) {
        ScriptedReply reply;
        reply.body = body;
        return reply;
    }

    static ScriptedReply status_only(long status) {
        ScriptedReply reply;
        reply.status = status;
        return reply;
    }

    static ScriptedReply failure(const std::string& error = "connection refused") {
        ScriptedReply reply;
        reply.fail = true;
        reply.error = error;
        return reply;
    }
};

/**
 * @brief Shared between the test and the transport owned by the client
 *
 * Replies are consumed in order; once empty, `otherwise` answers every call.
 */
struct Script {
    std::deque<ScriptedReply> replies;
    ScriptedReply otherwise = ScriptedReply::status_only(404);
    std::vector<TransportRequest> requests;
    int releases = 0;

    size_t calls() const { return requests.size(); }
};

class ScriptedTransport : public Transport {
public:
    explicit ScriptedTransport(std::shared_ptr<Script> script) : script_(std::move(script)) {}

    TransportResponse perform(const TransportRequest& request) override {
        script_->requests.push_back(request);

        ScriptedReply reply = script_->otherwise;
        if (!script_->replies.empty()) {
            reply = script_->replies.front();
            script_->replies.pop_front();
        }
        if (reply.fail) {
            throw NetworkError(reply.error, 0, request.url);
        }

        TransportResponse response;
        response.status = reply.status;
        response.headers = reply.headers;
        response.effective_url = request.url;
        response.body = std::make_unique<StringBodyStream>(reply.body);
        return response;
    }

    void release() override { ++script_->releases; }

private:
    std::shared_ptr<Script> script_;
};

/**
 * @brief Client config with a fixed user agent and no retry delay
 */
inline ClientConfig test_client_config() {
    ClientConfig config;
    config.user_agent.user_agent = "test";
    config.auth.use_env = false;
    config.retry.backoff_factor = 0.0;
    return config;
}

/**
 * @brief Client over a scripted transport; sleeps are recorded, not taken
 */
inline std::unique_ptr<HttpClient> make_client(std::shared_ptr<Script> script,
                                               ClientConfig config = test_client_config(),
                                               RateLimiter::SleepFunction sleep = RateLimiter::SleepFunction()) {
    if (!sleep) {
        sleep = [](RateLimiter::Clock::duration) {};
    }
    return std::make_unique<HttpClient>(std::move(config), std::make_unique<ScriptedTransport>(script),
                                        std::move(sleep));
}

} // namespace testing
} // namespace tabfetch

#endif // TABFETCH_TESTS_SCRIPTED_TRANSPORT_HPP
