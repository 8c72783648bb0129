/**
 * @file request_context.hpp
 * @brief Immutable per-client request decoration
 */

#ifndef TABFETCH_API_REQUEST_CONTEXT_HPP
#define TABFETCH_API_REQUEST_CONTEXT_HPP

#include "api/rate_limiter.hpp"
#include "api/retry_policy.hpp"
#include "api/types.hpp"
#include <optional>
#include <string>

namespace tabfetch {

struct BasicCredentials {
    std::string username;
    std::string password;

    bool operator==(const BasicCredentials& other) const {
        return username == other.username && password == other.password;
    }
};

/**
 * @brief Everything attached to every outbound call of one client
 *
 * Built once when the client is constructed and never changed afterwards.
 */
struct RequestContext {
    HeaderMap headers;
    std::optional<BasicCredentials> basic_auth;
    std::optional<std::string> bearer_token;
    QueryParams extra_params;                 ///< Appended to every GET query / POST body
    std::optional<RateLimitSpec> rate_limit;
    RetrySpec retry;
    std::string user_agent;
    std::string auth_source;                  ///< Where the auth came from, "none" if absent
};

} // namespace tabfetch

#endif // TABFETCH_API_REQUEST_CONTEXT_HPP
