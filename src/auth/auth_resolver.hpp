/**
 * @file auth_resolver.hpp
 * @brief Resolution of credentials and extra query parameters
 *
 * Sources, in precedence order:
 * 1. Explicit auth argument (user/password, basic auth string or file, bearer token or file)
 * 2. Explicit extra parameters (inline, JSON file or YAML file); "basic_auth" and
 *    "bearer_token" keys inside them are auth sources and are removed from the parameters
 * 3. Environment variables when use_env is set: BASIC_AUTH, BEARER_TOKEN and
 *    EXTRA_PARAMS ("k1=v1,k2=v2", replaces the extra parameters entirely)
 *
 * More than one auth source is an error unless use_auth names the kind to keep.
 */

#ifndef TABFETCH_AUTH_AUTH_RESOLVER_HPP
#define TABFETCH_AUTH_AUTH_RESOLVER_HPP

#include "api/request_context.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tabfetch {

struct UserPassword {
    std::string username;
    std::string password;
};

/** @brief "Basic <base64 user:pass>" */
struct BasicAuthString {
    std::string value;
};

struct BasicAuthFile {
    std::string path;
};

struct BearerToken {
    std::string token;
};

struct BearerTokenFile {
    std::string path;
};

using AuthSource = std::variant<std::monostate, UserPassword, BasicAuthString, BasicAuthFile,
                                BearerToken, BearerTokenFile>;

struct ParamsDict {
    QueryParams params;
};

struct ParamsJsonFile {
    std::string path;
};

struct ParamsYamlFile {
    std::string path;
};

using ExtraParamsSource = std::variant<std::monostate, ParamsDict, ParamsJsonFile, ParamsYamlFile>;

/**
 * @brief Auth configuration as supplied by the caller
 */
struct AuthOptions {
    AuthSource auth;
    ExtraParamsSource extra_params;
    std::string extra_params_lookup;   ///< Key narrowing the parameter mapping; empty uses the root
    std::string use_auth;              ///< Auth kind to keep when several are found; empty for none
    bool use_env = true;
    bool fail_on_missing_file = true;
};

class AuthResolver {
public:
    explicit AuthResolver(AuthOptions options);

    /**
     * @brief Resolve auth and extra parameters into request decoration
     *
     * @param base_headers Caller headers; bearer auth adds Authorization and Accept
     * @return Context with headers, basic_auth or bearer_token, extra_params and
     *         auth_source filled in
     * @throws ConfigurationError on conflicting sources, a missing lookup key,
     *         a missing file with fail_on_missing_file, or malformed basic auth
     */
    RequestContext resolve(const HeaderMap& base_headers = {}) const;

    const AuthOptions& options() const { return options_; }

    /**
     * @brief Decode "Basic <base64>" (or bare base64) into user and password
     *
     * @throws ConfigurationError if the value is not valid basic auth
     */
    static BasicCredentials decode_basic_auth(const std::string& value);

    /**
     * @brief Encode user and password as "Basic <base64 user:pass>"
     */
    static std::string encode_basic_auth(const std::string& username, const std::string& password);

    /**
     * @brief Parse "k1=v1,k2=v2" into ordered parameters
     *
     * @throws ConfigurationError on an entry without '='
     */
    static QueryParams parse_params_string(const std::string& value);

private:
    enum class AuthKind { UserPassword, Basic, Bearer };

    struct Candidate {
        std::string name;      ///< Matched against use_auth
        std::string origin;    ///< Human readable origin for logs and errors
        AuthKind kind;
        std::string value;     ///< Basic string or bearer token
        BasicCredentials credentials;
    };

    AuthOptions options_;

    std::optional<std::string> read_file(const std::string& path, const std::string& what) const;
    std::optional<QueryParams> load_params() const;
    std::optional<Candidate> explicit_candidate() const;
    static void take_auth_keys(QueryParams& params, const std::string& origin,
                               std::vector<Candidate>& candidates);
    const Candidate& select(const std::vector<Candidate>& candidates) const;
};

} // namespace tabfetch

#endif // TABFETCH_AUTH_AUTH_RESOLVER_HPP
