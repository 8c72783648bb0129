/**
 * @file user_agent.hpp
 * @brief User agent construction with a process-wide default
 */

#ifndef TABFETCH_AUTH_USER_AGENT_HPP
#define TABFETCH_AUTH_USER_AGENT_HPP

#include <optional>
#include <string>

namespace tabfetch {

struct UserAgentOptions {
    std::string user_agent;     ///< Custom text; takes precedence over the YAML file
    std::string config_yaml;    ///< YAML file with a user_agent key; empty uses ~/.useragent.yml
    std::string lookup;         ///< Key narrowing the YAML mapping
    std::string prefix;         ///< Empty uses "tabfetch/<version>"
    std::string preprefix;      ///< Optional text before the prefix, separated by ':'

    bool empty() const { return user_agent.empty() && config_yaml.empty(); }
};

/**
 * @brief Builds "[preprefix:]prefix-user_agent"
 *
 * USER_AGENT and PREPREFIX environment variables override the supplied
 * values.
 */
class UserAgent {
public:
    /**
     * @throws ConfigurationError if no user agent can be found
     */
    static std::string create(const UserAgentOptions& options);

    /**
     * @brief Build from options when given, else return the global default
     *
     * @throws ConfigurationError if neither options nor a global default exist
     */
    static std::string get(const UserAgentOptions& options = UserAgentOptions());

    static void set_global(const UserAgentOptions& options);
    static void clear_global();
    static std::optional<std::string> global();

    static std::string default_prefix();
    static std::string default_config_yaml();

private:
    static std::optional<std::string>& global_agent();
    static std::string construct(const std::string& preprefix, const std::string& prefix,
                                 const std::string& user_agent);
    static std::string load(const std::string& prefix, const std::string& config_yaml,
                            const std::string& lookup);
};

} // namespace tabfetch

#endif // TABFETCH_AUTH_USER_AGENT_HPP
