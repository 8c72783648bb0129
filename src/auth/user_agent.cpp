#include "auth/user_agent.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>

#ifndef TABFETCH_VERSION
#define TABFETCH_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;

namespace tabfetch {

std::optional<std::string>& UserAgent::global_agent() {
    static std::optional<std::string> agent;
    return agent;
}

std::string UserAgent::default_prefix() {
    return std::string("tabfetch/") + TABFETCH_VERSION;
}

std::string UserAgent::default_config_yaml() {
    const char* home = std::getenv("HOME");
#ifdef _WIN32
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    fs::path base = home ? fs::path(home) : fs::current_path();
    return (base / ".useragent.yml").string();
}

std::string UserAgent::construct(const std::string& preprefix, const std::string& prefix,
                                 const std::string& user_agent) {
    if (user_agent.empty()) {
        throw ConfigurationError("User agent missing. It can be your project's name for example.");
    }
    std::string result;
    if (!preprefix.empty()) {
        result = preprefix + ":";
    }
    if (!prefix.empty()) {
        result += prefix + "-";
    }
    return result + user_agent;
}

std::string UserAgent::load(const std::string& prefix, const std::string& config_yaml,
                            const std::string& lookup) {
    Logger& logger = Logger::get_instance();
    std::string path = config_yaml;
    if (path.empty()) {
        path = default_config_yaml();
        logger.log_info("No user agent or user agent config file given, using default config file",
                        {{"path", path}});
    }
    if (!fs::is_regular_file(path)) {
        throw ConfigurationError("User agent should be supplied in a YAML config file: " + path);
    }

    logger.log_info("Loading user agent config", {{"path", path}});
    YAML::Node config;
    try {
        config = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid user agent config " + path + ": " + e.what());
    }

    const YAML::Node& root = config;
    YAML::Node selected = lookup.empty() ? root : root[lookup];
    if (!selected || !selected.IsMap() || selected.size() == 0) {
        throw ConfigurationError("No user agent information read from: " + path);
    }

    std::string user_agent = selected["user_agent"] ? selected["user_agent"].as<std::string>() : "";
    std::string preprefix = selected["preprefix"] ? selected["preprefix"].as<std::string>() : "";
    const char* env_preprefix = std::getenv("PREPREFIX");
    if (env_preprefix) {
        preprefix = env_preprefix;
    }
    return construct(preprefix, prefix, user_agent);
}

std::string UserAgent::create(const UserAgentOptions& options) {
    std::string user_agent = options.user_agent;
    std::string preprefix = options.preprefix;
    const char* env_user_agent = std::getenv("USER_AGENT");
    if (env_user_agent) {
        user_agent = env_user_agent;
    }
    const char* env_preprefix = std::getenv("PREPREFIX");
    if (env_preprefix) {
        preprefix = env_preprefix;
    }

    std::string prefix = options.prefix.empty() ? default_prefix() : options.prefix;
    if (user_agent.empty()) {
        return load(prefix, options.config_yaml, options.lookup);
    }
    return construct(preprefix, prefix, user_agent);
}

std::string UserAgent::get(const UserAgentOptions& options) {
    if (!options.empty() || std::getenv("USER_AGENT")) {
        return create(options);
    }
    if (global_agent()) {
        return *global_agent();
    }
    throw ConfigurationError("Either set the global user agent with UserAgent::set_global "
                             "or pass in user agent options");
}

void UserAgent::set_global(const UserAgentOptions& options) {
    global_agent() = create(options);
}

void UserAgent::clear_global() {
    global_agent().reset();
}

std::optional<std::string> UserAgent::global() {
    return global_agent();
}

} // namespace tabfetch
