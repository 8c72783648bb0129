#include "auth/auth_resolver.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace tabfetch {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string getenv_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string json_scalar_to_string(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

QueryParams params_from_json(const json& j, const std::string& origin) {
    if (!j.is_object()) {
        throw ConfigurationError("Extra parameters in " + origin + " must be a mapping");
    }
    QueryParams params;
    for (auto it = j.begin(); it != j.end(); ++it) {
        params.emplace_back(it.key(), json_scalar_to_string(it.value()));
    }
    return params;
}

QueryParams params_from_yaml(const YAML::Node& node, const std::string& origin) {
    if (!node.IsMap()) {
        throw ConfigurationError("Extra parameters in " + origin + " must be a mapping");
    }
    QueryParams params;
    for (const auto& entry : node) {
        const YAML::Node& value = entry.second;
        if (!value.IsScalar() && !value.IsNull()) {
            throw ConfigurationError("Extra parameter " + entry.first.as<std::string>() +
                                     " in " + origin + " is not a scalar");
        }
        params.emplace_back(entry.first.as<std::string>(),
                            value.IsNull() ? std::string() : value.as<std::string>());
    }
    return params;
}

} // namespace

AuthResolver::AuthResolver(AuthOptions options)
    : options_(std::move(options)) {}

BasicCredentials AuthResolver::decode_basic_auth(const std::string& value) {
    std::istringstream iss(trim(value));
    std::vector<std::string> parts;
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }

    std::string encoded;
    if (parts.size() == 1) {
        encoded = parts[0];
    } else if (parts.size() == 2) {
        std::string scheme = parts[0];
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (scheme != "basic") {
            throw ConfigurationError("Basic auth string must start with 'Basic'");
        }
        encoded = parts[1];
    } else {
        throw ConfigurationError("Malformed basic auth string");
    }

    if (encoded.empty() || encoded.size() % 4 != 0) {
        throw ConfigurationError("Basic auth string is not valid base64");
    }

    std::string decoded(encoded.size() / 4 * 3, '\0');
    int length = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&decoded[0]),
                                 reinterpret_cast<const unsigned char*>(encoded.data()),
                                 static_cast<int>(encoded.size()));
    if (length < 0) {
        throw ConfigurationError("Basic auth string is not valid base64");
    }
    // EVP_DecodeBlock counts padding as decoded zero bytes
    size_t padding = 0;
    for (auto it = encoded.rbegin(); it != encoded.rend() && *it == '='; ++it) {
        ++padding;
    }
    decoded.resize(static_cast<size_t>(length) - padding);

    size_t colon = decoded.find(':');
    if (colon == std::string::npos) {
        throw ConfigurationError("Basic auth string does not contain user:password");
    }
    return BasicCredentials{decoded.substr(0, colon), decoded.substr(colon + 1)};
}

std::string AuthResolver::encode_basic_auth(const std::string& username, const std::string& password) {
    std::string plain = username + ":" + password;
    std::string encoded(4 * ((plain.size() + 2) / 3) + 1, '\0');
    int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                 reinterpret_cast<const unsigned char*>(plain.data()),
                                 static_cast<int>(plain.size()));
    encoded.resize(static_cast<size_t>(length));
    return "Basic " + encoded;
}

QueryParams AuthResolver::parse_params_string(const std::string& value) {
    QueryParams params;
    std::stringstream ss(value);
    std::string entry;
    while (std::getline(ss, entry, ',')) {
        entry = trim(entry);
        if (entry.empty()) {
            continue;
        }
        size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            throw ConfigurationError("Extra parameter '" + entry + "' is not of the form key=value");
        }
        set_param(params, trim(entry.substr(0, eq)), trim(entry.substr(eq + 1)));
    }
    return params;
}

std::optional<std::string> AuthResolver::read_file(const std::string& path, const std::string& what) const {
    if (!fs::exists(path)) {
        if (options_.fail_on_missing_file) {
            throw ConfigurationError("The " + what + " file " + path + " does not exist");
        }
        Logger::get_instance().log_info("Skipping missing " + what + " file", {{"path", path}});
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open " + what + " file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::optional<QueryParams> AuthResolver::load_params() const {
    return std::visit(overloaded{
        [](const std::monostate&) -> std::optional<QueryParams> {
            return QueryParams();
        },
        [](const ParamsDict& source) -> std::optional<QueryParams> {
            return source.params;
        },
        [this](const ParamsJsonFile& source) -> std::optional<QueryParams> {
            auto contents = read_file(source.path, "extra parameters JSON");
            if (!contents) {
                return std::nullopt;
            }
            Logger::get_instance().log_info("Loading extra parameters", {{"path", source.path}});
            json j;
            try {
                j = json::parse(*contents);
            } catch (const json::parse_error& e) {
                throw ConfigurationError("Invalid JSON in " + source.path + ": " + e.what());
            }
            if (!options_.extra_params_lookup.empty()) {
                if (!j.is_object() || !j.contains(options_.extra_params_lookup)) {
                    throw ConfigurationError(options_.extra_params_lookup +
                                             " does not exist in extra parameters");
                }
                j = j[options_.extra_params_lookup];
            }
            return params_from_json(j, source.path);
        },
        [this](const ParamsYamlFile& source) -> std::optional<QueryParams> {
            auto contents = read_file(source.path, "extra parameters YAML");
            if (!contents) {
                return std::nullopt;
            }
            Logger::get_instance().log_info("Loading extra parameters", {{"path", source.path}});
            YAML::Node node;
            try {
                node = YAML::Load(*contents);
            } catch (const YAML::Exception& e) {
                throw ConfigurationError("Invalid YAML in " + source.path + ": " + e.what());
            }
            if (options_.extra_params_lookup.empty()) {
                return params_from_yaml(node, source.path);
            }
            const YAML::Node& root = node;
            if (!root.IsMap() || !root[options_.extra_params_lookup]) {
                throw ConfigurationError(options_.extra_params_lookup +
                                         " does not exist in extra parameters");
            }
            return params_from_yaml(root[options_.extra_params_lookup], source.path);
        },
    }, options_.extra_params);
}

std::optional<AuthResolver::Candidate> AuthResolver::explicit_candidate() const {
    return std::visit(overloaded{
        [](const std::monostate&) -> std::optional<Candidate> {
            return std::nullopt;
        },
        [](const UserPassword& source) -> std::optional<Candidate> {
            return Candidate{"auth", "auth argument", AuthKind::UserPassword, "",
                             BasicCredentials{source.username, source.password}};
        },
        [](const BasicAuthString& source) -> std::optional<Candidate> {
            return Candidate{"basic_auth", "basic_auth argument", AuthKind::Basic, source.value, {}};
        },
        [this](const BasicAuthFile& source) -> std::optional<Candidate> {
            auto contents = read_file(source.path, "basic auth");
            if (!contents) {
                return std::nullopt;
            }
            return Candidate{"basic_auth_file", source.path, AuthKind::Basic, trim(*contents), {}};
        },
        [](const BearerToken& source) -> std::optional<Candidate> {
            return Candidate{"bearer_token", "bearer_token argument", AuthKind::Bearer, source.token, {}};
        },
        [this](const BearerTokenFile& source) -> std::optional<Candidate> {
            auto contents = read_file(source.path, "bearer token");
            if (!contents) {
                return std::nullopt;
            }
            return Candidate{"bearer_token_file", source.path, AuthKind::Bearer, trim(*contents), {}};
        },
    }, options_.auth);
}

void AuthResolver::take_auth_keys(QueryParams& params, const std::string& origin,
                                  std::vector<Candidate>& candidates) {
    for (auto it = params.begin(); it != params.end();) {
        if (it->first == "basic_auth" && !it->second.empty()) {
            candidates.push_back(Candidate{"basic_auth", origin, AuthKind::Basic, it->second, {}});
            it = params.erase(it);
        } else if (it->first == "bearer_token" && !it->second.empty()) {
            candidates.push_back(Candidate{"bearer_token", origin, AuthKind::Bearer, it->second, {}});
            it = params.erase(it);
        } else {
            ++it;
        }
    }
}

const AuthResolver::Candidate& AuthResolver::select(const std::vector<Candidate>& candidates) const {
    if (!options_.use_auth.empty()) {
        for (const auto& candidate : candidates) {
            if (candidate.name == options_.use_auth) {
                return candidate;
            }
        }
        throw ConfigurationError("Authorisation " + options_.use_auth + " was requested but not found");
    }

    if (candidates.size() > 1) {
        std::string origins;
        for (const auto& candidate : candidates) {
            if (!origins.empty()) origins += ", ";
            origins += candidate.origin;
        }
        throw ConfigurationError("More than one authorisation given (" + origins +
                                 "); set use_auth to choose one");
    }
    return candidates.front();
}

RequestContext AuthResolver::resolve(const HeaderMap& base_headers) const {
    Logger& logger = Logger::get_instance();
    RequestContext context;
    context.headers = base_headers;
    context.auth_source = "none";

    std::vector<Candidate> candidates;
    if (auto candidate = explicit_candidate()) {
        candidates.push_back(std::move(*candidate));
    }

    bool have_params_source = !std::holds_alternative<std::monostate>(options_.extra_params);
    std::optional<QueryParams> params = load_params();
    if (params) {
        if (std::holds_alternative<ParamsDict>(options_.extra_params) &&
            !options_.extra_params_lookup.empty()) {
            // Inline parameters are flat; a lookup key cannot narrow them
            throw ConfigurationError(options_.extra_params_lookup + " does not exist in extra parameters");
        }
        if (!have_params_source && !options_.extra_params_lookup.empty()) {
            throw ConfigurationError(options_.extra_params_lookup + " does not exist in extra parameters");
        }
        take_auth_keys(*params, "extra parameters", candidates);
        context.extra_params = std::move(*params);
    }

    if (options_.use_env) {
        std::string env_params = getenv_or_empty("EXTRA_PARAMS");
        if (!env_params.empty()) {
            logger.log_info("Loading extra parameters from environment variable EXTRA_PARAMS");
            // Environment parameters replace file parameters, auth keys included
            candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                            [](const Candidate& c) { return c.origin == "extra parameters"; }),
                             candidates.end());
            QueryParams replaced = parse_params_string(env_params);
            take_auth_keys(replaced, "EXTRA_PARAMS", candidates);
            context.extra_params = std::move(replaced);
        }
        std::string env_basic = getenv_or_empty("BASIC_AUTH");
        if (!env_basic.empty()) {
            candidates.push_back(Candidate{"BASIC_AUTH", "environment variable BASIC_AUTH",
                                           AuthKind::Basic, env_basic, {}});
        }
        std::string env_bearer = getenv_or_empty("BEARER_TOKEN");
        if (!env_bearer.empty()) {
            candidates.push_back(Candidate{"BEARER_TOKEN", "environment variable BEARER_TOKEN",
                                           AuthKind::Bearer, env_bearer, {}});
        }
    }

    if (candidates.empty()) {
        if (!options_.use_auth.empty()) {
            throw ConfigurationError("Authorisation " + options_.use_auth + " was requested but not found");
        }
        return context;
    }

    const Candidate& chosen = select(candidates);
    switch (chosen.kind) {
        case AuthKind::UserPassword:
            context.basic_auth = chosen.credentials;
            logger.log_info("Loading authorisation", {{"source", chosen.origin},
                                                      {"username", chosen.credentials.username}});
            break;
        case AuthKind::Basic:
            context.basic_auth = decode_basic_auth(chosen.value);
            logger.log_info("Loading authorisation", {{"source", chosen.origin},
                                                      {"basic_auth", Logger::mask_token(chosen.value)}});
            break;
        case AuthKind::Bearer:
            context.bearer_token = chosen.value;
            context.headers["Authorization"] = "Bearer " + chosen.value;
            context.headers["Accept"] = "application/json";
            logger.log_info("Loading authorisation", {{"source", chosen.origin},
                                                      {"bearer_token", Logger::mask_token(chosen.value)}});
            break;
    }
    context.auth_source = chosen.origin;
    return context;
}

} // namespace tabfetch
