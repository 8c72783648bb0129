#include "config/config_parser.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace tabfetch {

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (var_name.empty()) {
            // Lone '$' is literal
            pos = start + 1;
            continue;
        }
        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigurationError("Unterminated ${ in: " + value);
            }
            pos++;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (path.empty()) {
        return path;
    }
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

namespace {

std::string get_string(const json& j, const char* key) {
    return expand_environment_variables(j.at(key).get<std::string>());
}

std::string scalar_to_string(const json& value) {
    return value.is_string() ? expand_environment_variables(value.get<std::string>()) : value.dump();
}

void parse_auth(const json& j, AuthOptions& auth) {
    int sources = 0;
    auto set_source = [&](AuthSource source) {
        ++sources;
        auth.auth = std::move(source);
    };

    if (j.contains("auth")) {
        const json& pair = j["auth"];
        if (!pair.is_array() || pair.size() != 2) {
            throw ConfigurationError("auth must be a [user, password] array");
        }
        set_source(UserPassword{expand_environment_variables(pair[0].get<std::string>()),
                                expand_environment_variables(pair[1].get<std::string>())});
    }
    if (j.contains("basic_auth")) {
        set_source(BasicAuthString{get_string(j, "basic_auth")});
    }
    if (j.contains("basic_auth_file")) {
        set_source(BasicAuthFile{get_string(j, "basic_auth_file")});
    }
    if (j.contains("bearer_token")) {
        set_source(BearerToken{get_string(j, "bearer_token")});
    }
    if (j.contains("bearer_token_file")) {
        set_source(BearerTokenFile{get_string(j, "bearer_token_file")});
    }
    if (sources > 1) {
        throw ConfigurationError("Only one of auth, basic_auth, basic_auth_file, bearer_token and "
                                 "bearer_token_file may be given");
    }

    int param_sources = 0;
    if (j.contains("extra_params_dict")) {
        ParamsDict dict;
        for (auto it = j["extra_params_dict"].begin(); it != j["extra_params_dict"].end(); ++it) {
            set_param(dict.params, it.key(), scalar_to_string(it.value()));
        }
        auth.extra_params = std::move(dict);
        ++param_sources;
    }
    if (j.contains("extra_params_json")) {
        auth.extra_params = ParamsJsonFile{get_string(j, "extra_params_json")};
        ++param_sources;
    }
    if (j.contains("extra_params_yaml")) {
        auth.extra_params = ParamsYamlFile{get_string(j, "extra_params_yaml")};
        ++param_sources;
    }
    if (param_sources > 1) {
        throw ConfigurationError("Only one of extra_params_dict, extra_params_json and "
                                 "extra_params_yaml may be given");
    }

    if (j.contains("extra_params_lookup")) {
        auth.extra_params_lookup = get_string(j, "extra_params_lookup");
    }
    if (j.contains("use_auth")) {
        auth.use_auth = get_string(j, "use_auth");
    }
    if (j.contains("use_env")) {
        auth.use_env = j["use_env"].get<bool>();
    }
    if (j.contains("fail_on_missing_file")) {
        auth.fail_on_missing_file = j["fail_on_missing_file"].get<bool>();
    }
}

void parse_retry(const json& j, RetrySpec& retry) {
    if (j.contains("statuses")) {
        retry.statuses.clear();
        for (const auto& status : j["statuses"]) {
            retry.statuses.insert(status.get<long>());
        }
    }
    if (j.contains("methods")) {
        retry.methods.clear();
        for (const auto& method : j["methods"]) {
            retry.methods.insert(method.get<std::string>());
        }
    }
    if (j.contains("max_attempts")) {
        retry.max_attempts = j["max_attempts"].get<int>();
    }
    if (j.contains("backoff_factor")) {
        retry.backoff_factor = j["backoff_factor"].get<double>();
    }
    if (j.contains("max_backoff")) {
        retry.max_backoff = j["max_backoff"].get<double>();
    }
}

void parse_client(const json& j, ClientConfig& client) {
    parse_auth(j, client.auth);

    if (j.contains("user_agent")) {
        client.user_agent.user_agent = get_string(j, "user_agent");
    }
    if (j.contains("user_agent_config_yaml")) {
        client.user_agent.config_yaml = get_string(j, "user_agent_config_yaml");
    }
    if (j.contains("user_agent_lookup")) {
        client.user_agent.lookup = get_string(j, "user_agent_lookup");
    }

    if (j.contains("headers")) {
        for (auto it = j["headers"].begin(); it != j["headers"].end(); ++it) {
            client.headers[it.key()] = scalar_to_string(it.value());
        }
    }

    if (j.contains("rate_limit")) {
        const json& limit = j["rate_limit"];
        RateLimitSpec spec;
        if (limit.contains("calls")) {
            spec.calls = limit["calls"].get<int>();
        }
        if (limit.contains("period")) {
            spec.period = limit["period"].get<double>();
        }
        client.rate_limit = spec;
    }

    if (j.contains("retry")) {
        parse_retry(j["retry"], client.retry);
    }
    if (j.contains("timeout_ms")) {
        client.timeout_ms = j["timeout_ms"].get<long>();
    }
    if (j.contains("connect_timeout_ms")) {
        client.connect_timeout_ms = j["connect_timeout_ms"].get<long>();
    }
}

void parse_retrieval(const json& j, RetrievalPolicy& retrieval) {
    if (j.contains("fallback_dir")) {
        retrieval.fallback_dir = get_string(j, "fallback_dir");
    }
    if (j.contains("saved_dir")) {
        retrieval.saved_dir = get_string(j, "saved_dir");
    }
    if (j.contains("temp_dir")) {
        retrieval.temp_dir = get_string(j, "temp_dir");
    }
    if (j.contains("save")) {
        retrieval.save = j["save"].get<bool>();
    }
    if (j.contains("use_saved")) {
        retrieval.use_saved = j["use_saved"].get<bool>();
    }
}

void parse_custom_clients(const json& j, std::map<std::string, ClientConfig>& clients) {
    const json& custom = j["clients"];
    if (!custom.is_object()) {
        throw ConfigurationError("clients must be an object of named client configurations");
    }
    json base = j;
    base.erase("clients");
    base.erase("retrieval");

    for (auto it = custom.begin(); it != custom.end(); ++it) {
        if (!it.value().is_object()) {
            throw ConfigurationError("clients." + it.key() + " must be an object");
        }
        json merged = base;
        merged.update(it.value());
        ClientConfig client;
        try {
            parse_client(merged, client);
        } catch (const ConfigurationError& e) {
            throw e.annotated("client " + it.key());
        }
        clients[it.key()] = std::move(client);
    }
}

std::string read_config_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open config file: " + file_path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void resolve_client_paths(ClientConfig& client, const std::string& file_path) {
    if (auto* source = std::get_if<BasicAuthFile>(&client.auth.auth)) {
        source->path = resolve_relative_path(source->path, file_path);
    } else if (auto* source = std::get_if<BearerTokenFile>(&client.auth.auth)) {
        source->path = resolve_relative_path(source->path, file_path);
    }

    if (auto* source = std::get_if<ParamsJsonFile>(&client.auth.extra_params)) {
        source->path = resolve_relative_path(source->path, file_path);
    } else if (auto* source = std::get_if<ParamsYamlFile>(&client.auth.extra_params)) {
        source->path = resolve_relative_path(source->path, file_path);
    }

    client.user_agent.config_yaml = resolve_relative_path(client.user_agent.config_yaml, file_path);
}

} // namespace

FetchConfig parse_fetch_config_from_string(const std::string& json_string) {
    FetchConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigurationError("Configuration must be a JSON object");
        }

        parse_client(j, config.client);
        if (j.contains("clients")) {
            parse_custom_clients(j, config.clients);
        }
        if (j.contains("retrieval")) {
            parse_retrieval(j["retrieval"], config.retrieval);
        }
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigurationError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigurationError(std::string("JSON key error: ") + e.what());
    }

    if (config.retrieval.save && config.retrieval.use_saved) {
        throw ConfigurationError("retrieval.save and retrieval.use_saved cannot both be true");
    }
    return config;
}

FetchConfig parse_fetch_config_from_file(const std::string& file_path) {
    FetchConfig config = parse_fetch_config_from_string(read_config_file(file_path));

    resolve_client_paths(config.client, file_path);
    for (auto& entry : config.clients) {
        resolve_client_paths(entry.second, file_path);
    }
    config.retrieval.fallback_dir = resolve_relative_path(config.retrieval.fallback_dir, file_path);
    config.retrieval.saved_dir = resolve_relative_path(config.retrieval.saved_dir, file_path);
    config.retrieval.temp_dir = resolve_relative_path(config.retrieval.temp_dir, file_path);
    return config;
}

ClientConfig parse_client_config_from_string(const std::string& json_string) {
    return parse_fetch_config_from_string(json_string).client;
}

ClientConfig parse_client_config_from_file(const std::string& file_path) {
    return parse_fetch_config_from_file(file_path).client;
}

} // namespace tabfetch
