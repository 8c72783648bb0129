#include "cache/retrieval_cache.hpp"
#include "api/live_response.hpp"
#include "api/url_utils.hpp"
#include "cache/cache_key.hpp"
#include "cache/temp_dir.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace tabfetch {

std::string kind_to_string(RetrievalKind kind) {
    switch (kind) {
        case RetrievalKind::File: return "file";
        case RetrievalKind::Text: return "text";
        case RetrievalKind::Json: return "json";
        case RetrievalKind::Yaml: return "yaml";
        default: return "unknown";
    }
}

std::string source_to_string(RetrievalSource source) {
    switch (source) {
        case RetrievalSource::Network: return "network";
        case RetrievalSource::Saved: return "saved";
        case RetrievalSource::Fallback: return "fallback";
        default: return "unknown";
    }
}

RetrievalKind string_to_kind(const std::string& name) {
    if (name == "file") return RetrievalKind::File;
    if (name == "text") return RetrievalKind::Text;
    if (name == "json") return RetrievalKind::Json;
    if (name == "yaml") return RetrievalKind::Yaml;
    throw ConfigurationError("Unknown retrieval kind: " + name);
}

RetrievalCache::RetrievalCache(HttpClient& client, RetrievalPolicy policy)
    : client_(client), policy_(std::move(policy))
{
    if (policy_.save && policy_.use_saved) {
        throw ConfigurationError("Cannot save and use saved data at the same time");
    }
    if ((policy_.save || policy_.use_saved) && policy_.saved_dir.empty()) {
        throw ConfigurationError("saved_dir is required to save or use saved data");
    }
    if (policy_.temp_dir.empty()) {
        policy_.temp_dir = temp_root();
    }

    if (policy_.save) {
        std::error_code ec;
        fs::remove_all(policy_.saved_dir, ec);
        if (ec) {
            throw TabfetchError("Cannot clear saved folder " + policy_.saved_dir + ": " + ec.message());
        }
        fs::create_directories(policy_.saved_dir, ec);
        if (ec) {
            throw TabfetchError("Cannot create saved folder " + policy_.saved_dir + ": " + ec.message());
        }
    }
}

void RetrievalCache::write_atomic(const std::string& path, const std::string& bytes) {
    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw TabfetchError("Cannot create folder " + target.parent_path().string() + ": " + ec.message());
        }
    }
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw TabfetchError("Cannot open " + tmp.string() + " for writing");
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw TabfetchError("Failed writing to " + tmp.string());
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tmp, ec);
        throw TabfetchError("Cannot move " + tmp.string() + " to " + target.string() + ": " + reason);
    }
}

void RetrievalCache::decode_into(RetrievalResult& result, const std::string& bytes, const std::string& origin) {
    switch (result.kind) {
        case RetrievalKind::Text:
            result.text = strip_bom(bytes);
            break;
        case RetrievalKind::Json:
            result.json = decode_json(bytes, origin);
            break;
        case RetrievalKind::Yaml:
            result.yaml = decode_yaml(bytes, origin);
            break;
        case RetrievalKind::File:
            break;
    }
}

RetrievalResult RetrievalCache::load_local(const std::string& path, RetrievalKind kind, RetrievalSource source) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw CacheMissError("No file at " + path, path);
    }

    RetrievalResult result;
    result.kind = kind;
    result.source = source;
    result.path = path;
    if (kind == RetrievalKind::File) {
        return result;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CacheMissError("Cannot open " + path, path);
    }
    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    decode_into(result, bytes, path);
    return result;
}

RetrievalResult RetrievalCache::from_network(const std::string& url, const std::string& filename,
                                             RetrievalKind kind, const std::string& logstr,
                                             const RequestOptions& request) {
    const std::string& root = policy_.save ? policy_.saved_dir : policy_.temp_dir;
    std::string path = CacheKey::path(root, url, filename);
    Logger& logger = Logger::get_instance();
    logger.log_retrieval("download", logstr, url, "");

    RetrievalResult result;
    result.kind = kind;
    result.source = RetrievalSource::Network;

    if (kind == RetrievalKind::File) {
        DownloadFileOptions options;
        options.path = path;
        options.overwrite = true;
        options.request = request;
        result.path = client_.download_file(url, options).path;
        if (policy_.save) {
            logger.log_retrieval("save", logstr, url, result.path);
        }
        return result;
    }

    LiveResponse& response = client_.request(url, request);
    if (!response.ok()) {
        long status = response.status();
        client_.close();
        throw NetworkError("HTTP " + std::to_string(status) + " downloading " + truncate_for_log(url),
                           status, url);
    }
    std::string bytes = response.body();
    client_.close();

    decode_into(result, bytes, url);
    if (policy_.save) {
        logger.log_retrieval("save", logstr, url, path);
    }
    write_atomic(path, bytes);
    result.path = path;
    return result;
}

template <typename Error>
RetrievalResult RetrievalCache::from_fallback(const Error& original, const std::string& url,
                                              const std::string& filename, RetrievalKind kind,
                                              const std::string& logstr) {
    Logger& logger = Logger::get_instance();
    try {
        if (policy_.fallback_dir.empty()) {
            throw ConfigurationError("no fallback_dir configured");
        }
        std::string path = CacheKey::path(policy_.fallback_dir, url, filename);
        logger.log_error(logstr + " download failed, using static data " + path,
                         {{"error", original.what()}, {"url", truncate_for_log(url)}});
        RetrievalResult result = load_local(path, kind, RetrievalSource::Fallback);
        logger.log_retrieval("fallback", logstr, url, path);
        return result;
    } catch (const TabfetchError& e) {
        throw original.annotated(std::string("fallback attempted: ") + e.what());
    }
}

RetrievalResult RetrievalCache::fetch(const std::string& url, const std::string& filename, RetrievalKind kind,
                                      bool fallback, const std::string& logstr, const RequestOptions& request) {
    std::string label = logstr;
    if (label.empty()) {
        label = filename.empty() ? filename_from_url(url) : filename;
    }

    if (policy_.use_saved) {
        std::string path = CacheKey::path(policy_.saved_dir, url, filename);
        Logger::get_instance().log_retrieval("saved", label, url, path);
        return load_local(path, kind, RetrievalSource::Saved);
    }

    try {
        return from_network(url, filename, kind, label, request);
    } catch (const NetworkError& e) {
        if (!fallback) {
            throw;
        }
        return from_fallback(e, url, filename, kind, label);
    } catch (const DecodeError& e) {
        if (!fallback) {
            throw;
        }
        return from_fallback(e, url, filename, kind, label);
    }
}

std::string RetrievalCache::retrieve_file(const std::string& url, const std::string& filename,
                                          const std::string& logstr, bool fallback) {
    return fetch(url, filename, RetrievalKind::File, fallback, logstr).path;
}

std::string RetrievalCache::retrieve_text(const std::string& url, const std::string& filename,
                                          const std::string& logstr, bool fallback) {
    return fetch(url, filename, RetrievalKind::Text, fallback, logstr).text;
}

nlohmann::json RetrievalCache::retrieve_json(const std::string& url, const std::string& filename,
                                             const std::string& logstr, bool fallback) {
    return fetch(url, filename, RetrievalKind::Json, fallback, logstr).json;
}

YAML::Node RetrievalCache::retrieve_yaml(const std::string& url, const std::string& filename,
                                         const std::string& logstr, bool fallback) {
    return fetch(url, filename, RetrievalKind::Yaml, fallback, logstr).yaml;
}

} // namespace tabfetch
