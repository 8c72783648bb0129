/**
 * @file retrieval_cache.hpp
 * @brief Saved-copy, network and fallback policy around HttpClient
 */

#ifndef TABFETCH_CACHE_RETRIEVAL_CACHE_HPP
#define TABFETCH_CACHE_RETRIEVAL_CACHE_HPP

#include "api/http_client.hpp"
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace tabfetch {

enum class RetrievalKind {
    File,
    Text,
    Json,
    Yaml
};

enum class RetrievalSource {
    Network,
    Saved,
    Fallback
};

std::string kind_to_string(RetrievalKind kind);
std::string source_to_string(RetrievalSource source);

/**
 * @throws ConfigurationError for anything but file, text, json or yaml
 */
RetrievalKind string_to_kind(const std::string& name);

/**
 * @brief Where retrieved artifacts live and how they are reused
 */
struct RetrievalPolicy {
    std::string fallback_dir;    ///< Static copies used when the network fails
    std::string saved_dir;       ///< Copies written with save, read with use_saved
    std::string temp_dir;        ///< Empty uses temp_root()
    bool save = false;
    bool use_saved = false;
};

/**
 * @brief Outcome of one fetch
 *
 * `path` is the file holding the bytes. Only the member matching `kind` is
 * filled among text, json and yaml.
 */
struct RetrievalResult {
    RetrievalKind kind = RetrievalKind::File;
    RetrievalSource source = RetrievalSource::Network;
    std::string path;
    std::string text;
    nlohmann::json json;
    YAML::Node yaml;
};

/**
 * @brief Retrieve artifacts through one HttpClient
 *
 * With use_saved, artifacts come only from saved_dir and the network is never
 * touched. Otherwise the network is tried once (one retry sequence); on
 * success the raw bytes go to saved_dir when saving, else to temp_dir. A
 * failed download can fall back to a passive read from fallback_dir; if that
 * also fails the original error is rethrown with a note.
 */
class RetrievalCache {
public:
    /**
     * @throws ConfigurationError if save and use_saved are both set, or a
     *         required directory is empty
     */
    RetrievalCache(HttpClient& client, RetrievalPolicy policy);

    /**
     * @param filename Empty derives the name from the URL
     * @param logstr Label for log lines; defaults to the file name
     * @throws CacheMissError with use_saved when no saved copy exists
     * @throws NetworkError or DecodeError when the download fails and no
     *         fallback could be used
     */
    RetrievalResult fetch(const std::string& url, const std::string& filename = "",
                          RetrievalKind kind = RetrievalKind::File, bool fallback = false,
                          const std::string& logstr = "", const RequestOptions& request = RequestOptions());

    /** @return Path of the retrieved file */
    std::string retrieve_file(const std::string& url, const std::string& filename = "",
                              const std::string& logstr = "", bool fallback = false);
    std::string retrieve_text(const std::string& url, const std::string& filename = "",
                              const std::string& logstr = "", bool fallback = false);
    nlohmann::json retrieve_json(const std::string& url, const std::string& filename = "",
                                 const std::string& logstr = "", bool fallback = false);
    YAML::Node retrieve_yaml(const std::string& url, const std::string& filename = "",
                             const std::string& logstr = "", bool fallback = false);

    const RetrievalPolicy& policy() const { return policy_; }

private:
    HttpClient& client_;
    RetrievalPolicy policy_;

    RetrievalResult from_network(const std::string& url, const std::string& filename,
                                 RetrievalKind kind, const std::string& logstr,
                                 const RequestOptions& request);

    template <typename Error>
    RetrievalResult from_fallback(const Error& original, const std::string& url,
                                  const std::string& filename, RetrievalKind kind,
                                  const std::string& logstr);

    static RetrievalResult load_local(const std::string& path, RetrievalKind kind, RetrievalSource source);
    static void decode_into(RetrievalResult& result, const std::string& bytes, const std::string& origin);
    static void write_atomic(const std::string& path, const std::string& bytes);
};

} // namespace tabfetch

#endif // TABFETCH_CACHE_RETRIEVAL_CACHE_HPP
