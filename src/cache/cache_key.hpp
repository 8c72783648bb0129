/**
 * @file cache_key.hpp
 * @brief Deterministic mapping from (root, url, filename) to a file path
 */

#ifndef TABFETCH_CACHE_CACHE_KEY_HPP
#define TABFETCH_CACHE_CACHE_KEY_HPP

#include <cstddef>
#include <string>
#include <utility>

namespace tabfetch {

/**
 * @brief Path derivation for cached artifacts
 *
 * With an explicit filename the path is root/filename. Otherwise the name is
 * derived from the URL alone: its last path segment with the first 8 hex
 * digits of the MD5 of the full URL appended to the stem, so
 * http://a.org/data.csv maps to data_<hash>.csv under every root and in
 * every run. Two URLs sharing a basename never share a file.
 */
class CacheKey {
public:
    static constexpr std::size_t kUrlHashLength = 8;

    /**
     * @brief Path for a URL under root
     */
    static std::string path(const std::string& root, const std::string& url,
                            const std::string& filename = "");

    /**
     * @brief File name for a URL without an explicit filename
     */
    static std::string derived_filename(const std::string& url);

    /**
     * @brief Download path that does not clash with files already on disk
     *
     * `path` is a full file path and excludes `folder` and `filename`. An empty
     * folder means temp_root(). Without overwrite, a counter is appended before
     * the extension until the path is free; with overwrite an existing file is
     * removed.
     *
     * @throws ConfigurationError if path is combined with folder or filename
     */
    static std::string unique_path_for_url(const std::string& url, const std::string& folder = "",
                                           const std::string& filename = "", const std::string& path = "",
                                           bool overwrite = false);

    /**
     * @brief Split a file name into stem and extension ("a.tar.gz" -> "a.tar", ".gz")
     */
    static std::pair<std::string, std::string> split_extension(const std::string& filename);
};

} // namespace tabfetch

#endif // TABFETCH_CACHE_CACHE_KEY_HPP
