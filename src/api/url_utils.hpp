/**
 * @file url_utils.hpp
 * @brief URL splitting, query encoding and file name derivation
 */

#ifndef TABFETCH_API_URL_UTILS_HPP
#define TABFETCH_API_URL_UTILS_HPP

#include "api/types.hpp"
#include <optional>
#include <string>
#include <utility>

namespace tabfetch {

/**
 * @brief Components of scheme://authority/path?query#fragment
 */
struct UrlParts {
    std::string scheme;
    std::string authority;
    std::string path;
    std::string query;
    std::string fragment;
};

UrlParts split_url(const std::string& url);
std::string join_url(const UrlParts& parts);

/**
 * @brief Form-style percent encoding (space becomes '+')
 */
std::string url_encode(const std::string& value);

/**
 * @brief Inverse of url_encode; '+' decodes to space
 */
std::string url_decode(const std::string& value);

/**
 * @brief Parse a query string into ordered pairs, dropping empty keys
 */
QueryParams parse_query(const std::string& query);
std::string encode_query(const QueryParams& params);

/**
 * @brief Full URL for a GET request
 *
 * Parameters already in the URL query come first; `params` override
 * matching keys in place and append new ones.
 */
std::string url_for_get(const std::string& url, const QueryParams& params = {});

/**
 * @brief URL with its query stripped, plus the merged parameters for a POST body
 */
std::pair<std::string, QueryParams> url_params_for_post(const std::string& url,
                                                        const QueryParams& params = {});

/**
 * @brief True if the URL starts with an RFC 3986 scheme followed by ':'
 *
 * A single letter followed by ':' is treated as a Windows drive, not a scheme.
 */
bool has_scheme(const std::string& url);

/**
 * @brief Local path named by a file: URL, std::nullopt for any other URL
 *
 * Only an empty or "localhost" authority names a local file.
 */
std::optional<std::string> file_url_path(const std::string& url);

/**
 * @brief File name for a URL
 *
 * The last path segment; failing that a slug of the query; failing that the
 * second last path segment.
 */
std::string filename_from_url(const std::string& url);

/**
 * @brief Lowercase slug: runs of non-alphanumeric characters become one '-'
 */
std::string slugify(const std::string& value);

/**
 * @brief Shorten a URL for log output, appending "..." when cut
 */
std::string truncate_for_log(const std::string& url, std::size_t max_length = 100);

} // namespace tabfetch

#endif // TABFETCH_API_URL_UTILS_HPP
