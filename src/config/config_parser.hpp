/**
 * @file config_parser.hpp
 * @brief JSON configuration for HttpClient and RetrievalCache
 */

#ifndef TABFETCH_CONFIG_CONFIG_PARSER_HPP
#define TABFETCH_CONFIG_CONFIG_PARSER_HPP

#include "api/http_client.hpp"
#include "cache/retrieval_cache.hpp"
#include <map>
#include <string>

namespace tabfetch {

/**
 * @brief Everything a configuration file can set
 */
struct FetchConfig {
    ClientConfig client;
    /// Named clients from the "clients" object; each entry's keys override the top-level client keys
    std::map<std::string, ClientConfig> clients;
    RetrievalPolicy retrieval;
};

/**
 * @brief Parses a configuration from a JSON file
 *
 * File paths inside the configuration are resolved relative to the
 * directory holding the file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed configuration
 * @throws ConfigurationError if the file cannot be read or the JSON is invalid
 */
FetchConfig parse_fetch_config_from_file(const std::string& file_path);

/**
 * @brief Parses a configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @return Parsed configuration
 * @throws ConfigurationError if the JSON is invalid or keys have the wrong type
 */
FetchConfig parse_fetch_config_from_string(const std::string& json_string);

/**
 * @brief Client part of parse_fetch_config_from_file
 */
ClientConfig parse_client_config_from_file(const std::string& file_path);
ClientConfig parse_client_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to
 * nothing.
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute and empty paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace tabfetch

#endif // TABFETCH_CONFIG_CONFIG_PARSER_HPP
