/**
 * @file client_registry.hpp
 * @brief Named HttpClient instances built from a base configuration
 *
 * A registry holds one "default" client plus one client per custom
 * configuration, so code that talks to several services can look up the
 * client for each by name.
 */

#ifndef TABFETCH_API_CLIENT_REGISTRY_HPP
#define TABFETCH_API_CLIENT_REGISTRY_HPP

#include "api/http_client.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tabfetch {

/**
 * @brief Registry of named clients
 *
 * Usage Example:
 *   @code
 *   ClientRegistry registry;
 *   registry.generate(config.client, config.clients);
 *   HttpClient& client = registry.get("census");
 *   @endcode
 */
class ClientRegistry {
public:
    static constexpr const char* kDefaultName = "default";

    /**
     * @brief Builds a client from its configuration
     */
    using Factory = std::function<std::unique_ptr<HttpClient>(const ClientConfig&)>;

    /**
     * @param factory Client constructor; defaults to HttpClient over libcurl
     */
    explicit ClientRegistry(Factory factory = Factory());

    /**
     * @brief Replace the registered clients
     *
     * Builds the default client from base and one client per entry of
     * custom. The previous clients are kept if any construction fails.
     *
     * @throws ConfigurationError if a custom entry is named "default" or a
     *         client configuration is invalid
     */
    void generate(const ClientConfig& base, const std::map<std::string, ClientConfig>& custom = {});

    /**
     * @brief Client registered under name, or the default client
     *
     * An empty or unknown name returns the default client.
     *
     * @throws StateError if generate has not been called
     */
    HttpClient& get(const std::string& name = "") const;

    bool contains(const std::string& name) const;

    std::vector<std::string> names() const;

    /** Closes and drops every client */
    void clear();

private:
    Factory factory_;
    std::map<std::string, std::unique_ptr<HttpClient>> clients_;
};

} // namespace tabfetch

#endif // TABFETCH_API_CLIENT_REGISTRY_HPP
