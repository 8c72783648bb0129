#include "api/client_registry.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace tabfetch {

ClientRegistry::ClientRegistry(Factory factory)
    : factory_(std::move(factory))
{
    if (!factory_) {
        factory_ = [](const ClientConfig& config) { return std::make_unique<HttpClient>(config); };
    }
}

void ClientRegistry::generate(const ClientConfig& base, const std::map<std::string, ClientConfig>& custom) {
    if (custom.count(kDefaultName) > 0) {
        throw ConfigurationError(std::string("Custom client name is reserved: ") + kDefaultName);
    }

    std::map<std::string, std::unique_ptr<HttpClient>> built;
    built[kDefaultName] = factory_(base);
    for (const auto& entry : custom) {
        try {
            built[entry.first] = factory_(entry.second);
        } catch (const ConfigurationError& e) {
            throw e.annotated("client " + entry.first);
        }
    }

    clear();
    clients_ = std::move(built);
    Logger::get_instance().log_debug("Generated clients", {{"count", std::to_string(clients_.size())}});
}

HttpClient& ClientRegistry::get(const std::string& name) const {
    auto it = clients_.find(name);
    if (it == clients_.end()) {
        it = clients_.find(kDefaultName);
    }
    if (it == clients_.end()) {
        throw StateError("No clients have been generated");
    }
    return *it->second;
}

bool ClientRegistry::contains(const std::string& name) const {
    return clients_.find(name) != clients_.end();
}

std::vector<std::string> ClientRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(clients_.size());
    for (const auto& pair : clients_) {
        result.push_back(pair.first);
    }
    return result;
}

void ClientRegistry::clear() {
    for (auto& pair : clients_) {
        pair.second->close();
    }
    clients_.clear();
}

} // namespace tabfetch
