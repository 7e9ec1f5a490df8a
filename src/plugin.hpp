#pragma once
#include "provider.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <nlohmann/json.hpp>

namespace switchyard {

// Builds a provider from its config block (the object under
// models.<model>.providers.<name>)
using ProviderFactory = std::function<std::unique_ptr<Provider>(const nlohmann::json& config)>;

// Central registry for self-registering provider types.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_provider(const std::string& type, ProviderFactory factory);

    // Throws Error(Config) for an unknown type
    std::unique_ptr<Provider> create_provider(const std::string& type,
                                              const nlohmann::json& config) const;

    std::vector<std::string> provider_names() const;
    bool has_provider(const std::string& type) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderFactory> providers_;
};

// Self-registrar helper (used at file scope in each provider .cpp)
struct ProviderRegistrar {
    ProviderRegistrar(const std::string& type, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(type, std::move(factory));
    }
};

} // namespace switchyard
