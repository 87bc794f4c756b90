#include "auth/provider_registry.hpp"
#include "auth/ldap_auth_provider.hpp"
#include "core/utils.hpp"
#include "directory/ldap_connection.hpp"

#include <format>
#include <stdexcept>

namespace dirauth {

namespace {

std::unique_ptr<IAuthProvider> make_ldap_provider(const ProviderConfig& config,
                                                  const ProviderDeps& deps) {
    std::shared_ptr<IDirectoryConnector> connector = deps.connector
        ? deps.connector
        : std::make_shared<LdapConnector>();
    return std::make_unique<LdapAuthProvider>(config, deps.store, std::move(connector));
}

} // anonymous namespace

ProviderRegistry::ProviderRegistry(
    std::initializer_list<std::pair<const std::string, ProviderFactory>> entries)
    : factories_(entries) {}

ProviderRegistry ProviderRegistry::with_builtin_providers() {
    return ProviderRegistry{
        {std::string(kLdapProviderType), make_ldap_provider},
    };
}

Result<std::unique_ptr<IAuthProvider>> ProviderRegistry::create(
    const ProviderConfig& config,
    const ProviderDeps& deps) const {
    using CreateResult = Result<std::unique_ptr<IAuthProvider>>;

    const auto it = factories_.find(config.type);
    if (it == factories_.end()) {
        return CreateResult::error(AuthFailure::CONFIG_ERROR,
            std::format("Unknown auth provider type '{}'", config.type));
    }

    try {
        auto provider = it->second(config, deps);
        utils::log::info(std::format("Auth provider '{}' ready ({})",
            provider->title(), config.type));
        return CreateResult::ok(std::move(provider));
    } catch (const std::invalid_argument& e) {
        return CreateResult::error(AuthFailure::CONFIG_ERROR,
            std::format("Invalid config for provider '{}': {}", config.type, e.what()));
    }
}

std::vector<std::string> ProviderRegistry::types() const {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [type, factory] : factories_) {
        result.push_back(type);
    }
    return result;
}

} // namespace dirauth
