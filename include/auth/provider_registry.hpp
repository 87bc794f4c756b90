#pragma once

#include "auth/credential_store.hpp"
#include "auth/iauth_provider.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "directory/idirectory_connection.hpp"

#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dirauth {

// Collaborators handed to every provider factory
struct ProviderDeps {
    std::shared_ptr<ICredentialStore> store;
    std::shared_ptr<IDirectoryConnector> connector;   // null = libldap connector
};

using ProviderFactory = std::function<std::unique_ptr<IAuthProvider>(
    const ProviderConfig&, const ProviderDeps&)>;

/**
 * @brief Maps a provider type tag to its constructor
 *
 * Populated from an explicit list at construction; there is no global
 * registration.
 */
class ProviderRegistry {
public:
    ProviderRegistry(std::initializer_list<std::pair<const std::string, ProviderFactory>> entries);

    // Registry holding every provider this library ships ("ldap")
    [[nodiscard]] static ProviderRegistry with_builtin_providers();

    /**
     * @brief Build the provider named by config.type
     * @return CONFIG_ERROR for an unknown type or an invalid config
     */
    [[nodiscard]] Result<std::unique_ptr<IAuthProvider>> create(
        const ProviderConfig& config,
        const ProviderDeps& deps) const;

    [[nodiscard]] bool contains(const std::string& type) const {
        return factories_.contains(type);
    }

    [[nodiscard]] std::vector<std::string> types() const;

private:
    std::map<std::string, ProviderFactory> factories_;
};

} // namespace dirauth
