#pragma once

#include "core/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dirauth {

/**
 * @brief Host-owned credential storage
 *
 * Implemented by the host application. This library only reads the
 * credentials issued for its provider and asks for new ones; it never
 * stores passwords through this interface.
 */
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;

    [[nodiscard]] virtual std::vector<Credential> credentials(
        const std::string& provider_type,
        const std::string& provider_id) const = 0;

    [[nodiscard]] virtual Credential create_credential(
        const std::string& provider_type,
        const std::string& provider_id,
        std::map<std::string, std::string> data) = 0;
};

/**
 * @brief Maps a completed login to the host's credential record
 */
class CredentialResolver {
public:
    CredentialResolver(std::shared_ptr<ICredentialStore> store,
                       std::string provider_type,
                       std::string provider_id);

    /**
     * @brief Existing credential with this exact username, or a new one
     *
     * Serialized so two concurrent first logins create one record.
     */
    [[nodiscard]] Credential find_or_create(const std::string& username);

    // Profile data for the host when it creates the user on first login
    [[nodiscard]] static UserMeta user_meta(const Credential& credential);

private:
    std::shared_ptr<ICredentialStore> store_;
    std::string provider_type_;
    std::string provider_id_;
    std::mutex mutex_;
};

} // namespace dirauth
