#pragma once

#include "auth/login_flow.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <map>
#include <memory>
#include <string>

namespace dirauth {

/**
 * @brief Interface for authentication providers
 *
 * A provider owns a login flow and maps finished logins to host
 * credentials. Providers are created through ProviderRegistry.
 */
class IAuthProvider {
public:
    virtual ~IAuthProvider() = default;

    // Registry tag, e.g. "ldap"
    [[nodiscard]] virtual std::string type() const = 0;

    // Distinguishes several providers of the same type (may be empty)
    [[nodiscard]] virtual std::string id() const = 0;

    // Human-readable name shown on the login page
    [[nodiscard]] virtual std::string title() const = 0;

    [[nodiscard]] virtual std::unique_ptr<LoginFlow> create_login_flow() const = 0;

    /**
     * @brief Check a username/password pair without running a flow
     */
    [[nodiscard]] virtual Result<DirectoryIdentity> validate_login(
        const std::string& username,
        const std::string& password) const = 0;

    /**
     * @brief Credential for the data of a finished login flow
     * @param flow_data The CREATE_ENTRY payload; must hold "username"
     */
    [[nodiscard]] virtual Result<Credential> find_or_create_credential(
        const std::map<std::string, std::string>& flow_data) = 0;

    [[nodiscard]] virtual UserMeta user_meta_for_credential(const Credential& credential) const = 0;
};

} // namespace dirauth
