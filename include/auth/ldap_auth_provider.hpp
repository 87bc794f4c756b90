#pragma once

#include "auth/credential_store.hpp"
#include "auth/decision_engine.hpp"
#include "auth/iauth_provider.hpp"
#include "config/config_types.hpp"
#include "directory/idirectory_connection.hpp"

#include <memory>
#include <string>

namespace dirauth {

inline constexpr std::string_view kLdapProviderType = "ldap";

/**
 * @brief LDAP / Active Directory authentication provider
 *
 * Wires a SessionBuilder and DecisionEngine from the provider config and
 * resolves finished logins against the host's credential store.
 */
class LdapAuthProvider : public IAuthProvider {
public:
    /**
     * @throws std::invalid_argument when the directory config is invalid
     */
    LdapAuthProvider(ProviderConfig config,
                     std::shared_ptr<ICredentialStore> store,
                     std::shared_ptr<IDirectoryConnector> connector);

    [[nodiscard]] std::string type() const override { return std::string(kLdapProviderType); }
    [[nodiscard]] std::string id() const override { return id_; }
    [[nodiscard]] std::string title() const override { return title_; }

    [[nodiscard]] std::unique_ptr<LoginFlow> create_login_flow() const override;

    [[nodiscard]] Result<DirectoryIdentity> validate_login(
        const std::string& username,
        const std::string& password) const override;

    [[nodiscard]] Result<Credential> find_or_create_credential(
        const std::map<std::string, std::string>& flow_data) override;

    [[nodiscard]] UserMeta user_meta_for_credential(const Credential& credential) const override;

private:
    std::string id_;
    std::string title_;
    std::shared_ptr<const DecisionEngine> engine_;
    std::shared_ptr<CredentialResolver> resolver_;
};

} // namespace dirauth
