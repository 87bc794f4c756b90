#include "auth/ldap_auth_provider.hpp"
#include "directory/session_builder.hpp"

namespace dirauth {

LdapAuthProvider::LdapAuthProvider(ProviderConfig config,
                                   std::shared_ptr<ICredentialStore> store,
                                   std::shared_ptr<IDirectoryConnector> connector)
    : id_(config.id.value_or("")),
      title_(config.name.value_or(std::string(kDefaultProviderTitle))) {
    auto directory = std::make_shared<const DirectoryConfig>(std::move(config.directory));
    auto sessions = std::make_shared<const SessionBuilder>(std::move(directory), std::move(connector));
    engine_ = std::make_shared<const DecisionEngine>(std::move(sessions));
    resolver_ = std::make_shared<CredentialResolver>(
        std::move(store), std::string(kLdapProviderType), id_);
}

std::unique_ptr<LoginFlow> LdapAuthProvider::create_login_flow() const {
    return std::make_unique<LoginFlow>(engine_, title_, resolver_);
}

Result<DirectoryIdentity> LdapAuthProvider::validate_login(
    const std::string& username,
    const std::string& password) const {
    const AuthnRequest request(username, password);
    return engine_->decide(request);
}

Result<Credential> LdapAuthProvider::find_or_create_credential(
    const std::map<std::string, std::string>& flow_data) {
    const auto it = flow_data.find("username");
    if (it == flow_data.end() || it->second.empty()) {
        return Result<Credential>::error(AuthFailure::CONFIG_ERROR,
            "Flow result has no username");
    }
    return Result<Credential>::ok(resolver_->find_or_create(it->second));
}

UserMeta LdapAuthProvider::user_meta_for_credential(const Credential& credential) const {
    return CredentialResolver::user_meta(credential);
}

} // namespace dirauth
