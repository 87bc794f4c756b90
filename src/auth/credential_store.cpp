#include "auth/credential_store.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace dirauth {

CredentialResolver::CredentialResolver(std::shared_ptr<ICredentialStore> store,
                                       std::string provider_type,
                                       std::string provider_id)
    : store_(std::move(store)),
      provider_type_(std::move(provider_type)),
      provider_id_(std::move(provider_id)) {
    if (!store_) {
        throw std::invalid_argument("CredentialResolver: credential store is null");
    }
}

Credential CredentialResolver::find_or_create(const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& credential : store_->credentials(provider_type_, provider_id_)) {
        const auto it = credential.data.find("username");
        if (it != credential.data.end() && it->second == username) {
            credential.is_new = false;
            return credential;
        }
    }

    utils::log::info(std::format("Creating credentials for {} ({})", username, provider_type_));
    Credential created = store_->create_credential(provider_type_, provider_id_,
                                                   {{"username", username}});
    created.is_new = true;
    return created;
}

UserMeta CredentialResolver::user_meta(const Credential& credential) {
    UserMeta meta;
    const auto it = credential.data.find("username");
    meta.name = (it != credential.data.end()) ? it->second : std::string{};
    meta.is_active = true;
    return meta;
}

} // namespace dirauth
