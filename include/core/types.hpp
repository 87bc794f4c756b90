#pragma once

#include <openssl/crypto.h>

#include <map>
#include <string>
#include <vector>

namespace dirauth {

// ============================================================================
// Authentication Request
// ============================================================================

/**
 * @brief Username/password pair as typed by the user
 *
 * Never persisted. The password buffer is wiped on destruction, on
 * discard_password() and in the moved-from object after a move.
 */
struct AuthnRequest {
    std::string username;
    std::string password;

    AuthnRequest() = default;
    AuthnRequest(std::string user, std::string pass)
        : username(std::move(user)), password(std::move(pass)) {
        OPENSSL_cleanse(pass.data(), pass.capacity());
    }

    AuthnRequest(const AuthnRequest&) = default;
    AuthnRequest& operator=(const AuthnRequest&) = default;

    AuthnRequest(AuthnRequest&& other) noexcept
        : username(std::move(other.username)), password(std::move(other.password)) {
        other.discard_password();
    }

    AuthnRequest& operator=(AuthnRequest&& other) noexcept {
        if (this != &other) {
            discard_password();
            username = std::move(other.username);
            password = std::move(other.password);
            other.discard_password();
        }
        return *this;
    }

    ~AuthnRequest() { discard_password(); }

    // Covers capacity(), not size(): a moved-from short string keeps its
    // bytes in the inline buffer
    void discard_password() noexcept {
        OPENSSL_cleanse(password.data(), password.capacity());
        password.clear();
    }
};

// ============================================================================
// Directory Identity
// ============================================================================

struct DirectoryIdentity {
    std::string username;               // canonical account identifier
    std::string display_name;
    std::vector<std::string> groups;    // group DNs claimed by the entry
};

// ============================================================================
// Host-owned records
// ============================================================================

struct Credential {
    std::string id;
    std::string provider_type;
    std::string provider_id;
    std::map<std::string, std::string> data;   // "username" is the lookup key
    bool is_new = false;
};

struct UserMeta {
    std::string name;
    bool is_active = true;
};

} // namespace dirauth
