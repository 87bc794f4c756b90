#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "directory/idirectory_connection.hpp"

#include <memory>
#include <string>
#include <variant>

namespace dirauth {

// ============================================================================
// Bind Strategy
// ============================================================================

inline constexpr std::string_view kActiveDirectoryAccountAttribute = "sAMAccountName";
inline constexpr std::string_view kActiveDirectoryBindMechanism = "NTLM";

// Domain-account bind (SASL NTLM) against Active Directory
struct ActiveDirectoryBind {};

// Simple bind as "<username_attribute>=<name>,<base_dn>"
struct StandardBind {
    std::string username_attribute;
    std::string base_dn;
};

using BindMechanism = std::variant<ActiveDirectoryBind, StandardBind>;

struct ServiceAccountCredentials {
    std::string username;
    std::string password;
};

// Bind with whatever the end user typed
struct EndUserCredentials {};

using CredentialSource = std::variant<ServiceAccountCredentials, EndUserCredentials>;

/**
 * @brief How every connection for one DirectoryConfig is bound
 *
 * Resolved once when the builder is constructed.
 */
struct BindStrategy {
    BindMechanism mechanism;
    CredentialSource credentials;

    [[nodiscard]] static BindStrategy resolve(const DirectoryConfig& config);

    [[nodiscard]] bool uses_service_account() const {
        return std::holds_alternative<ServiceAccountCredentials>(credentials);
    }

    [[nodiscard]] bool is_active_directory() const {
        return std::holds_alternative<ActiveDirectoryBind>(mechanism);
    }

    // e.g. "standard bind as service account"
    [[nodiscard]] std::string describe() const;
};

[[nodiscard]] TransportOptions make_transport_options(const DirectoryConfig& config);

// ============================================================================
// SessionBuilder
// ============================================================================

/**
 * @brief Opens a fresh, bound directory connection per authentication attempt
 *
 * Order of operations: connect, bind under the resolved strategy, then (in
 * STARTTLS mode) upgrade the bound connection to TLS. The upgrade follows the
 * bind, so in STARTTLS mode bind credentials cross the wire unencrypted.
 *
 * Thread-safe: holds only immutable state; each open() call is independent.
 */
class SessionBuilder {
public:
    /**
     * @throws std::invalid_argument when the config fails validation
     */
    SessionBuilder(std::shared_ptr<const DirectoryConfig> config,
                   std::shared_ptr<IDirectoryConnector> connector);

    /**
     * @brief Connect and bind for one authentication attempt
     * @param request The end user's credentials; used for the bind only when
     *        the strategy binds as the end user
     * @return The bound connection, or TRANSPORT_FAILURE / BIND_FAILURE
     */
    [[nodiscard]] Result<std::unique_ptr<IDirectoryConnection>> open(
        const AuthnRequest& request) const;

    /**
     * @brief Re-bind an open connection as a specific entry (credential check)
     */
    [[nodiscard]] Status rebind(IDirectoryConnection& conn,
                                const std::string& dn,
                                const std::string& password) const;

    [[nodiscard]] const BindStrategy& strategy() const { return strategy_; }
    [[nodiscard]] const DirectoryConfig& config() const { return *config_; }

private:
    [[nodiscard]] Status bind(IDirectoryConnection& conn, const AuthnRequest& request) const;

    std::shared_ptr<const DirectoryConfig> config_;
    std::shared_ptr<IDirectoryConnector> connector_;
    BindStrategy strategy_;
    TransportOptions transport_;
};

} // namespace dirauth
