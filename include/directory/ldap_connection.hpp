#pragma once

#include "directory/idirectory_connection.hpp"

#include <memory>
#include <string>

struct ldap;   // OpenLDAP session handle (LDAP)

namespace dirauth {

/**
 * @brief Directory connection backed by OpenLDAP's libldap
 *
 * Requests are synchronous and bounded by the configured timeout. The
 * handle is unbound and released on destruction.
 */
class LdapConnection : public IDirectoryConnection {
public:
    LdapConnection(struct ldap* ld, std::string uri);
    ~LdapConnection() override;

    LdapConnection(const LdapConnection&) = delete;
    LdapConnection& operator=(const LdapConnection&) = delete;

    [[nodiscard]] Status simple_bind(const std::string& dn, const std::string& password) override;

    [[nodiscard]] Status sasl_bind(const std::string& mechanism,
                                   const std::string& authcid,
                                   const std::string& password) override;

    [[nodiscard]] Status start_tls() override;

    [[nodiscard]] Result<std::vector<DirectoryEntry>> search(const SearchRequest& request) override;

    [[nodiscard]] std::string describe() const override { return uri_; }

private:
    [[nodiscard]] Status bind_status(int rc, const std::string& who) const;
    [[nodiscard]] std::string error_string(int rc) const;

    struct ldap* ld_;
    std::string uri_;
};

/**
 * @brief Creates LdapConnection instances; stateless, safe to share
 */
class LdapConnector : public IDirectoryConnector {
public:
    [[nodiscard]] Result<std::unique_ptr<IDirectoryConnection>> connect(
        const TransportOptions& options) override;
};

} // namespace dirauth
