#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dirauth {

/**
 * @brief Everything the transport needs to open a connection
 *
 * Built once per DirectoryConfig by the SessionBuilder.
 */
struct TransportOptions {
    std::string uri;                            // ldap://host:port or ldaps://host:port
    EncryptionMode encryption = EncryptionMode::LDAPS;
    bool validate_certificates = true;
    std::chrono::seconds timeout{10};
};

struct SearchRequest {
    std::string base_dn;
    std::string filter;
    std::vector<std::string> attributes;
    int size_limit = 1;
    std::chrono::seconds time_limit{10};
};

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return utils::to_lower(a) < utils::to_lower(b);
    }
};

/**
 * @brief One entry returned by a directory search
 */
struct DirectoryEntry {
    std::string dn;
    std::map<std::string, std::vector<std::string>, CaseInsensitiveLess> attributes;

    [[nodiscard]] const std::vector<std::string>* values(const std::string& name) const {
        const auto it = attributes.find(name);
        return it != attributes.end() ? &it->second : nullptr;
    }

    [[nodiscard]] std::string first_value(const std::string& name) const {
        const auto* v = values(name);
        return (v && !v->empty()) ? v->front() : std::string{};
    }
};

/**
 * @brief An open connection to a directory server
 *
 * Owned by a single authentication attempt. Closing (unbind) happens on
 * destruction.
 */
class IDirectoryConnection {
public:
    virtual ~IDirectoryConnection() = default;

    /**
     * @brief LDAP simple bind
     * @return BIND_FAILURE when the server rejects the credentials,
     *         TRANSPORT_FAILURE when the server cannot be reached
     */
    [[nodiscard]] virtual Status simple_bind(const std::string& dn,
                                             const std::string& password) = 0;

    /**
     * @brief SASL bind using a domain-account mechanism (e.g. NTLM)
     * @param authcid Account name, optionally prefixed "DOMAIN\"
     */
    [[nodiscard]] virtual Status sasl_bind(const std::string& mechanism,
                                           const std::string& authcid,
                                           const std::string& password) = 0;

    /**
     * @brief Upgrade the open connection to TLS (StartTLS extended operation)
     */
    [[nodiscard]] virtual Status start_tls() = 0;

    [[nodiscard]] virtual Result<std::vector<DirectoryEntry>> search(const SearchRequest& request) = 0;

    // Short target description for diagnostics
    [[nodiscard]] virtual std::string describe() const = 0;
};

/**
 * @brief Opens connections from transport options
 */
class IDirectoryConnector {
public:
    virtual ~IDirectoryConnector() = default;

    [[nodiscard]] virtual Result<std::unique_ptr<IDirectoryConnection>> connect(
        const TransportOptions& options) = 0;
};

} // namespace dirauth
