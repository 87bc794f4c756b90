#include "directory/ldap_connection.hpp"
#include "core/utils.hpp"

#include <ldap.h>
#include <openssl/crypto.h>
#include <sasl/sasl.h>
#include <sys/time.h>

#include <cstring>
#include <format>

namespace dirauth {

namespace {

struct MessageDeleter {
    void operator()(LDAPMessage* msg) const { if (msg) ldap_msgfree(msg); }
};
using MessagePtr = std::unique_ptr<LDAPMessage, MessageDeleter>;

struct SaslDefaults {
    std::string authcid;
    std::string password;
    std::string realm;
};

int sasl_interact(LDAP* ld, unsigned /*flags*/, void* defaults, void* in) {
    if (ld == nullptr || defaults == nullptr) return LDAP_PARAM_ERROR;

    const auto* d = static_cast<const SaslDefaults*>(defaults);
    for (auto* interact = static_cast<sasl_interact_t*>(in);
         interact->id != SASL_CB_LIST_END; ++interact) {
        const std::string* value = nullptr;
        switch (interact->id) {
            case SASL_CB_AUTHNAME: value = &d->authcid; break;
            case SASL_CB_PASS:     value = &d->password; break;
            case SASL_CB_GETREALM: value = d->realm.empty() ? nullptr : &d->realm; break;
            default: break;
        }

        if (value) {
            interact->result = value->c_str();
            interact->len = static_cast<unsigned>(value->size());
        } else {
            // No authorization identity; accept mechanism defaults for the rest
            const char* dflt = interact->defresult ? interact->defresult : "";
            interact->result = dflt;
            interact->len = static_cast<unsigned>(std::strlen(dflt));
        }
    }
    return LDAP_SUCCESS;
}

bool is_transport_error(int rc) {
    switch (rc) {
        case LDAP_SERVER_DOWN:
        case LDAP_CONNECT_ERROR:
        case LDAP_TIMEOUT:
        case LDAP_UNAVAILABLE:
        case LDAP_BUSY:
            return true;
        default:
            return false;
    }
}

timeval to_timeval(std::chrono::seconds s) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(s.count());
    tv.tv_usec = 0;
    return tv;
}

Status set_option(LDAP* ld, int option, const void* value, const char* what) {
    const int rc = ldap_set_option(ld, option, value);
    if (rc != LDAP_OPT_SUCCESS) {
        return Status::error(AuthFailure::TRANSPORT_FAILURE,
            std::format("LDAP: failed to set {}: {}", what, ldap_err2string(rc)));
    }
    return Status::ok();
}

} // anonymous namespace

// ============================================================================
// LdapConnection
// ============================================================================

LdapConnection::LdapConnection(LDAP* ld, std::string uri)
    : ld_(ld), uri_(std::move(uri)) {}

LdapConnection::~LdapConnection() {
    if (ld_) {
        ldap_unbind_ext_s(ld_, nullptr, nullptr);
    }
}

std::string LdapConnection::error_string(int rc) const {
    std::string message = ldap_err2string(rc);
    char* diagnostic = nullptr;
    if (ldap_get_option(ld_, LDAP_OPT_DIAGNOSTIC_MESSAGE, &diagnostic) == LDAP_OPT_SUCCESS &&
        diagnostic != nullptr) {
        if (*diagnostic) {
            message += std::format(" ({})", diagnostic);
        }
        ldap_memfree(diagnostic);
    }
    return message;
}

Status LdapConnection::bind_status(int rc, const std::string& who) const {
    if (rc == LDAP_SUCCESS) {
        return Status::ok();
    }
    if (is_transport_error(rc)) {
        return Status::error(AuthFailure::TRANSPORT_FAILURE,
            std::format("LDAP: cannot reach {} while binding as '{}': {}",
                uri_, who, error_string(rc)));
    }
    return Status::error(AuthFailure::BIND_FAILURE,
        std::format("LDAP: bind as '{}' rejected: {}", who, error_string(rc)));
}

Status LdapConnection::simple_bind(const std::string& dn, const std::string& password) {
    berval cred;
    cred.bv_val = const_cast<char*>(password.c_str());
    cred.bv_len = password.size();

    const int rc = ldap_sasl_bind_s(ld_, dn.c_str(), LDAP_SASL_SIMPLE, &cred,
                                    nullptr, nullptr, nullptr);
    return bind_status(rc, dn);
}

Status LdapConnection::sasl_bind(const std::string& mechanism,
                                 const std::string& authcid,
                                 const std::string& password) {
    SaslDefaults defaults;
    defaults.password = password;

    // "DOMAIN\user" carries the NT domain as the SASL realm
    const auto slash = authcid.find('\\');
    if (slash != std::string::npos) {
        defaults.realm = authcid.substr(0, slash);
        defaults.authcid = authcid.substr(slash + 1);
    } else {
        defaults.authcid = authcid;
    }

    const int rc = ldap_sasl_interactive_bind_s(ld_, nullptr, mechanism.c_str(),
                                                nullptr, nullptr, LDAP_SASL_QUIET,
                                                sasl_interact, &defaults);
    if (!defaults.password.empty()) {
        OPENSSL_cleanse(defaults.password.data(), defaults.password.size());
    }
    return bind_status(rc, authcid);
}

Status LdapConnection::start_tls() {
    const int rc = ldap_start_tls_s(ld_, nullptr, nullptr);
    if (rc != LDAP_SUCCESS) {
        return Status::error(AuthFailure::TRANSPORT_FAILURE,
            std::format("LDAP: StartTLS on {} failed: {}", uri_, error_string(rc)));
    }
    return Status::ok();
}

Result<std::vector<DirectoryEntry>> LdapConnection::search(const SearchRequest& request) {
    using SearchResult = Result<std::vector<DirectoryEntry>>;

    std::vector<char*> attrs;
    attrs.reserve(request.attributes.size() + 1);
    for (const auto& attr : request.attributes) {
        attrs.push_back(const_cast<char*>(attr.c_str()));
    }
    attrs.push_back(nullptr);

    timeval tv = to_timeval(request.time_limit);
    LDAPMessage* raw = nullptr;
    const int rc = ldap_search_ext_s(ld_, request.base_dn.c_str(), LDAP_SCOPE_SUBTREE,
                                     request.filter.c_str(), attrs.data(), 0,
                                     nullptr, nullptr, &tv, request.size_limit, &raw);
    MessagePtr result(raw);

    if (rc == LDAP_TIMELIMIT_EXCEEDED || rc == LDAP_TIMEOUT) {
        return SearchResult::error(AuthFailure::DIRECTORY_QUERY_FAILURE,
            std::format("LDAP: search under '{}' timed out after {}s",
                request.base_dn, request.time_limit.count()));
    }
    if (rc == LDAP_SERVER_DOWN || rc == LDAP_CONNECT_ERROR) {
        return SearchResult::error(AuthFailure::TRANSPORT_FAILURE,
            std::format("LDAP: connection to {} lost during search: {}", uri_, error_string(rc)));
    }
    if (rc == LDAP_NO_SUCH_OBJECT) {
        return SearchResult::ok({});
    }
    // The size limit is reported as an error even though the entries arrived
    if (rc != LDAP_SUCCESS && rc != LDAP_SIZELIMIT_EXCEEDED) {
        return SearchResult::error(AuthFailure::DIRECTORY_QUERY_FAILURE,
            std::format("LDAP: search under '{}' failed: {}", request.base_dn, error_string(rc)));
    }

    std::vector<DirectoryEntry> entries;
    for (LDAPMessage* msg = ldap_first_entry(ld_, result.get()); msg != nullptr;
         msg = ldap_next_entry(ld_, msg)) {
        DirectoryEntry entry;

        if (char* dn = ldap_get_dn(ld_, msg)) {
            entry.dn = dn;
            ldap_memfree(dn);
        }

        BerElement* ber = nullptr;
        for (char* attr = ldap_first_attribute(ld_, msg, &ber); attr != nullptr;
             attr = ldap_next_attribute(ld_, msg, ber)) {
            if (berval** vals = ldap_get_values_len(ld_, msg, attr)) {
                auto& values = entry.attributes[attr];
                for (int i = 0; vals[i] != nullptr; ++i) {
                    values.emplace_back(vals[i]->bv_val, vals[i]->bv_len);
                }
                ldap_value_free_len(vals);
            }
            ldap_memfree(attr);
        }
        if (ber) {
            ber_free(ber, 0);
        }

        entries.push_back(std::move(entry));
    }

    return SearchResult::ok(std::move(entries));
}

// ============================================================================
// LdapConnector
// ============================================================================

Result<std::unique_ptr<IDirectoryConnection>> LdapConnector::connect(
    const TransportOptions& options) {
    using ConnectResult = Result<std::unique_ptr<IDirectoryConnection>>;

    LDAP* ld = nullptr;
    const int rc = ldap_initialize(&ld, options.uri.c_str());
    if (rc != LDAP_SUCCESS) {
        return ConnectResult::error(AuthFailure::TRANSPORT_FAILURE,
            std::format("LDAP: failed to initialize {}: {}", options.uri, ldap_err2string(rc)));
    }

    // Owns the handle from here; unbinds on any early return
    auto conn = std::make_unique<LdapConnection>(ld, options.uri);

    const int version = LDAP_VERSION3;
    const timeval tv = to_timeval(options.timeout);

    Status st = set_option(ld, LDAP_OPT_PROTOCOL_VERSION, &version, "protocol version");
    if (st.is_ok()) st = set_option(ld, LDAP_OPT_REFERRALS, LDAP_OPT_OFF, "referrals");
    if (st.is_ok()) st = set_option(ld, LDAP_OPT_NETWORK_TIMEOUT, &tv, "network timeout");
    if (st.is_ok()) st = set_option(ld, LDAP_OPT_TIMEOUT, &tv, "operation timeout");

    if (st.is_ok() && options.encryption != EncryptionMode::NONE) {
        const int require_cert = options.validate_certificates
            ? LDAP_OPT_X_TLS_DEMAND
            : LDAP_OPT_X_TLS_NEVER;
        st = set_option(ld, LDAP_OPT_X_TLS_REQUIRE_CERT, &require_cert, "certificate policy");

        // Rebuild the handle's TLS context so the policy applies to it
        const int is_server = 0;
        if (st.is_ok()) st = set_option(ld, LDAP_OPT_X_TLS_NEWCTX, &is_server, "TLS context");
    }

    if (st.is_error()) {
        return st.as_result<std::unique_ptr<IDirectoryConnection>>();
    }

    if (!options.validate_certificates && options.encryption != EncryptionMode::NONE) {
        utils::log::warn(std::format(
            "LDAP: certificate validation disabled for {}", options.uri));
    }

    return ConnectResult::ok(std::move(conn));
}

} // namespace dirauth
