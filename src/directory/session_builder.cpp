#include "directory/session_builder.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "directory/ldap_escape.hpp"

#include <format>
#include <stdexcept>

namespace dirauth {

namespace {

std::shared_ptr<const DirectoryConfig> validated(std::shared_ptr<const DirectoryConfig> config) {
    if (!config) {
        throw std::invalid_argument("SessionBuilder: directory config is null");
    }
    const auto errors = ConfigLoader::validate_directory(*config);
    if (!errors.empty()) {
        throw std::invalid_argument(
            std::format("Invalid directory config: {}", utils::join(errors, "; ")));
    }
    return config;
}

} // anonymous namespace

// ============================================================================
// BindStrategy
// ============================================================================

BindStrategy BindStrategy::resolve(const DirectoryConfig& config) {
    BindStrategy strategy;

    if (config.active_directory) {
        strategy.mechanism = ActiveDirectoryBind{};
    } else {
        strategy.mechanism = StandardBind{config.username_attribute, config.base_dn};
    }

    if (config.bind_as_service_account) {
        if (!config.bind_username || !config.bind_password) {
            throw std::invalid_argument(
                "Service-account bind requires bind_username and bind_password");
        }
        strategy.credentials = ServiceAccountCredentials{*config.bind_username, *config.bind_password};
    } else {
        strategy.credentials = EndUserCredentials{};
    }
    return strategy;
}

std::string BindStrategy::describe() const {
    return std::format("{} bind as {}",
        is_active_directory() ? "active-directory" : "standard",
        uses_service_account() ? "service account" : "end user");
}

TransportOptions make_transport_options(const DirectoryConfig& config) {
    TransportOptions options;
    options.encryption = config.encryption;
    options.validate_certificates = config.validate_certificates;
    options.timeout = config.timeout;

    const char* scheme = (config.encryption == EncryptionMode::LDAPS) ? "ldaps" : "ldap";
    // IPv6 literals need brackets inside a URI
    const bool ipv6 = !config.server.empty() &&
                      config.server.find(':') != std::string::npos &&
                      config.server.front() != '[';
    options.uri = ipv6
        ? std::format("{}://[{}]:{}", scheme, config.server, config.port)
        : std::format("{}://{}:{}", scheme, config.server, config.port);
    return options;
}

// ============================================================================
// SessionBuilder
// ============================================================================

SessionBuilder::SessionBuilder(std::shared_ptr<const DirectoryConfig> config,
                               std::shared_ptr<IDirectoryConnector> connector)
    : config_(validated(std::move(config))),
      connector_(std::move(connector)),
      strategy_(BindStrategy::resolve(*config_)),
      transport_(make_transport_options(*config_)) {
    if (!connector_) {
        throw std::invalid_argument("SessionBuilder: directory connector is null");
    }
}

Status SessionBuilder::bind(IDirectoryConnection& conn, const AuthnRequest& request) const {
    const auto* service = std::get_if<ServiceAccountCredentials>(&strategy_.credentials);
    const std::string& user = service ? service->username : request.username;
    const std::string& password = service ? service->password : request.password;

    // An empty password turns a simple bind into an unauthenticated one
    if (user.empty() || password.empty()) {
        return Status::error(AuthFailure::BIND_FAILURE,
            std::format("LDAP: refusing bind with empty {}",
                user.empty() ? "username" : "password"));
    }

    if (const auto* standard = std::get_if<StandardBind>(&strategy_.mechanism)) {
        const std::string dn = std::format("{}={},{}",
            standard->username_attribute, ldap_escape::dn_value(user), standard->base_dn);
        return conn.simple_bind(dn, password);
    }

    return conn.sasl_bind(std::string(kActiveDirectoryBindMechanism), user, password);
}

Result<std::unique_ptr<IDirectoryConnection>> SessionBuilder::open(
    const AuthnRequest& request) const {
    using OpenResult = Result<std::unique_ptr<IDirectoryConnection>>;

    utils::log::debug(std::format("LDAP: connecting to {} ({}, encryption={}, timeout={}s)",
        transport_.uri, strategy_.describe(),
        encryption_mode_name(transport_.encryption), transport_.timeout.count()));

    auto connected = connector_->connect(transport_);
    if (connected.is_error()) {
        utils::log::warn(std::format("Transport failure: {}", connected.error_message()));
        return connected;
    }
    std::unique_ptr<IDirectoryConnection> conn = std::move(connected.value());

    const utils::Timer timer;
    const Status bound = bind(*conn, request);
    if (bound.is_error()) {
        if (bound.failure() == AuthFailure::TRANSPORT_FAILURE) {
            utils::log::warn(std::format("Transport failure: {}", bound.error_message()));
        } else {
            utils::log::error(std::format("Bind failed: {}", bound.error_message()));
        }
        return bound.as_result<std::unique_ptr<IDirectoryConnection>>();
    }
    utils::log::debug(std::format("LDAP: bound to {} in {}ms",
        conn->describe(), timer.elapsed_ms().count()));

    // Upgrade happens after the bind; see class comment
    if (transport_.encryption == EncryptionMode::STARTTLS) {
        const Status upgraded = conn->start_tls();
        if (upgraded.is_error()) {
            utils::log::warn(std::format("Transport failure: {}", upgraded.error_message()));
            return upgraded.as_result<std::unique_ptr<IDirectoryConnection>>();
        }
    }

    return OpenResult::ok(std::move(conn));
}

Status SessionBuilder::rebind(IDirectoryConnection& conn,
                              const std::string& dn,
                              const std::string& password) const {
    if (dn.empty() || password.empty()) {
        return Status::error(AuthFailure::BIND_FAILURE,
            std::format("LDAP: refusing re-bind with empty {}", dn.empty() ? "DN" : "password"));
    }
    return conn.simple_bind(dn, password);
}

} // namespace dirauth
