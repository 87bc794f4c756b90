#include "auth/decision_engine.hpp"
#include "core/utils.hpp"
#include "directory/ldap_escape.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace dirauth {

namespace {

// "DOMAIN\user" is searched as "user" in AD mode
std::string account_name(const std::string& username, bool active_directory) {
    if (!active_directory) return username;
    const auto slash = username.find('\\');
    return slash == std::string::npos ? username : username.substr(slash + 1);
}

} // anonymous namespace

DecisionEngine::DecisionEngine(std::shared_ptr<const SessionBuilder> sessions)
    : sessions_(std::move(sessions)) {
    if (!sessions_) {
        throw std::invalid_argument("DecisionEngine: session builder is null");
    }
    username_attribute_ = sessions_->strategy().is_active_directory()
        ? std::string(kActiveDirectoryAccountAttribute)
        : sessions_->config().username_attribute;
}

SearchRequest DecisionEngine::build_search(const AuthnRequest& request) const {
    const auto& config = sessions_->config();

    SearchRequest search;
    search.base_dn = config.base_dn;
    search.filter = std::format("(&(objectclass={})({}={}))",
        kPersonObjectClass, username_attribute_,
        ldap_escape::filter_value(account_name(request.username, config.active_directory)));
    search.attributes = {
        username_attribute_,
        std::string(kDisplayNameAttribute),
        std::string(kGroupMembershipAttribute),
    };
    search.size_limit = 1;
    search.time_limit = config.timeout;
    return search;
}

bool DecisionEngine::is_member_of_any(const std::vector<std::string>& allowed,
                                      const std::vector<std::string>& groups) {
    if (allowed.empty()) return true;

    return std::any_of(allowed.begin(), allowed.end(), [&](const std::string& group) {
        return std::any_of(groups.begin(), groups.end(), [&](const std::string& g) {
            return utils::iequals(group, g);
        });
    });
}

Result<DirectoryIdentity> DecisionEngine::decide(const AuthnRequest& request) const {
    using DecideResult = Result<DirectoryIdentity>;
    const auto& config = sessions_->config();

    // Connect and bind (service account or end user)
    auto opened = sessions_->open(request);
    if (opened.is_error()) {
        if (opened.failure() == AuthFailure::BIND_FAILURE) {
            return DecideResult::error(AuthFailure::INVALID_CREDENTIALS,
                std::format("Invalid LDAP credentials provided: {}", opened.error_message()));
        }
        return DecideResult::error(opened.failure(), opened.error_message());
    }
    auto& conn = *opened.value();

    // Look up the person entry
    const SearchRequest search = build_search(request);
    utils::log::debug(std::format("LDAP: searching '{}' with {}", search.base_dn, search.filter));

    auto found = conn.search(search);
    if (found.is_error()) {
        utils::log::error(std::format("LDAP self search failed: {}", found.error_message()));
        return DecideResult::error(found.failure(), found.error_message());
    }
    if (found.value().empty()) {
        utils::log::error("LDAP self search returned no results.");
        return DecideResult::error(AuthFailure::DIRECTORY_QUERY_FAILURE,
            std::format("No person entry found for '{}'", request.username));
    }
    const DirectoryEntry& entry = found.value().front();

    DirectoryIdentity identity;
    identity.username = entry.first_value(username_attribute_);
    identity.display_name = entry.first_value(std::string(kDisplayNameAttribute));
    if (const auto* groups = entry.values(std::string(kGroupMembershipAttribute))) {
        identity.groups = *groups;
    }

    if (identity.username.empty()) {
        utils::log::error(std::format("LDAP entry '{}' has no {} attribute",
            entry.dn, username_attribute_));
        return DecideResult::error(AuthFailure::DIRECTORY_QUERY_FAILURE,
            std::format("Entry '{}' has no {} attribute", entry.dn, username_attribute_));
    }
    utils::log::info(std::format("Found user {} ({})", identity.display_name, identity.username));

    // Group allow-list
    if (!config.allowed_group_dns.empty()) {
        utils::log::debug(std::format(
            "Checking if user is a member of any of the following groups: {}",
            utils::join(config.allowed_group_dns, "; ")));
        utils::log::info(std::format("User {} is member of {}",
            identity.username, utils::join(identity.groups, "; ")));

        if (!is_member_of_any(config.allowed_group_dns, identity.groups)) {
            auto message = std::format(
                "User {} is not a member of any of the required groups", identity.username);
            utils::log::warn(message);
            return DecideResult::error(AuthFailure::GROUP_MEMBERSHIP_DENIED, std::move(message));
        }
    }

    // The service-account bind proved nothing about the end user
    if (sessions_->strategy().uses_service_account()) {
        const Status rebound = sessions_->rebind(conn, entry.dn, request.password);
        if (rebound.is_error()) {
            utils::log::error(std::format("Error in bind: {}", rebound.error_message()));
            if (rebound.failure() == AuthFailure::TRANSPORT_FAILURE) {
                return rebound.as_result<DirectoryIdentity>();
            }
            return DecideResult::error(AuthFailure::INVALID_CREDENTIALS,
                "Invalid LDAP credentials provided");
        }
    }

    return DecideResult::ok(std::move(identity));
}

std::future<Result<DirectoryIdentity>> DecisionEngine::decide_async(AuthnRequest request) const {
    return std::async(std::launch::async,
        [engine = *this, request = std::move(request)]() {
            return engine.decide(request);
        });
}

} // namespace dirauth
