#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "directory/session_builder.hpp"

#include <future>
#include <memory>
#include <string>
#include <vector>

namespace dirauth {

inline constexpr std::string_view kPersonObjectClass = "person";
inline constexpr std::string_view kDisplayNameAttribute = "displayName";
inline constexpr std::string_view kGroupMembershipAttribute = "memberOf";

/**
 * @brief Decides whether a username/password pair authenticates against the directory
 *
 * Each decide() call opens its own connection, so concurrent calls for
 * different users share nothing but the immutable config.
 */
class DecisionEngine {
public:
    explicit DecisionEngine(std::shared_ptr<const SessionBuilder> sessions);

    /**
     * @brief Authenticate one request
     * @return The identity on success; otherwise INVALID_CREDENTIALS,
     *         GROUP_MEMBERSHIP_DENIED, DIRECTORY_QUERY_FAILURE or
     *         TRANSPORT_FAILURE
     */
    [[nodiscard]] Result<DirectoryIdentity> decide(const AuthnRequest& request) const;

    /**
     * @brief Run decide() on a separate thread
     *
     * Blocks for at most about the configured timeout per network step; use
     * this to keep the call off a request-handling loop.
     */
    [[nodiscard]] std::future<Result<DirectoryIdentity>> decide_async(AuthnRequest request) const;

    // Attribute holding the canonical account name (sAMAccountName in AD mode)
    [[nodiscard]] const std::string& username_attribute() const { return username_attribute_; }

    [[nodiscard]] SearchRequest build_search(const AuthnRequest& request) const;

    /**
     * @brief Case-insensitive allow-list test; an empty allow-list never denies
     */
    [[nodiscard]] static bool is_member_of_any(const std::vector<std::string>& allowed,
                                               const std::vector<std::string>& groups);

private:
    std::shared_ptr<const SessionBuilder> sessions_;
    std::string username_attribute_;
};

} // namespace dirauth
