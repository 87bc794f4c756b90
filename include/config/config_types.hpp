#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dirauth {

// ============================================================================
// Configuration Types
// ============================================================================

enum class EncryptionMode {
    NONE,      // plaintext ldap://
    LDAPS,     // implicit TLS from connection start
    STARTTLS   // plaintext, upgraded to TLS after the bind
};

[[nodiscard]] inline constexpr std::string_view encryption_mode_name(EncryptionMode m) {
    switch (m) {
        case EncryptionMode::NONE:     return "none";
        case EncryptionMode::LDAPS:    return "ldaps";
        case EncryptionMode::STARTTLS: return "starttls";
    }
    return "unknown";
}

[[nodiscard]] std::optional<EncryptionMode> parse_encryption_mode(std::string_view name);

/**
 * @brief Directory connection and policy settings for one provider
 *
 * Read-only once constructed; shared by every authentication attempt.
 */
struct DirectoryConfig {
    std::string server;
    uint16_t port = 636;
    EncryptionMode encryption = EncryptionMode::LDAPS;
    bool validate_certificates = true;
    std::chrono::seconds timeout{10};               // connect, bind and search limit
    std::string base_dn;
    std::string username_attribute = "uid";
    bool active_directory = false;
    bool bind_as_service_account = true;
    std::optional<std::string> bind_username;
    std::optional<std::string> bind_password;
    std::vector<std::string> allowed_group_dns;     // empty = no restriction
};

inline constexpr std::string_view kDefaultProviderTitle = "LDAP Authentication";

struct ProviderConfig {
    std::string type = "ldap";                      // registry tag
    std::optional<std::string> name;                // display title override
    std::optional<std::string> id;                  // distinguishes providers of one type
    DirectoryConfig directory;
};

struct LoggingConfig {
    std::string level = "info";
};

struct AppConfig {
    LoggingConfig logging;
    ProviderConfig provider;
};

} // namespace dirauth
