#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace dirauth {

std::optional<EncryptionMode> parse_encryption_mode(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "none")     return EncryptionMode::NONE;
    if (lower == "ldaps")    return EncryptionMode::LDAPS;
    if (lower == "starttls") return EncryptionMode::STARTTLS;
    return std::nullopt;
}

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

// Keys accepted under [provider.ldap]
constexpr std::array<std::string_view, 12> kDirectoryKeys = {
    "server", "port", "encryption", "validate_certificates", "timeout",
    "base_dn", "username_attribute", "active_directory",
    "bind_as_service_account", "bind_username", "bind_password",
    "allowed_group_dns",
};

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

// Walks tables and arrays, expanding every string value in place
void expand_env_in_node(toml::node& node) {
    if (auto* str = node.as_string()) {
        if (str->get().find("${") != std::string::npos) {
            *str = expand_env_vars(str->get());
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto&& [key, child] : *tbl) expand_env_in_node(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) expand_env_in_node(child);
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives (e.g. a secrets file holding bind_password).
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_in_node(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_in_node(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

template<typename T> constexpr std::string_view kTomlTypeName = "a value";
template<> constexpr std::string_view kTomlTypeName<std::string> = "a string";
template<> constexpr std::string_view kTomlTypeName<int64_t> = "an integer";
template<> constexpr std::string_view kTomlTypeName<bool> = "a boolean";

std::string_view node_type_name(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:         return "a string";
        case toml::node_type::integer:        return "an integer";
        case toml::node_type::floating_point: return "a float";
        case toml::node_type::boolean:        return "a boolean";
        case toml::node_type::array:          return "an array";
        case toml::node_type::table:          return "a table";
        case toml::node_type::date:
        case toml::node_type::time:
        case toml::node_type::date_time:      return "a date/time";
        default:                              return "an unknown value";
    }
}

[[noreturn]] void throw_wrong_type(std::string_view section, std::string_view key,
                                   std::string_view expected, const toml::node& node) {
    throw std::runtime_error(std::format("{}.{} must be {}, got {}",
        section, key, expected, node_type_name(node)));
}

// Absent key yields nullopt; a present key of another type is an error
template<typename T>
std::optional<T> toml_get(const toml::table& tbl, std::string_view section, std::string_view key) {
    const toml::node* node = tbl.get(key);
    if (!node) return std::nullopt;
    if (const auto* v = node->as<T>()) {
        return T(v->get());
    }
    throw_wrong_type(section, key, kTomlTypeName<T>, *node);
}

template<typename T>
T toml_get_or(const toml::table& tbl, std::string_view section, std::string_view key, T fallback) {
    auto value = toml_get<T>(tbl, section, key);
    return value ? std::move(*value) : std::move(fallback);
}

// Accepts an array of strings or a single string
std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view section,
                                           std::string_view key) {
    std::vector<std::string> result;
    const toml::node* node = tbl.get(key);
    if (!node) return result;

    if (const auto* arr = node->as_array()) {
        result.reserve(arr->size());
        for (size_t i = 0; i < arr->size(); ++i) {
            const auto* s = (*arr)[i].as_string();
            if (!s) {
                throw_wrong_type(section, std::format("{}[{}]", key, i), "a string", (*arr)[i]);
            }
            result.emplace_back(s->get());
        }
    } else if (const auto* s = node->as_string()) {
        result.emplace_back(s->get());
    } else {
        throw_wrong_type(section, key, "a string or an array of strings", *node);
    }
    return result;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = toml_get_or(*logging, "logging", "level", "info"s);
    return cfg;
}

DirectoryConfig extract_directory(const toml::table& d) {
    DirectoryConfig cfg;

    for (const auto& [key, val] : d) {
        const std::string_view k = key.str();
        if (std::find(kDirectoryKeys.begin(), kDirectoryKeys.end(), k) == kDirectoryKeys.end()) {
            throw std::runtime_error(std::format("Unknown key provider.ldap.{}", k));
        }
    }

    constexpr std::string_view sec = "provider.ldap";
    cfg.server = toml_get_or(d, sec, "server", ""s);

    const int64_t port = toml_get_or(d, sec, "port", int64_t{636});
    if (port < 1 || port > 65535) {
        throw std::runtime_error(std::format("provider.ldap.port must be 1-65535, got {}", port));
    }
    cfg.port = static_cast<uint16_t>(port);

    const std::string encryption = toml_get_or(d, sec, "encryption", "ldaps"s);
    const auto mode = parse_encryption_mode(encryption);
    if (!mode) {
        throw std::runtime_error(std::format(
            "provider.ldap.encryption must be one of none, ldaps, starttls; got '{}'", encryption));
    }
    cfg.encryption = *mode;

    cfg.validate_certificates = toml_get_or(d, sec, "validate_certificates", true);
    cfg.timeout = std::chrono::seconds(toml_get_or(d, sec, "timeout", int64_t{10}));
    cfg.base_dn = toml_get_or(d, sec, "base_dn", ""s);
    cfg.username_attribute = toml_get_or(d, sec, "username_attribute", "uid"s);
    cfg.active_directory = toml_get_or(d, sec, "active_directory", false);
    cfg.bind_as_service_account = toml_get_or(d, sec, "bind_as_service_account", true);
    cfg.bind_username = toml_get<std::string>(d, sec, "bind_username");
    cfg.bind_password = toml_get<std::string>(d, sec, "bind_password");
    cfg.allowed_group_dns = toml_string_array(d, sec, "allowed_group_dns");
    return cfg;
}

ProviderConfig extract_provider(const toml::table& root) {
    ProviderConfig cfg;
    const auto* provider = root["provider"].as_table();
    if (!provider) {
        throw std::runtime_error("Missing [provider] section");
    }
    const auto& p = *provider;

    cfg.type = toml_get_or(p, "provider", "type", "ldap"s);
    cfg.name = toml_get<std::string>(p, "provider", "name");
    cfg.id = toml_get<std::string>(p, "provider", "id");

    if (const auto* ldap = p["ldap"].as_table()) {
        cfg.directory = extract_directory(*ldap);
    } else {
        throw std::runtime_error("Missing [provider.ldap] section");
    }
    return cfg;
}

AppConfig extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.logging = extract_logging(tbl);
    config.provider = extract_provider(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_directory(const DirectoryConfig& config) {
    std::vector<std::string> errors;

    if (config.server.empty()) {
        errors.emplace_back("provider.ldap.server must not be empty");
    }
    if (config.base_dn.empty()) {
        errors.emplace_back("provider.ldap.base_dn must not be empty");
    }
    if (config.port == 0) {
        errors.emplace_back("provider.ldap.port must be 1-65535, got 0");
    }
    if (config.timeout.count() <= 0) {
        errors.push_back(std::format(
            "provider.ldap.timeout must be positive, got {}", config.timeout.count()));
    }
    if (!config.active_directory && config.username_attribute.empty()) {
        errors.emplace_back("provider.ldap.username_attribute must not be empty");
    }
    if (config.bind_as_service_account) {
        if (!config.bind_username || config.bind_username->empty()) {
            errors.emplace_back(
                "provider.ldap.bind_username required when bind_as_service_account is true");
        }
        if (!config.bind_password || config.bind_password->empty()) {
            errors.emplace_back(
                "provider.ldap.bind_password required when bind_as_service_account is true");
        }
    }
    for (size_t i = 0; i < config.allowed_group_dns.size(); ++i) {
        if (utils::trim(config.allowed_group_dns[i]).empty()) {
            errors.push_back(std::format("provider.ldap.allowed_group_dns[{}] must not be empty", i));
        }
    }

    return errors;
}

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'",
            config.logging.level));
    }
    if (config.provider.type.empty()) {
        errors.emplace_back("provider.type must not be empty");
    }

    auto directory_errors = validate_directory(config.provider.directory);
    errors.insert(errors.end(),
                  std::make_move_iterator(directory_errors.begin()),
                  std::make_move_iterator(directory_errors.end()));
    return errors;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

void ConfigLoader::apply_logging(const LoggingConfig& logging) {
    const auto level = utils::log::parse_level(logging.level);
    if (!level) {
        utils::log::warn(std::format("Unknown log level '{}', keeping current level", logging.level));
        return;
    }
    utils::log::set_level(*level);
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

} // namespace dirauth
