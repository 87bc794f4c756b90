#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace dirauth {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to the provider .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check a directory config for missing or out-of-range settings
     * @return One message per problem; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_directory(const DirectoryConfig& config);

    // Set the process-wide log threshold from [logging]
    static void apply_logging(const LoggingConfig& logging);

private:
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace dirauth
