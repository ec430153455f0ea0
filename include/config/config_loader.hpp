#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace reqlog {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads AppConfig from a TOML document (toml++)
 *
 * Supports `${ENV_VAR}` substitution in string values and an optional
 * top-level `include = "other.toml"` (or array) merged underneath the
 * including file. Never throws: parse and validation failures come back
 * in LoadResult.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
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
     * @param config_path Path to reqlog.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// All validation errors for `config` (empty = valid)
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace reqlog
