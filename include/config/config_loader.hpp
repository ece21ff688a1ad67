#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace eventscrub {

/**
 * @brief Load ScrubberConfig from TOML
 *
 *   [sanitizer]
 *   mask = "********"
 *   sensitive_keys = ["pin"]
 *   replace_default_keys = false
 *   credit_card_luhn_check = false
 *   value_patterns = ['^\d{3}-\d{2}-\d{4}$']
 *   processors = ["sanitize_sensitive_fields"]
 *
 *   [logging]
 *   level = "info"
 *
 * ${VAR} inside string values is expanded from the environment. Missing
 * sections keep their defaults.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ScrubberConfig config;

        static LoadResult ok(ScrubberConfig cfg) {
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
     * @brief Load config from TOML file
     * @param config_path Path to scrubber.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Set the process-wide log level from a validated config
     */
    static void apply_logging(const LoggingConfig& config);

    /**
     * @brief All validation errors, empty when config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const ScrubberConfig& config);

private:
    static ScrubberConfig extract_all_sections(const toml::table& root);
    static void extract_sanitizer(const toml::table& root, ScrubberConfig& config);
    static LoggingConfig extract_logging(const toml::table& root);
    static LoadResult validate_and_return(ScrubberConfig config);
};

} // namespace eventscrub
