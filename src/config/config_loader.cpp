#include "config/config_loader.hpp"
#include "processor/processor_factory.hpp"
#include "sanitizer/key_matcher.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <regex>
#include <stdexcept>

namespace eventscrub {

// Config keys
static constexpr std::string_view kSanitizer          = "sanitizer";
static constexpr std::string_view kLogging            = "logging";
static constexpr std::string_view kMask               = "mask";
static constexpr std::string_view kSensitiveKeys      = "sensitive_keys";
static constexpr std::string_view kReplaceDefaultKeys = "replace_default_keys";
static constexpr std::string_view kLuhnCheck          = "credit_card_luhn_check";
static constexpr std::string_view kCreditCard         = "credit_card";
static constexpr std::string_view kValuePatterns      = "value_patterns";
static constexpr std::string_view kProcessors         = "processors";
static constexpr std::string_view kLevel              = "level";

// ============================================================================
// TOML helpers
// ============================================================================

namespace {

// Strings read from the config may reference the environment as ${NAME}.
// Unset variables expand to nothing.
std::string expand_env(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    size_t pos = 0;
    while (pos < input.size()) {
        const size_t open = input.find("${", pos);
        if (open == std::string_view::npos) {
            out.append(input.substr(pos));
            break;
        }
        out.append(input.substr(pos, open - pos));
        const size_t close = input.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(std::format(
                "Unclosed ${{...}} in config value '{}'", input));
        }
        const std::string name(input.substr(open + 2, close - open - 2));
        if (const char* env = std::getenv(name.c_str())) {
            out += env;
        }
        pos = close + 1;
    }
    return out;
}

std::string toml_string(const toml::table& tbl, std::string_view key, std::string_view fallback) {
    if (const auto* s = tbl[key].as_string()) {
        return expand_env(s->get());
    }
    return std::string(fallback);
}

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.push_back(expand_env(s->get()));
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

void ConfigLoader::extract_sanitizer(const toml::table& root, ScrubberConfig& config) {
    const auto* sanitizer = root[kSanitizer].as_table();
    if (!sanitizer) return;
    const auto& s = *sanitizer;
    auto& cfg = config.sanitizer;

    cfg.mask = toml_string(s, kMask, SanitizeSensitiveFieldsProcessor::kDefaultMask);

    auto extra_keys = toml_string_array(s, kSensitiveKeys);
    if (s[kReplaceDefaultKeys].value_or(false)) {
        cfg.sensitive_keys = std::move(extra_keys);
    } else {
        cfg.sensitive_keys.insert(cfg.sensitive_keys.end(),
                                  extra_keys.begin(), extra_keys.end());
    }

    cfg.values.credit_card_enabled = s[kCreditCard].value_or(true);
    cfg.values.credit_card_luhn_check = s[kLuhnCheck].value_or(false);
    cfg.values.value_patterns = toml_string_array(s, kValuePatterns);

    if (s[kProcessors].as_array()) {
        config.processors = toml_string_array(s, kProcessors);
    }
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root[kLogging].as_table();
    if (!logging) return cfg;

    cfg.level = toml_string(*logging, kLevel, "info");
    return cfg;
}

ScrubberConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    ScrubberConfig config;
    extract_sanitizer(tbl, config);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ScrubberConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = toml::parse_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = toml::parse(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

void ConfigLoader::apply_logging(const LoggingConfig& config) {
    const auto level = utils::log::parse_level(config.level);
    if (!level) {
        utils::log::warn(std::format("Unknown log level '{}', keeping current level", config.level));
        return;
    }
    utils::log::set_level(*level);
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ScrubberConfig& config) {
    std::vector<std::string> errors;

    const auto& mask = config.sanitizer.mask;
    if (mask.empty()) {
        errors.emplace_back("sanitizer.mask must not be empty");
    } else if (mask.find_first_of(SanitizeSensitiveFieldsProcessor::kMaskForbiddenChars)
               != std::string::npos) {
        errors.push_back(std::format(
            "sanitizer.mask '{}' must not contain '&' or ';'", mask));
    }

    // Entries that normalize to nothing ("", "_") are dropped by KeyMatcher
    if (KeyMatcher(config.sanitizer.sensitive_keys).vocabulary().empty()) {
        errors.emplace_back("sanitizer.sensitive_keys must name at least one usable key");
    }

    for (size_t i = 0; i < config.sanitizer.values.value_patterns.size(); ++i) {
        const auto& pattern = config.sanitizer.values.value_patterns[i];
        try {
            const std::regex re(pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            errors.push_back(std::format(
                "sanitizer.value_patterns[{}] '{}' is not a valid regex: {}", i, pattern, e.what()));
        }
    }

    if (config.processors.empty()) {
        errors.emplace_back("sanitizer.processors must name at least one processor");
    }
    for (size_t i = 0; i < config.processors.size(); ++i) {
        if (!parse_processor_kind(config.processors[i])) {
            errors.push_back(std::format(
                "sanitizer.processors[{}] unknown processor '{}'", i, config.processors[i]));
        }
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    return errors;
}

} // namespace eventscrub
