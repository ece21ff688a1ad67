#pragma once

#include "processor/sanitize_sensitive_fields_processor.hpp"

#include <string>
#include <vector>

namespace eventscrub {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";   // debug | info | warn | error
};

/**
 * @brief Complete parsed configuration
 *
 * sanitizer.sensitive_keys holds the resolved vocabulary: the defaults plus
 * [sanitizer].sensitive_keys, or only the latter when
 * replace_default_keys = true.
 */
struct ScrubberConfig {
    SanitizeSensitiveFieldsProcessor::Config sanitizer;
    std::vector<std::string> processors{std::string(SanitizeSensitiveFieldsProcessor::kName)};
    LoggingConfig logging;
};

} // namespace eventscrub
