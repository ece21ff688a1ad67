#pragma once

#include "processor/processor.hpp"
#include "processor/sanitize_sensitive_fields_processor.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace eventscrub {

enum class ProcessorKind {
    SANITIZE_SENSITIVE_FIELDS,
    REMOVE_POST_DATA,
    REMOVE_STACK_LOCALS
};

/**
 * @brief Map a configuration identifier to a processor kind
 *
 * Accepts "sanitize_sensitive_fields" (alias "sanitize_passwords"),
 * "remove_post_data" and "remove_stack_locals", case-insensitive.
 */
[[nodiscard]] std::optional<ProcessorKind> parse_processor_kind(std::string_view id);

[[nodiscard]] const char* processor_kind_to_string(ProcessorKind kind);

/**
 * @brief Instantiate a processor
 * @param sanitizer Used only by SANITIZE_SENSITIVE_FIELDS
 */
[[nodiscard]] std::unique_ptr<IProcessor> create_processor(
    ProcessorKind kind,
    const SanitizeSensitiveFieldsProcessor::Config& sanitizer = {});

/**
 * @throws std::invalid_argument for an unknown identifier
 */
[[nodiscard]] std::unique_ptr<IProcessor> create_processor(
    std::string_view id,
    const SanitizeSensitiveFieldsProcessor::Config& sanitizer = {});

} // namespace eventscrub
