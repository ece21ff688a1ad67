#include "processor/processor_factory.hpp"
#include "processor/remove_post_data_processor.hpp"
#include "processor/remove_stack_locals_processor.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace eventscrub {

std::optional<ProcessorKind> parse_processor_kind(std::string_view id) {
    static const std::unordered_map<std::string, ProcessorKind> lookup = {
        {"sanitize_sensitive_fields", ProcessorKind::SANITIZE_SENSITIVE_FIELDS},
        {"sanitize_passwords",        ProcessorKind::SANITIZE_SENSITIVE_FIELDS},
        {"remove_post_data",          ProcessorKind::REMOVE_POST_DATA},
        {"remove_stack_locals",       ProcessorKind::REMOVE_STACK_LOCALS},
    };

    const auto it = lookup.find(utils::to_lower(utils::trim(std::string(id))));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

const char* processor_kind_to_string(ProcessorKind kind) {
    switch (kind) {
        case ProcessorKind::SANITIZE_SENSITIVE_FIELDS: return "sanitize_sensitive_fields";
        case ProcessorKind::REMOVE_POST_DATA:          return "remove_post_data";
        case ProcessorKind::REMOVE_STACK_LOCALS:       return "remove_stack_locals";
    }
    return "unknown";
}

std::unique_ptr<IProcessor> create_processor(
    ProcessorKind kind,
    const SanitizeSensitiveFieldsProcessor::Config& sanitizer) {

    switch (kind) {
        case ProcessorKind::SANITIZE_SENSITIVE_FIELDS:
            return std::make_unique<SanitizeSensitiveFieldsProcessor>(sanitizer);
        case ProcessorKind::REMOVE_POST_DATA:
            return std::make_unique<RemovePostDataProcessor>();
        case ProcessorKind::REMOVE_STACK_LOCALS:
            return std::make_unique<RemoveStackLocalsProcessor>();
    }
    throw std::invalid_argument("create_processor: unhandled processor kind");
}

std::unique_ptr<IProcessor> create_processor(
    std::string_view id,
    const SanitizeSensitiveFieldsProcessor::Config& sanitizer) {

    const auto kind = parse_processor_kind(id);
    if (!kind) {
        throw std::invalid_argument(std::format("Unknown processor: '{}'", id));
    }
    return create_processor(*kind, sanitizer);
}

} // namespace eventscrub
