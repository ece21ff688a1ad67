#include "processor/sanitize_sensitive_fields_processor.hpp"
#include "sanitizer/query_string.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace eventscrub {

// Request sub-objects sanitized with the per-key rule
static constexpr std::string_view kRequestMappings[] = {
    doc::kData, doc::kEnv, doc::kHeaders, doc::kCookies,
};

static constexpr std::string_view kCookieHeader = "cookie";

SanitizeSensitiveFieldsProcessor::SanitizeSensitiveFieldsProcessor(const Config& config)
    : mask_(config.mask),
      keys_(config.sensitive_keys),
      values_(config.values) {
    // A separator inside the mask would be re-split on the next pass
    if (mask_.find_first_of(kMaskForbiddenChars) != std::string::npos) {
        throw std::invalid_argument(std::format(
            "{}: mask '{}' must not contain '&' or ';'", kName, mask_));
    }
}

void SanitizeSensitiveFieldsProcessor::process(EventDocument& event) const {
    const size_t masked = sanitize_stack_locals(event)
        + sanitize_request(event)
        + sanitize_extra(event);

    if (masked > 0) {
        utils::log::debug(std::format("{}: masked {} value(s)", kName, masked));
    }
}

EventDocument SanitizeSensitiveFieldsProcessor::sanitize_value(
    std::string_view key, const EventDocument& value) const {
    EventDocument copy = value;
    sanitize_node(key, copy);
    return copy;
}

size_t SanitizeSensitiveFieldsProcessor::sanitize_mapping(EventDocument& mapping) const {
    if (!mapping.is_object()) return 0;

    size_t masked = 0;
    for (auto& entry : mapping.items()) {
        masked += sanitize_node(entry.key(), entry.value());
    }
    return masked;
}

// ============================================================================
// Private helpers
// ============================================================================

bool SanitizeSensitiveFieldsProcessor::replace_with_mask(EventDocument& value) const {
    if (value.is_string() && value.get_ref<const std::string&>() == mask_) {
        return false;
    }
    value = mask_;
    return true;
}

size_t SanitizeSensitiveFieldsProcessor::sanitize_node(
    std::string_view key, EventDocument& value) const {
    if (keys_.matches(key)) {
        return replace_with_mask(value) ? 1 : 0;
    }

    if (value.is_object()) {
        return sanitize_mapping(value);
    }

    if (value.is_array()) {
        // Elements inherit the key of the sequence that holds them
        size_t masked = 0;
        for (auto& element : value) {
            masked += sanitize_node(key, element);
        }
        return masked;
    }

    const auto text = doc::scalar_text(value);
    if (text && values_.is_sensitive(*text)) {
        return replace_with_mask(value) ? 1 : 0;
    }
    return 0;
}

size_t SanitizeSensitiveFieldsProcessor::sanitize_stack_locals(EventDocument& event) const {
    size_t masked = 0;
    doc::for_each_frame(event, [&](EventDocument& frame) {
        if (auto* vars = doc::find_object(frame, {doc::kVars})) {
            masked += sanitize_mapping(*vars);
        }
    });
    return masked;
}

size_t SanitizeSensitiveFieldsProcessor::sanitize_request(EventDocument& event) const {
    auto* request = doc::find_object(event, {doc::kRequest});
    if (!request) return 0;

    size_t masked = 0;
    for (const auto key : kRequestMappings) {
        if (auto* section = doc::find_object(*request, {key})) {
            masked += sanitize_mapping(*section);
        }
    }

    // Cookie blobs: request.cookies as a string, or the Cookie header
    if (auto* cookies = doc::find_path(*request, {doc::kCookies})) {
        masked += sanitize_form_blob(*cookies, form::kCookieSeparator);
    }
    if (auto* headers = doc::find_object(*request, {doc::kHeaders})) {
        for (auto& header : headers->items()) {
            if (utils::to_lower(header.key()) == kCookieHeader) {
                masked += sanitize_form_blob(header.value(), form::kCookieSeparator);
            }
        }
    }

    if (auto* query = doc::find_path(*request, {doc::kQueryString})) {
        if (query->is_object()) {
            masked += sanitize_mapping(*query);
        } else {
            masked += sanitize_form_blob(*query, form::kQuerySeparator);
        }
    }
    return masked;
}

size_t SanitizeSensitiveFieldsProcessor::sanitize_extra(EventDocument& event) const {
    auto* extra = doc::find_object(event, {doc::kExtra});
    return extra ? sanitize_mapping(*extra) : 0;
}

size_t SanitizeSensitiveFieldsProcessor::sanitize_form_blob(EventDocument& value, char sep) const {
    if (!value.is_string()) return 0;

    auto& text = value.get_ref<std::string&>();
    return form::mask_pairs(text, sep,
        [this](std::string_view key, std::string_view val) {
            return keys_.matches(key) || values_.is_sensitive(val);
        },
        mask_);
}

} // namespace eventscrub
