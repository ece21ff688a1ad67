#pragma once

#include "processor/processor.hpp"
#include "sanitizer/key_matcher.hpp"
#include "sanitizer/value_masker.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace eventscrub {

/**
 * @brief Redacts sensitive fields in stack locals and HTTP request data
 *
 * Covered subtrees:
 * - vars of every stack frame (exception, bare stacktrace, threads)
 * - request.data / env / headers / cookies (mappings)
 * - request.query_string (k=v&k=v blob or mapping)
 * - request.cookies and the Cookie header as k=v; k=v blobs
 * - extra
 *
 * A value is replaced by the mask when its key matches the KeyMatcher
 * vocabulary (the whole subtree under a matching key is replaced) or when
 * its text matches a ValueMasker shape. Everything else is left exactly as
 * it was, type included. A second pass changes nothing.
 */
class SanitizeSensitiveFieldsProcessor final : public IProcessor {
public:
    static constexpr std::string_view kName = "sanitize_sensitive_fields";
    static constexpr std::string_view kDefaultMask = "********";
    // Blob separators; see form::kQuerySeparator and form::kCookieSeparator
    static constexpr std::string_view kMaskForbiddenChars = "&;";

    struct Config {
        std::string mask = std::string(kDefaultMask);
        std::vector<std::string> sensitive_keys = KeyMatcher::default_vocabulary();
        ValueMasker::Config values;
    };

    SanitizeSensitiveFieldsProcessor() : SanitizeSensitiveFieldsProcessor(Config{}) {}

    /**
     * @throws std::regex_error if a value pattern does not compile
     * @throws std::invalid_argument if the mask contains a blob separator
     */
    explicit SanitizeSensitiveFieldsProcessor(const Config& config);

    void process(EventDocument& event) const override;
    [[nodiscard]] std::string_view name() const override { return kName; }

    /**
     * @brief Sanitized copy of a single field
     * @return The mask when key or value is sensitive, value otherwise
     */
    [[nodiscard]] EventDocument sanitize_value(std::string_view key,
                                               const EventDocument& value) const;

    /**
     * @brief Apply the per-key rule to every entry of a mapping
     * @return Number of values masked (0 for non-objects)
     */
    size_t sanitize_mapping(EventDocument& mapping) const;

    [[nodiscard]] const std::string& mask() const { return mask_; }
    [[nodiscard]] const KeyMatcher& key_matcher() const { return keys_; }
    [[nodiscard]] const ValueMasker& value_masker() const { return values_; }

private:
    size_t sanitize_node(std::string_view key, EventDocument& value) const;
    size_t sanitize_stack_locals(EventDocument& event) const;
    size_t sanitize_request(EventDocument& event) const;
    size_t sanitize_extra(EventDocument& event) const;
    size_t sanitize_form_blob(EventDocument& value, char sep) const;
    bool replace_with_mask(EventDocument& value) const;

    std::string mask_;
    KeyMatcher keys_;
    ValueMasker values_;
};

} // namespace eventscrub
