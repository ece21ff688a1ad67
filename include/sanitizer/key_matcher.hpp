#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace eventscrub {

/**
 * @brief Sensitive field-name detector
 *
 * Keys and vocabulary entries are both normalized (lower-cased, separators
 * stripped) so "apiKey", "api_key" and "API-KEY" compare equal. A key is
 * sensitive when its normalized form contains any normalized vocabulary
 * entry as a substring: "a_password_here" matches "password".
 */
class KeyMatcher {
public:
    /**
     * @brief Default vocabulary, in match order
     */
    [[nodiscard]] static const std::vector<std::string>& default_vocabulary();

    KeyMatcher() : KeyMatcher(default_vocabulary()) {}
    explicit KeyMatcher(const std::vector<std::string>& vocabulary);

    [[nodiscard]] bool matches(std::string_view key) const;

    /**
     * @brief Normalized entries, deduplicated, in first-seen order
     */
    [[nodiscard]] const std::vector<std::string>& vocabulary() const { return vocabulary_; }

private:
    std::vector<std::string> vocabulary_;
};

} // namespace eventscrub
