#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace eventscrub {

/**
 * @brief Sensitive value detector, independent of the field name
 *
 * Built-in shape: credit-card-like digit strings (15 or 16 digits once
 * every non-digit is stripped, covering 16-digit cards and 15-digit AMEX).
 * Extra shapes come from configuration as ECMAScript regexes that must
 * match the whole value.
 */
class ValueMasker {
public:
    struct Config {
        bool credit_card_enabled = true;
        bool credit_card_luhn_check = false;
        std::vector<std::string> value_patterns;
    };

    ValueMasker() : ValueMasker(Config{}) {}

    /**
     * @throws std::regex_error if a value pattern does not compile
     */
    explicit ValueMasker(const Config& config);

    [[nodiscard]] static bool looks_like_credit_card(std::string_view value);

    /**
     * @brief Luhn checksum over the digits of value (non-digits ignored)
     */
    [[nodiscard]] static bool luhn_valid(std::string_view value);

    /**
     * @brief Any enabled shape matches
     */
    [[nodiscard]] bool is_sensitive(std::string_view value) const;

    [[nodiscard]] size_t pattern_count() const { return patterns_.size(); }

private:
    Config config_;
    std::vector<std::regex> patterns_;
};

} // namespace eventscrub
