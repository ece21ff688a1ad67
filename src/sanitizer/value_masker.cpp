#include "sanitizer/value_masker.hpp"

#include <algorithm>
#include <cctype>

namespace eventscrub {

namespace {

std::string digits_only(std::string_view value) {
    std::string digits;
    digits.reserve(value.size());
    for (const char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    return digits;
}

} // anonymous namespace

ValueMasker::ValueMasker(const Config& config) : config_(config) {
    patterns_.reserve(config_.value_patterns.size());
    for (const auto& pattern : config_.value_patterns) {
        patterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::optimize);
    }
}

bool ValueMasker::looks_like_credit_card(std::string_view value) {
    // Cheap reject before allocating
    if (value.size() < 15) return false;

    const auto count = std::count_if(value.begin(), value.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    return count == 15 || count == 16;
}

bool ValueMasker::luhn_valid(std::string_view value) {
    const std::string digits = digits_only(value);
    if (digits.empty()) return false;

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';

        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }

        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

bool ValueMasker::is_sensitive(std::string_view value) const {
    if (config_.credit_card_enabled && looks_like_credit_card(value)) {
        if (!config_.credit_card_luhn_check || luhn_valid(value)) {
            return true;
        }
    }

    if (patterns_.empty()) return false;

    const std::string text(value);
    return std::any_of(patterns_.begin(), patterns_.end(),
        [&text](const std::regex& re) { return std::regex_match(text, re); });
}

} // namespace eventscrub
