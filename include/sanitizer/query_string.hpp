#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace eventscrub::form {

inline constexpr char kQuerySeparator = '&';
inline constexpr char kCookieSeparator = ';';

/**
 * @brief One separator-delimited segment of a form-encoded blob
 *
 * raw is the exact segment text. key/value are views into raw; has_value is
 * false for segments without '=' ("password" in "a=1&password&b=2").
 */
struct Pair {
    std::string_view raw;
    std::string_view key;
    std::string_view value;
    bool has_value = false;
};

/**
 * @brief Split on sep without dropping or altering anything.
 * Joining the raw segments with sep reproduces text byte-for-byte.
 */
[[nodiscard]] std::vector<Pair> split_pairs(std::string_view text, char sep);

/**
 * @brief Decode %XX escapes and '+' before a pair is judged.
 * Invalid escapes are kept literally.
 */
[[nodiscard]] std::string percent_decode(std::string_view text);

/**
 * @brief Replace the value of every pair judged sensitive
 *
 * Pairs without '=' are never touched; a pair with an empty value
 * ("password=") is still offered to the predicate. Leading whitespace before
 * a key (cookie style "a=1; b=2") is ignored for matching and kept in the
 * output. A value already equal to mask is left alone.
 *
 * @param text Blob, rewritten in place
 * @param sep Pair separator, must not occur in mask
 * @param is_sensitive Called with the percent-decoded key and value
 * @param mask Replacement text
 * @return Number of values masked
 */
size_t mask_pairs(std::string& text, char sep,
                  const std::function<bool(std::string_view key, std::string_view value)>& is_sensitive,
                  std::string_view mask);

} // namespace eventscrub::form
