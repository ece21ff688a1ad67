#include "sanitizer/query_string.hpp"

#include <cctype>

namespace eventscrub::form {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string_view trim_leading_space(std::string_view sv) {
    size_t i = 0;
    while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
    return sv.substr(i);
}

} // anonymous namespace

std::vector<Pair> split_pairs(std::string_view text, char sep) {
    std::vector<Pair> pairs;
    size_t start = 0;
    while (true) {
        const size_t end = text.find(sep, start);
        const std::string_view raw = text.substr(start,
            end == std::string_view::npos ? std::string_view::npos : end - start);

        Pair pair;
        pair.raw = raw;
        const size_t eq = raw.find('=');
        if (eq == std::string_view::npos) {
            pair.key = raw;
        } else {
            pair.key = raw.substr(0, eq);
            pair.value = raw.substr(eq + 1);
            pair.has_value = true;
        }
        pairs.push_back(pair);

        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return pairs;
}

std::string percent_decode(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi < 0 || lo < 0) {
                result += c;
                continue;
            }
            result += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            result += c;
        }
    }
    return result;
}

size_t mask_pairs(std::string& text, char sep,
                  const std::function<bool(std::string_view key, std::string_view value)>& is_sensitive,
                  std::string_view mask) {
    const auto pairs = split_pairs(text, sep);

    std::string result;
    result.reserve(text.size());
    size_t masked = 0;

    for (size_t i = 0; i < pairs.size(); ++i) {
        const auto& pair = pairs[i];
        if (i > 0) result += sep;

        if (pair.has_value && pair.value != mask &&
            is_sensitive(percent_decode(trim_leading_space(pair.key)),
                         percent_decode(pair.value))) {
            result.append(pair.key);
            result += '=';
            result.append(mask);
            ++masked;
        } else {
            result.append(pair.raw);
        }
    }

    if (masked > 0) {
        text = std::move(result);
    }
    return masked;
}

} // namespace eventscrub::form
