#include "sanitizer/key_matcher.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace eventscrub {

const std::vector<std::string>& KeyMatcher::default_vocabulary() {
    static const std::vector<std::string> vocabulary = {
        "password",
        "secret",
        "passwd",
        "api_key",
        "apikey",
        "access_token",
        "auth",
        "credentials",
        "sentry_dsn",
        "private_key",
        "csrftoken",
        "session_id",
    };
    return vocabulary;
}

KeyMatcher::KeyMatcher(const std::vector<std::string>& vocabulary) {
    vocabulary_.reserve(vocabulary.size());
    for (const auto& entry : vocabulary) {
        std::string normalized = utils::normalize_key(entry);
        // An empty needle would match every key
        if (normalized.empty()) continue;
        if (std::find(vocabulary_.begin(), vocabulary_.end(), normalized) != vocabulary_.end()) {
            continue;
        }
        vocabulary_.emplace_back(std::move(normalized));
    }
}

bool KeyMatcher::matches(std::string_view key) const {
    const std::string normalized = utils::normalize_key(key);
    if (normalized.empty()) return false;

    return std::any_of(vocabulary_.begin(), vocabulary_.end(),
        [&normalized](const std::string& needle) {
            return normalized.find(needle) != std::string::npos;
        });
}

} // namespace eventscrub
