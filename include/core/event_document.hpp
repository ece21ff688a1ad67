#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace eventscrub {

/**
 * @brief One captured error report.
 *
 * ordered_json keeps object keys in insertion order, so a sanitized event
 * serializes with its keys exactly where the event builder put them.
 */
using EventDocument = nlohmann::ordered_json;

namespace doc {

// Well-known keys of the event shape
inline constexpr std::string_view kException  = "exception";
inline constexpr std::string_view kValues     = "values";
inline constexpr std::string_view kStacktrace = "stacktrace";
inline constexpr std::string_view kFrames     = "frames";
inline constexpr std::string_view kVars       = "vars";
inline constexpr std::string_view kThreads    = "threads";
inline constexpr std::string_view kRequest    = "request";
inline constexpr std::string_view kData       = "data";
inline constexpr std::string_view kEnv        = "env";
inline constexpr std::string_view kHeaders    = "headers";
inline constexpr std::string_view kCookies    = "cookies";
inline constexpr std::string_view kQueryString = "query_string";
inline constexpr std::string_view kExtra      = "extra";

/**
 * @brief Walk object keys from root; nullptr as soon as a level is missing
 * or is not an object.
 */
[[nodiscard]] EventDocument* find_path(EventDocument& root,
                                       std::initializer_list<std::string_view> path);
[[nodiscard]] const EventDocument* find_path(const EventDocument& root,
                                             std::initializer_list<std::string_view> path);

/**
 * @brief find_path() that also requires the target to be an object
 */
[[nodiscard]] EventDocument* find_object(EventDocument& root,
                                         std::initializer_list<std::string_view> path);

/**
 * @brief find_path() that also requires the target to be an array
 */
[[nodiscard]] EventDocument* find_array(EventDocument& root,
                                        std::initializer_list<std::string_view> path);

/**
 * @brief Erase key from an object node. No-op (false) for non-objects.
 */
bool erase_key(EventDocument& node, std::string_view key);

/**
 * @brief Text form of a scalar for value-shape checks.
 * Strings as-is, numbers via dump(); nullopt for bool, null and containers.
 */
[[nodiscard]] std::optional<std::string> scalar_text(const EventDocument& value);

/**
 * @brief Visit every stack frame object in the event.
 *
 * Covers exception.values[*].stacktrace (and exception given directly as an
 * array), a top-level stacktrace, and threads.values[*].stacktrace. Missing
 * or mistyped levels skip only their own branch.
 *
 * @return Number of frames visited
 */
size_t for_each_frame(EventDocument& event,
                      const std::function<void(EventDocument& frame)>& fn);

} // namespace doc

} // namespace eventscrub
