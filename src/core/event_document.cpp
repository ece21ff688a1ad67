#include "core/event_document.hpp"

namespace eventscrub::doc {

namespace {

template <typename Node>
Node* walk(Node& root, std::initializer_list<std::string_view> path) {
    Node* node = &root;
    for (const auto key : path) {
        if (!node->is_object()) return nullptr;
        const auto it = node->find(std::string(key));
        if (it == node->end()) return nullptr;
        node = &*it;
    }
    return node;
}

size_t visit_stacktrace(EventDocument* stacktrace,
                        const std::function<void(EventDocument&)>& fn) {
    if (!stacktrace) return 0;
    auto* frames = find_array(*stacktrace, {kFrames});
    if (!frames) return 0;

    size_t visited = 0;
    for (auto& frame : *frames) {
        if (!frame.is_object()) continue;
        fn(frame);
        ++visited;
    }
    return visited;
}

size_t visit_values(EventDocument* values,
                    const std::function<void(EventDocument&)>& fn) {
    if (!values || !values->is_array()) return 0;

    size_t visited = 0;
    for (auto& value : *values) {
        visited += visit_stacktrace(find_object(value, {kStacktrace}), fn);
    }
    return visited;
}

} // anonymous namespace

EventDocument* find_path(EventDocument& root,
                         std::initializer_list<std::string_view> path) {
    return walk(root, path);
}

const EventDocument* find_path(const EventDocument& root,
                               std::initializer_list<std::string_view> path) {
    return walk(root, path);
}

EventDocument* find_object(EventDocument& root,
                           std::initializer_list<std::string_view> path) {
    auto* node = find_path(root, path);
    return (node && node->is_object()) ? node : nullptr;
}

EventDocument* find_array(EventDocument& root,
                          std::initializer_list<std::string_view> path) {
    auto* node = find_path(root, path);
    return (node && node->is_array()) ? node : nullptr;
}

bool erase_key(EventDocument& node, std::string_view key) {
    if (!node.is_object()) return false;
    return node.erase(std::string(key)) > 0;
}

std::optional<std::string> scalar_text(const EventDocument& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number()) return value.dump();
    return std::nullopt;
}

size_t for_each_frame(EventDocument& event,
                      const std::function<void(EventDocument& frame)>& fn) {
    size_t visited = 0;

    // exception: {"values": [...]} or a bare array of exception values
    if (auto* exception = find_path(event, {kException})) {
        if (exception->is_array()) {
            visited += visit_values(exception, fn);
        } else {
            visited += visit_values(find_array(*exception, {kValues}), fn);
        }
    }

    visited += visit_stacktrace(find_object(event, {kStacktrace}), fn);
    visited += visit_values(find_array(event, {kThreads, kValues}), fn);
    return visited;
}

} // namespace eventscrub::doc
