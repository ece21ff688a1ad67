#include "processor/remove_stack_locals_processor.hpp"
#include "core/utils.hpp"

#include <format>

namespace eventscrub {

void RemoveStackLocalsProcessor::process(EventDocument& event) const {
    size_t removed = 0;
    const size_t frames = doc::for_each_frame(event, [&removed](EventDocument& frame) {
        if (doc::erase_key(frame, doc::kVars)) ++removed;
    });

    if (removed > 0) {
        utils::log::debug(std::format("{}: removed vars from {}/{} frames",
            kName, removed, frames));
    }
}

} // namespace eventscrub
