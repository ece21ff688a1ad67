#include "processor/remove_post_data_processor.hpp"
#include "core/utils.hpp"

#include <format>

namespace eventscrub {

void RemovePostDataProcessor::process(EventDocument& event) const {
    auto* request = doc::find_object(event, {doc::kRequest});
    if (!request) return;

    if (doc::erase_key(*request, doc::kData)) {
        utils::log::debug(std::format("{}: removed request body", kName));
    }
}

} // namespace eventscrub
