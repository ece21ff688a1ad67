#include "processor/processor_chain.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace eventscrub {

ProcessorChain::ProcessorChain(std::vector<std::unique_ptr<IProcessor>> processors)
    : processors_(std::move(processors)) {
    for (const auto& processor : processors_) {
        if (!processor) {
            throw std::invalid_argument("ProcessorChain: null processor");
        }
    }
}

Result<EventDocument> ProcessorChain::process(EventDocument event) const {
    for (const auto& processor : processors_) {
        try {
            processor->process(event);
        } catch (const std::exception& e) {
            auto result = Result<EventDocument>::error(
                ErrorCategory::PROCESSOR_ERROR, std::string(processor->name()), e.what());
            utils::log::error(std::format("Processor chain aborted, event dropped: {}",
                                          result.error_message()));
            return result;
        }
    }
    return Result<EventDocument>::ok(std::move(event));
}

std::vector<std::string> ProcessorChain::processor_names() const {
    std::vector<std::string> names;
    names.reserve(processors_.size());
    for (const auto& processor : processors_) {
        names.emplace_back(processor->name());
    }
    return names;
}

} // namespace eventscrub
