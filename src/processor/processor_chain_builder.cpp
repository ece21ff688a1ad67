#include "processor/processor_chain_builder.hpp"
#include "processor/processor_factory.hpp"
#include "config/config_types.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace eventscrub {

ProcessorChainBuilder ProcessorChainBuilder::from_config(const ScrubberConfig& config) {
    ProcessorChainBuilder builder;
    builder.with_sanitizer_config(config.sanitizer);
    for (const auto& id : config.processors) {
        builder.with_processor(id);
    }
    return builder;
}

std::shared_ptr<ProcessorChain> ProcessorChainBuilder::build() {
    if (steps_.empty()) throw std::runtime_error("ProcessorChainBuilder: at least one processor is required");

    std::vector<std::unique_ptr<IProcessor>> processors;
    processors.reserve(steps_.size());

    for (auto& step : steps_) {
        if (auto* id = std::get_if<std::string>(&step)) {
            processors.push_back(create_processor(*id, sanitizer_));
        } else {
            auto& processor = std::get<std::unique_ptr<IProcessor>>(step);
            if (!processor) throw std::invalid_argument("ProcessorChainBuilder: null processor");
            processors.push_back(std::move(processor));
        }
    }
    steps_.clear();

    auto chain = std::make_shared<ProcessorChain>(std::move(processors));

    std::string order;
    for (const auto& name : chain->processor_names()) {
        if (!order.empty()) order += " -> ";
        order += name;
    }
    utils::log::info(std::format("Processor chain built: {}", order));
    return chain;
}

} // namespace eventscrub
