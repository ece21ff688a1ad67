#pragma once

#include "core/event_document.hpp"
#include <string_view>

namespace eventscrub {

/**
 * @brief Abstract event processor interface
 *
 * Each processor transforms one event in place. Processors are composed
 * into a ProcessorChain and executed sequentially, each one seeing the
 * output of the previous one.
 *
 * Processors are immutable after construction: process() is const and
 * keeps no state between events, so one instance may serve many threads.
 * Missing or mistyped subtrees are skipped, never reported.
 */
class IProcessor {
public:
    virtual ~IProcessor() = default;

    /**
     * @brief Transform event in place
     * @param event Mutable event document
     */
    virtual void process(EventDocument& event) const = 0;

    /**
     * @brief Stable identifier used in configuration and logging
     */
    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace eventscrub
