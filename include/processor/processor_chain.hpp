#pragma once

#include "core/error.hpp"
#include "core/event_document.hpp"
#include "processor/processor.hpp"

#include <memory>
#include <string>
#include <vector>

namespace eventscrub {

/**
 * @brief Ordered composition of processors
 *
 * Processors run in the order given at construction; processor i+1 sees the
 * output of processor i. Order is caller configuration: running
 * remove_stack_locals before sanitize_sensitive_fields leaves the sanitizer
 * nothing to do in stack frames.
 *
 * The chain does no inspection of its own. If a processor throws, the chain
 * stops, logs, and returns an error naming that processor; the partially
 * processed event is discarded so it can never reach transport.
 */
class ProcessorChain {
public:
    explicit ProcessorChain(std::vector<std::unique_ptr<IProcessor>> processors);

    /**
     * @brief Run every processor over event
     * @param event Event to sanitize (taken by value, caller's copy untouched)
     * @return Sanitized event, or PROCESSOR_ERROR
     */
    [[nodiscard]] Result<EventDocument> process(EventDocument event) const;

    [[nodiscard]] std::vector<std::string> processor_names() const;
    [[nodiscard]] size_t size() const { return processors_.size(); }
    [[nodiscard]] bool empty() const { return processors_.empty(); }

private:
    std::vector<std::unique_ptr<IProcessor>> processors_;
};

} // namespace eventscrub
