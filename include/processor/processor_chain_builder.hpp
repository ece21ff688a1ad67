#pragma once

#include "processor/processor_chain.hpp"
#include "processor/sanitize_sensitive_fields_processor.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace eventscrub {

struct ScrubberConfig;

/**
 * @brief Builder pattern for ProcessorChain construction.
 *
 * Usage:
 *   auto chain = ProcessorChainBuilder()
 *       .with_sanitizer_config(cfg)            // applies to identifiers below
 *       .with_processor("remove_stack_locals")
 *       .with_processor("sanitize_sensitive_fields")
 *       .build();
 *
 * Identifiers are resolved in build(), so with_sanitizer_config() may be
 * called at any point before it.
 */
class ProcessorChainBuilder {
public:
    /**
     * @brief Builder preloaded with the sanitizer settings and processor
     * order of a loaded configuration.
     */
    [[nodiscard]] static ProcessorChainBuilder from_config(const ScrubberConfig& config);

    ProcessorChainBuilder& with_processor(std::string id)                  { steps_.emplace_back(std::move(id)); return *this; }
    ProcessorChainBuilder& with_processor(std::unique_ptr<IProcessor> p)   { steps_.emplace_back(std::move(p)); return *this; }
    ProcessorChainBuilder& with_sanitizer_config(SanitizeSensitiveFieldsProcessor::Config c) { sanitizer_ = std::move(c); return *this; }

    /**
     * @brief Build the chain from accumulated steps.
     * @throws std::invalid_argument for unknown identifiers or null processors.
     * @throws std::runtime_error if no processor was added.
     */
    [[nodiscard]] std::shared_ptr<ProcessorChain> build();

private:
    using Step = std::variant<std::string, std::unique_ptr<IProcessor>>;

    std::vector<Step> steps_;
    SanitizeSensitiveFieldsProcessor::Config sanitizer_;
};

} // namespace eventscrub
