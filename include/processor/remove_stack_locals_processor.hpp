#pragma once

#include "processor/processor.hpp"

namespace eventscrub {

/**
 * @brief Drops the vars mapping from every stack frame
 *
 * Frames themselves are kept in number and order; only local-variable
 * capture is removed.
 */
class RemoveStackLocalsProcessor final : public IProcessor {
public:
    static constexpr std::string_view kName = "remove_stack_locals";

    void process(EventDocument& event) const override;
    [[nodiscard]] std::string_view name() const override { return kName; }
};

} // namespace eventscrub
