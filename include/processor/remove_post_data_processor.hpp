#pragma once

#include "processor/processor.hpp"

namespace eventscrub {

/**
 * @brief Drops the request body (request.data) entirely
 *
 * For deployments that want no body at all, not even key-level redaction.
 * Other request fields are left alone.
 */
class RemovePostDataProcessor final : public IProcessor {
public:
    static constexpr std::string_view kName = "remove_post_data";

    void process(EventDocument& event) const override;
    [[nodiscard]] std::string_view name() const override { return kName; }
};

} // namespace eventscrub
