#include "cdp/pipeline/payload_reset.hpp"

namespace cdp::pipeline {

void ResetPayload(combat::DamageRequest& request) noexcept {
    request.sequence = 0;
    request.source = foundation::EntityId{};
    request.target = foundation::EntityId{};
    request.baseAmount = 0;
    // The tag list is released to its own pool by the owner first;
    // only the borrowed pointer is dropped here.
    request.tags = nullptr;
    request.knockback.reset();
}

void ResetPayload(combat::DamageTagList& tags) noexcept {
    tags.count = 0;
}

}  // namespace cdp::pipeline
