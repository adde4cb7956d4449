/// @file event_intake_adapter.cpp
/// @brief EventIntakeAdapter implementation.

#include "cdp/pipeline/event_intake_adapter.hpp"

#include <algorithm>
#include <memory>
#include <string>

#include "cdp/foundation/game_logger.hpp"
#include "cdp/pipeline/payload_reset.hpp"

namespace cdp::pipeline {

using combat::DamageRequest;
using combat::DamageTag;
using combat::DamageTagList;
using foundation::LogCategory;

EventIntakeAdapter::EventIntakeAdapter(IntakeConfig config, WarningThrottle::Clock clock)
    : config_(config),
      requestPool_("damage_requests", config_.requestPoolSize,
                   [] { return std::make_unique<DamageRequest>(); },
                   [](DamageRequest& r) { ResetPayload(r); }),
      tagPool_("damage_tags", config_.tagPoolSize,
               [] { return std::make_unique<DamageTagList>(); },
               [](DamageTagList& t) { ResetPayload(t); }),
      queue_(config_.ringCapacity),
      overflowThrottle_(config_.overflowWarningInterval, std::move(clock)) {}

EventIntakeAdapter::~EventIntakeAdapter() {
    // Queued records are owned by the pools; nothing to free, but keep
    // pool accounting consistent for anyone inspecting it during teardown.
    DiscardQueued();
}

// ── Producer side ───────────────────────────────────────────────────────

void EventIntakeAdapter::SubmitDamage(combat::EntityId source, combat::EntityId target,
                                      int32_t baseAmount,
                                      std::initializer_list<DamageTag> tags,
                                      std::optional<combat::Vector2> knockback) {
    SubmitDamage(source, target, baseAmount,
                 std::span<const DamageTag>(tags.begin(), tags.size()), knockback);
}

void EventIntakeAdapter::SubmitDamage(combat::EntityId source, combat::EntityId target,
                                      int32_t baseAmount, std::span<const DamageTag> tags,
                                      std::optional<combat::Vector2> knockback) {
    // Make room first so the evicted records are back in the pools
    // before this request borrows from them.
    if (queue_.IsFull()) {
        evictOldest();
    }

    auto* tagList = tagPool_.Acquire();
    for (auto tag : tags) {
        if (!tagList->Add(tag)) {
            ++counters_.truncatedTags;
        }
    }

    auto* request = requestPool_.Acquire();
    request->sequence = nextSequence_++;
    request->source = source;
    request->target = target;
    request->baseAmount = baseAmount;
    request->tags = tagList;
    request->knockback = knockback;

    if (queue_.TryPush(request)) {
        recordEnqueued();
        return;
    }

    ++counters_.hardDropped;
    CDP_LOG_ERROR(LogCategory::Pipeline,
                  "damage request " + std::to_string(request->sequence) +
                      " discarded: queue still full after dropping oldest (" +
                      std::to_string(counters_.hardDropped) + " hard drops)");
    Recycle(request);
}

void EventIntakeAdapter::recordEnqueued() noexcept {
    ++counters_.enqueued;
    counters_.maxWatermark = std::max(counters_.maxWatermark, queue_.Count());
}

void EventIntakeAdapter::evictOldest() {
    auto oldest = queue_.TryPop();
    if (!oldest) {
        return;
    }
    Recycle(*oldest);
    ++counters_.droppedOverflow;

    if (auto dropped = overflowThrottle_.Record()) {
        logOverflow(*dropped);
    }
}

bool EventIntakeAdapter::FlushOverflowWarning() {
    auto dropped = overflowThrottle_.Flush();
    if (!dropped) {
        return false;
    }
    logOverflow(*dropped);
    return true;
}

void EventIntakeAdapter::logOverflow(uint64_t dropped) const {
    CDP_LOG_WARN(LogCategory::Pipeline,
                 "damage queue full (capacity " + std::to_string(queue_.Capacity()) +
                     "); dropped " + std::to_string(dropped) +
                     " oldest request(s) since last report, " +
                     std::to_string(counters_.droppedOverflow) + " total");
}

// ── Consumer side ───────────────────────────────────────────────────────

DamageRequest* EventIntakeAdapter::TryDequeue() noexcept {
    auto request = queue_.TryPop();
    return request ? *request : nullptr;
}

void EventIntakeAdapter::Recycle(DamageRequest* request) {
    if (request == nullptr) {
        return;
    }
    if (request->tags != nullptr) {
        tagPool_.Release(request->tags);
    }
    requestPool_.Release(request);
}

std::size_t EventIntakeAdapter::DiscardQueued() {
    std::size_t discarded = 0;
    while (auto* request = TryDequeue()) {
        Recycle(request);
        ++discarded;
    }
    return discarded;
}

}  // namespace cdp::pipeline
