#pragma once

/// @file batch_processor.hpp
/// @brief Per-tick consumer that drains the intake queue into the resolver.

#include <cstddef>
#include <cstdint>

#include "cdp/combat/damage_resolver.hpp"
#include "cdp/combat/damage_types.hpp"
#include "cdp/combat/entity_registry.hpp"
#include "cdp/foundation/signal.hpp"
#include "cdp/pipeline/event_intake_adapter.hpp"

namespace cdp::pipeline {

/// Consumer-side counters.
struct BatchCounters {
    uint64_t processed = 0;      ///< Requests dequeued (resolved or discarded).
    uint64_t resolved = 0;       ///< Requests that produced a DamageResult.
    uint64_t unknownSource = 0;  ///< Discarded: source not registered.
    uint64_t unknownTarget = 0;  ///< Discarded: target not registered.
    uint64_t deadTarget = 0;     ///< Discarded: target registered but dead.

    /// Requests discarded for any target reason.
    [[nodiscard]] uint64_t InvalidTargets() const noexcept {
        return unknownTarget + deadTarget;
    }
};

/// Point-in-time view of the whole pipeline.
struct PipelineStats {
    IntakeCounters intake;
    BatchCounters batch;
    uint64_t tick = 0;
    std::size_t queueDepth = 0;
    std::size_t queueCapacity = 0;
    uint64_t requestPoolOverflows = 0;
    uint64_t tagPoolOverflows = 0;
    std::size_t requestsInUse = 0;
    std::size_t tagListsInUse = 0;
};

/// Drains up to a fixed number of requests per simulation tick.
///
/// For each request the source and target are looked up; requests from
/// an unknown source, or aimed at an unknown or dead target, are logged
/// and discarded.  Everything else goes to DamageResolver, and the
/// outcome is published through OnDamageResult().  Every dequeued record
/// is recycled before the next one is taken.
///
/// Requests past the per-tick ceiling stay queued for later ticks.
class BatchProcessor {
public:
    BatchProcessor(EventIntakeAdapter& intake,
                   combat::EntityRegistry& registry,
                   combat::DamageResolver& resolver,
                   std::size_t maxPerTick);

    BatchProcessor(const BatchProcessor&) = delete;
    BatchProcessor& operator=(const BatchProcessor&) = delete;

    /// Process one tick's batch and advance the tick index.
    /// @return Number of requests dequeued this tick.
    std::size_t ProcessTick();

    /// Index of the next tick to be processed.
    [[nodiscard]] uint64_t CurrentTick() const noexcept { return tick_; }

    [[nodiscard]] std::size_t MaxPerTick() const noexcept { return maxPerTick_; }

    [[nodiscard]] const BatchCounters& Counters() const noexcept { return counters_; }

    [[nodiscard]] PipelineStats Stats() const;

    /// Fired once per resolved request, in resolution order.
    [[nodiscard]] foundation::Signal<const combat::DamageResult&>& OnDamageResult() noexcept {
        return onDamageResult_;
    }

private:
    /// @return true if the request was handed to the resolver.
    bool processOne(const combat::DamageRequest& request);

    EventIntakeAdapter& intake_;
    combat::EntityRegistry& registry_;
    combat::DamageResolver& resolver_;
    std::size_t maxPerTick_;

    BatchCounters counters_;
    uint64_t tick_ = 0;

    foundation::Signal<const combat::DamageResult&> onDamageResult_;
};

}  // namespace cdp::pipeline
