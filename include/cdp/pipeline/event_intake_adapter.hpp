#pragma once

/// @file event_intake_adapter.hpp
/// @brief Entry point for damage requests: pooled records into a bounded
///        queue with a drop-oldest overflow policy.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>

#include "cdp/combat/damage_types.hpp"
#include "cdp/pipeline/object_pool.hpp"
#include "cdp/pipeline/ring_buffer.hpp"
#include "cdp/pipeline/warning_throttle.hpp"

namespace cdp::pipeline {

struct IntakeConfig {
    /// Queue capacity; rounded up to a power of two.
    std::size_t ringCapacity = 1024;

    /// Pre-allocated DamageRequest records.
    std::size_t requestPoolSize = 1024;

    /// Pre-allocated DamageTagList records.
    std::size_t tagPoolSize = 1024;

    /// Minimum spacing between overflow warnings.
    std::chrono::milliseconds overflowWarningInterval{1000};
};

/// Observability counters maintained by the intake path.
struct IntakeCounters {
    uint64_t enqueued = 0;          ///< Successful pushes (including later evictions).
    uint64_t droppedOverflow = 0;   ///< Oldest requests evicted by drop-oldest.
    uint64_t hardDropped = 0;       ///< New requests discarded because eviction freed no slot.
    uint64_t truncatedTags = 0;     ///< Tags discarded past DamageTagList::kMaxTags.
    std::size_t maxWatermark = 0;   ///< Highest queue depth observed.
};

/// Producer side of the damage pipeline.
///
/// Owns the request queue and both record pools.  SubmitDamage() never
/// fails from the caller's point of view: when the queue is full the
/// oldest queued request is evicted (drop-oldest) and a throttled
/// warning is logged.
///
/// The consumer (BatchProcessor) pulls records with TryDequeue() and
/// must hand each one back through Recycle().
///
/// Not thread-safe: producers and the consumer share the simulation
/// thread.
class EventIntakeAdapter {
public:
    explicit EventIntakeAdapter(IntakeConfig config = {},
                                WarningThrottle::Clock clock = nullptr);

    EventIntakeAdapter(const EventIntakeAdapter&) = delete;
    EventIntakeAdapter& operator=(const EventIntakeAdapter&) = delete;

    ~EventIntakeAdapter();

    /// Queue a damage request.
    void SubmitDamage(combat::EntityId source, combat::EntityId target,
                      int32_t baseAmount, std::span<const combat::DamageTag> tags,
                      std::optional<combat::Vector2> knockback = std::nullopt);

    void SubmitDamage(combat::EntityId source, combat::EntityId target,
                      int32_t baseAmount, std::initializer_list<combat::DamageTag> tags,
                      std::optional<combat::Vector2> knockback = std::nullopt);

    /// Pop the oldest queued request, or nullptr when the queue is empty.
    /// Ownership passes to the caller until Recycle().
    [[nodiscard]] combat::DamageRequest* TryDequeue() noexcept;

    /// Return a dequeued request (and its tag list) to the pools.
    void Recycle(combat::DamageRequest* request);

    /// Recycle everything still queued.  @return the number discarded.
    std::size_t DiscardQueued();

    /// Log overflow drops the warning interval held back, once the
    /// interval has passed.  Called by the consumer every tick.
    /// @return true if a warning was logged.
    bool FlushOverflowWarning();

    /// Peek at the queued request @p offset positions behind the head.
    /// @pre `offset < QueueDepth()`.
    [[nodiscard]] const combat::DamageRequest& QueuedAt(std::size_t offset) const noexcept {
        return *queue_.At(offset);
    }

    [[nodiscard]] std::size_t QueueDepth() const noexcept { return queue_.Count(); }
    [[nodiscard]] std::size_t QueueCapacity() const noexcept { return queue_.Capacity(); }

    [[nodiscard]] const IntakeCounters& Counters() const noexcept { return counters_; }

    [[nodiscard]] const ObjectPool<combat::DamageRequest>& RequestPool() const noexcept {
        return requestPool_;
    }
    [[nodiscard]] const ObjectPool<combat::DamageTagList>& TagPool() const noexcept {
        return tagPool_;
    }

private:
    void recordEnqueued() noexcept;
    void evictOldest();
    void logOverflow(uint64_t dropped) const;

    IntakeConfig config_;
    ObjectPool<combat::DamageRequest> requestPool_;
    ObjectPool<combat::DamageTagList> tagPool_;
    RingBuffer<combat::DamageRequest*> queue_;
    WarningThrottle overflowThrottle_;

    IntakeCounters counters_;
    uint64_t nextSequence_ = 1;
};

}  // namespace cdp::pipeline
