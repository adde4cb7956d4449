#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> observer used for the pipeline's outward
///        notifications (health changed, death, damage result).
///
/// Slots are held in an immutable, reference-counted list that is
/// rebuilt on connect() / disconnect().  emit() only copies the list
/// pointer, so firing a signal on the simulation thread never allocates
/// and slots may safely connect or disconnect from inside a callback.

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace cdp::foundation {

/// Observer-pattern signal dispatching to registered callbacks.
///
/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<EntityId> onDeath;
///   auto id = onDeath.connect([](EntityId who) {
///       rewards.grant(who);
///   });
///   onDeath.emit(EntityId(42));
///   onDeath.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;
    ~Signal() = default;

    // Non-copyable. Movable with custom move (std::shared_mutex is not movable).
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    Signal(Signal&& other) noexcept {
        std::unique_lock lock(other.mutex_);
        slots_ = std::move(other.slots_);
        nextId_.store(other.nextId_.load(std::memory_order_relaxed),
                      std::memory_order_relaxed);
    }

    Signal& operator=(Signal&& other) noexcept {
        if (this != &other) {
            // Lock both, always in address order to prevent deadlock
            auto* first = this < &other ? this : &other;
            auto* second = this < &other ? &other : this;
            std::unique_lock lock1(first->mutex_);
            std::unique_lock lock2(second->mutex_);
            slots_ = std::move(other.slots_);
            nextId_.store(other.nextId_.load(std::memory_order_relaxed),
                          std::memory_order_relaxed);
        }
        return *this;
    }

    /// Register a callback. Returns a SlotId for later disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(mutex_);
        auto next = slots_ ? std::make_shared<SlotList>(*slots_)
                           : std::make_shared<SlotList>();
        next->emplace_back(id, std::move(slot));
        slots_ = std::move(next);
        return id;
    }

    /// Remove a previously registered callback by its SlotId.
    void disconnect(SlotId id) {
        std::unique_lock lock(mutex_);
        if (!slots_) {
            return;
        }
        auto next = std::make_shared<SlotList>();
        next->reserve(slots_->size());
        for (const auto& entry : *slots_) {
            if (entry.first != id) {
                next->push_back(entry);
            }
        }
        slots_ = std::move(next);
    }

    /// Remove every registered callback.
    void disconnectAll() {
        std::unique_lock lock(mutex_);
        slots_.reset();
    }

    /// Fire the signal, invoking every registered slot in connection order.
    void emit(Args... args) const {
        std::shared_ptr<const SlotList> snapshot;
        {
            std::shared_lock lock(mutex_);
            snapshot = slots_;
        }
        if (!snapshot) {
            return;
        }
        for (const auto& entry : *snapshot) {
            entry.second(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const {
        std::shared_lock lock(mutex_);
        return slots_ ? slots_->size() : 0;
    }

private:
    using SlotList = std::vector<std::pair<SlotId, Slot>>;

    std::shared_ptr<const SlotList> slots_;
    std::atomic<SlotId> nextId_{1};
    mutable std::shared_mutex mutex_;
};

} // namespace cdp::foundation
