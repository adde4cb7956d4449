#pragma once

/// @file object_pool.hpp
/// @brief Pre-allocated pool of reusable records with a soft-overflow
///        escape valve.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "cdp/foundation/game_logger.hpp"

namespace cdp::pipeline {

/// Fixed-size record pool.
///
/// All records are created up front by the factory and owned by the
/// pool for its whole lifetime; callers only ever borrow raw pointers
/// between Acquire() and Release().  When the free list is empty the
/// pool calls the factory once more rather than failing ("soft
/// overflow"); every such event is counted and logged so the configured
/// size can be tuned.
///
/// A record must be released exactly once per acquire.  Releasing a
/// record that did not come from this pool is undefined.
///
/// Usage:
/// @code
///   ObjectPool<DamageRequest> pool("requests", 1024,
///       [] { return std::make_unique<DamageRequest>(); },
///       [](DamageRequest& r) { ResetPayload(r); });
///   auto* req = pool.Acquire();
///   ...
///   pool.Release(req);
/// @endcode
template <typename T>
class ObjectPool {
public:
    using Factory = std::function<std::unique_ptr<T>()>;
    using Reset = std::function<void(T&)>;

    ObjectPool(std::string name, std::size_t capacity, Factory factory, Reset reset)
        : name_(std::move(name)),
          capacity_(capacity),
          factory_(std::move(factory)),
          reset_(std::move(reset)) {
        owned_.reserve(capacity_);
        free_.reserve(capacity_);
        for (std::size_t i = 0; i < capacity_; ++i) {
            owned_.push_back(factory_());
            free_.push_back(owned_.back().get());
        }
    }

    ObjectPool(const ObjectPool&) = delete;
    ObjectPool& operator=(const ObjectPool&) = delete;

    /// Borrow a record.  Never returns nullptr.
    [[nodiscard]] T* Acquire() {
        if (!free_.empty()) {
            T* record = free_.back();
            free_.pop_back();
            return record;
        }

        ++softOverflows_;
        CDP_LOG_WARN(foundation::LogCategory::Pool,
                     "pool '" + name_ + "' exhausted; soft-overflow allocation #" +
                         std::to_string(softOverflows_) + " (configured size " +
                         std::to_string(capacity_) + ")");
        owned_.push_back(factory_());
        return owned_.back().get();
    }

    /// Reset @p record and return it to the free list.
    void Release(T* record) {
        if (record == nullptr) {
            CDP_LOG_DEBUG(foundation::LogCategory::Pool,
                          "pool '" + name_ + "' ignored release of null record");
            return;
        }
        reset_(*record);
        free_.push_back(record);
    }

    /// Records currently available without soft overflow.
    [[nodiscard]] std::size_t FreeCount() const noexcept { return free_.size(); }

    /// Configured (pre-allocated) size.
    [[nodiscard]] std::size_t Capacity() const noexcept { return capacity_; }

    /// Records ever created, including soft-overflow allocations.
    [[nodiscard]] std::size_t TotalCreated() const noexcept { return owned_.size(); }

    /// Records currently borrowed.
    [[nodiscard]] std::size_t InUse() const noexcept { return owned_.size() - free_.size(); }

    [[nodiscard]] uint64_t SoftOverflowCount() const noexcept { return softOverflows_; }

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

private:
    std::string name_;
    std::size_t capacity_;
    Factory factory_;
    Reset reset_;

    std::vector<std::unique_ptr<T>> owned_;
    std::vector<T*> free_;
    uint64_t softOverflows_ = 0;
};

}  // namespace cdp::pipeline
