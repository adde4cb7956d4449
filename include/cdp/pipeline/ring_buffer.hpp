#pragma once

/// @file ring_buffer.hpp
/// @brief Fixed-capacity circular FIFO of opaque handles.
///
/// Storage is allocated once at construction and never resized; the
/// capacity is rounded up to a power of two so index wrap-around is a
/// single mask.  Intended for single-producer / single-consumer use on
/// the simulation thread, so no synchronization is performed.

#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <vector>

namespace cdp::pipeline {

/// Bounded circular queue.
///
/// Memory layout:
/// @code
///   slots_[head_ & mask_]            -> oldest queued item
///   slots_[(head_ + count_ - 1) & mask_] -> newest queued item
/// @endcode
///
/// @tparam T A cheap-to-copy handle type (typically a pointer).
template <typename T>
class RingBuffer {
public:
    static_assert(std::is_nothrow_copy_assignable_v<T>,
                  "RingBuffer stores handles; T must be nothrow copy-assignable");

    /// Construct with at least @p requestedCapacity slots.
    ///
    /// The effective capacity is the next power of two (minimum 1).
    explicit RingBuffer(std::size_t requestedCapacity)
        : slots_(std::bit_ceil(requestedCapacity > 0 ? requestedCapacity : 1)),
          mask_(slots_.size() - 1) {}

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;
    RingBuffer(RingBuffer&&) = delete;
    RingBuffer& operator=(RingBuffer&&) = delete;

    /// Append @p item at the tail.
    /// @return false (and leaves the queue untouched) when full.
    bool TryPush(T item) noexcept {
        if (IsFull()) {
            return false;
        }
        slots_[(head_ + count_) & mask_] = item;
        ++count_;
        return true;
    }

    /// Remove and return the oldest item, or nullopt when empty.
    std::optional<T> TryPop() noexcept {
        if (IsEmpty()) {
            return std::nullopt;
        }
        T item = slots_[head_];
        slots_[head_] = T{};
        head_ = (head_ + 1) & mask_;
        --count_;
        return item;
    }

    /// Peek at the oldest item without removing it.
    [[nodiscard]] std::optional<T> Front() const noexcept {
        if (IsEmpty()) {
            return std::nullopt;
        }
        return slots_[head_];
    }

    /// Peek at the item @p offset positions behind the head.
    /// @pre `offset < Count()`.
    [[nodiscard]] const T& At(std::size_t offset) const noexcept {
        return slots_[(head_ + offset) & mask_];
    }

    /// Drop every queued item without touching capacity.
    void Clear() noexcept {
        for (auto& slot : slots_) {
            slot = T{};
        }
        head_ = 0;
        count_ = 0;
    }

    [[nodiscard]] std::size_t Count() const noexcept { return count_; }
    [[nodiscard]] std::size_t Capacity() const noexcept { return slots_.size(); }
    [[nodiscard]] bool IsEmpty() const noexcept { return count_ == 0; }
    [[nodiscard]] bool IsFull() const noexcept { return count_ == slots_.size(); }

private:
    std::vector<T> slots_;
    std::size_t mask_ = 0;
    std::size_t head_ = 0;
    std::size_t count_ = 0;
};

}  // namespace cdp::pipeline
