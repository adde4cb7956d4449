#pragma once

/// @file types.hpp
/// @brief Strong identifier types shared by every pipeline layer.

#include <cstdint>
#include <functional>

namespace cdp::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of an entity identity with a plain
/// counter or a storage slot index at compile time while keeping the
/// same underlying representation.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct EntityIdTag {};

/// Stable combatant identity.
///
/// Issued once at spawn time (EntityRegistry::AllocateId) and never a
/// transient storage handle.  Value 0 is the null identity.
using EntityId = StrongId<EntityIdTag>;

/// Invalid/null sentinel for any ID type.
template <typename Tag, typename T>
constexpr StrongId<Tag, T> NULL_ID{};

} // namespace cdp::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<cdp::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const cdp::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
