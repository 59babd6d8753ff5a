#pragma once

/// @file types.hpp
/// @brief Strong ID template shared across subsystems.

#include <compare>
#include <cstdint>
#include <functional>

namespace npc::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of different ID types at compile time
/// while keeping the same underlying representation.
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

} // namespace npc::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<npc::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const npc::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
