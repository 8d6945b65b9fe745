#pragma once

/// @file types.hpp
/// @brief Strong ID types used by the key registry.

#include <cstdint>
#include <functional>

namespace eks::foundation {

/// Tag-based strong typedef that keeps unrelated IDs from mixing.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = int64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ > 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct KeyIdTag {};

/// Row id of a registered key (SQLite INTEGER PRIMARY KEY).
using KeyId = StrongId<KeyIdTag>;

}  // namespace eks::foundation

template <typename Tag, typename T>
struct std::hash<eks::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const eks::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
