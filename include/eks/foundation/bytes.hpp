#pragma once

/// @file bytes.hpp
/// @brief Byte-string alias and hex helpers shared by the crypto, storage
///        and wire layers.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eks::foundation {

using Bytes = std::vector<uint8_t>;

/// Lower-case hex encoding.
[[nodiscard]] std::string toHex(const Bytes& data);

/// Decode hex (either case). Returns nullopt on odd length or a non-hex digit.
[[nodiscard]] std::optional<Bytes> fromHex(std::string_view hex);

/// View a string's bytes as Bytes.
[[nodiscard]] inline Bytes toBytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

}  // namespace eks::foundation
