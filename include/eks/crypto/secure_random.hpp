#pragma once

/// @file secure_random.hpp
/// @brief Bytes from OpenSSL's CSPRNG.

#include <cstddef>
#include <cstdint>

#include "eks/foundation/bytes.hpp"
#include "eks/foundation/service_result.hpp"

namespace eks::crypto {

/// Draw @p count bytes from RAND_bytes.
/// @return The bytes, or RandomFailed when the generator is unavailable.
[[nodiscard]] foundation::ServiceResult<foundation::Bytes> randomBytes(std::size_t count);

/// Fill @p out with @p count random bytes.
[[nodiscard]] foundation::ServiceResult<void> fillRandom(uint8_t* out, std::size_t count);

}  // namespace eks::crypto
