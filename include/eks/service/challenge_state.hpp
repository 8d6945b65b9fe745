#pragma once

/// @file challenge_state.hpp
/// @brief Plaintext of the sealed challenge state and its binary encoding.

#include <cstdint>

#include "eks/foundation/bytes.hpp"
#include "eks/foundation/service_result.hpp"

namespace eks::service {

/// What the server needs to remember about an outstanding challenge.
struct ChallengeState {
    foundation::Bytes challengeNonce;
    foundation::Bytes pubkey;  ///< DER SubjectPublicKeyInfo
    int64_t issuedAt = 0;      ///< unix seconds
};

inline constexpr uint8_t kChallengeStateVersion = 1;

/// Little-endian layout:
///   u8 version | i64 issuedAt | u32 len | nonce | u32 len | pubkey
[[nodiscard]] foundation::Bytes encodeChallengeState(const ChallengeState& state);

/// Inverse of encodeChallengeState().
/// @return MalformedState on an unknown version, truncation or trailing bytes.
[[nodiscard]] foundation::ServiceResult<ChallengeState> decodeChallengeState(
    const foundation::Bytes& data);

}  // namespace eks::service
