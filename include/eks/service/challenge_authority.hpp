#pragma once

/// @file challenge_authority.hpp
/// @brief Issues proof-of-possession challenges and verifies the answers.

#include <cstdint>
#include <functional>

#include "eks/crypto/public_key.hpp"
#include "eks/crypto/state_cipher.hpp"
#include "eks/foundation/service_result.hpp"
#include "eks/service/key_types.hpp"

namespace eks::service {

/// Stateless challenge issuer.
///
/// Everything needed to check an answer travels with the client inside the
/// sealed state, so any number of challenges may be outstanding and nothing
/// is remembered between issue() and verify(). Immutable after construction
/// and safe to share between threads.
///
/// Example:
/// @code
///   ChallengeAuthority authority(StateCipher::generate().value(), KeyServerConfig{});
///   auto challenge = authority.issue(clientKey);
///   // client decrypts challenge.challenge and echoes it back
///   auto key = authority.verify(response);
/// @endcode
class ChallengeAuthority {
public:
    static constexpr std::size_t kChallengeNonceSize = 32;

    /// Current time as unix seconds.
    using Clock = std::function<int64_t()>;

    ChallengeAuthority(crypto::StateCipher cipher, KeyServerConfig config,
                       Clock clock = systemClock);

    /// Create a challenge for @p pubkey.
    /// @return KeyTooWeak for a small modulus; crypto failures otherwise.
    [[nodiscard]] foundation::ServiceResult<Challenge> issue(
        const crypto::PublicKey& pubkey) const;

    /// Check @p response against the state it carries.
    /// @return The public key sealed in the state, ChallengeFailed or
    ///         ChallengeExpired.
    [[nodiscard]] foundation::ServiceResult<crypto::PublicKey> verify(
        const ChallengeResponse& response) const;

    static int64_t systemClock();

private:
    crypto::StateCipher cipher_;
    KeyServerConfig config_;
    Clock clock_;
};

}  // namespace eks::service
