#pragma once

/// @file key_server.hpp
/// @brief Key registration service: challenge issue, proof check, lookup.

#include <memory>
#include <string_view>

#include "eks/foundation/service_result.hpp"
#include "eks/service/challenge_authority.hpp"
#include "eks/service/key_types.hpp"

namespace eks::foundation {
class ServiceMetrics;
}

namespace eks::service {

class IKeyRepository;

/// Orchestrates ChallengeAuthority and an IKeyRepository.
///
/// Thread-safe: the authority is immutable and repositories synchronize
/// internally.
///
/// Example:
/// @code
///   auto repo = std::make_shared<InMemoryKeyRepository>();
///   KeyServer server(KeyServerConfig{}, StateCipher::generate().value(), repo, metrics);
///   auto challenge = server.issueChallenge(request);
///   auto record = server.submitResponse(response);
///   auto der = server.lookupKey("alice");
/// @endcode
class KeyServer {
public:
    KeyServer(KeyServerConfig config,
              crypto::StateCipher cipher,
              std::shared_ptr<IKeyRepository> repository,
              foundation::ServiceMetrics& metrics,
              ChallengeAuthority::Clock clock = ChallengeAuthority::systemClock);

    ~KeyServer();

    KeyServer(const KeyServer&) = delete;
    KeyServer& operator=(const KeyServer&) = delete;

    /// Parse the client's key and issue a challenge for it.
    /// @return InvalidKey, UnsupportedKeyType or KeyTooWeak for an unusable
    ///         key; crypto errors otherwise.
    [[nodiscard]] foundation::ServiceResult<Challenge> issueChallenge(
        const ChallengeRequest& request);

    /// Verify the answer and register the sealed key under the given name.
    /// @return InvalidName, ChallengeFailed, ChallengeExpired, NameTaken or a
    ///         storage error.
    [[nodiscard]] foundation::ServiceResult<KeyRecord> submitResponse(
        const ChallengeResponse& response);

    /// DER public key registered under @p name, or KeyNotFound.
    [[nodiscard]] foundation::ServiceResult<foundation::Bytes> lookupKey(std::string_view name);

    /// Names must be 1..maxNameLength bytes without ASCII control characters.
    [[nodiscard]] bool isValidName(std::string_view name) const;

private:
    KeyServerConfig config_;
    ChallengeAuthority authority_;
    std::shared_ptr<IKeyRepository> repository_;
    foundation::ServiceMetrics& metrics_;
};

/// Decode whichever encoding the client used.
[[nodiscard]] foundation::ServiceResult<crypto::PublicKey> parsePublicKey(
    const EncodedPublicKey& encoded);

}  // namespace eks::service
