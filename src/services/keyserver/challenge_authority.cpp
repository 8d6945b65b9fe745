/// @file challenge_authority.cpp
/// @brief ChallengeAuthority implementation.

#include "eks/service/challenge_authority.hpp"

#include <chrono>

#include <openssl/crypto.h>

#include "eks/crypto/secure_random.hpp"
#include "eks/foundation/service_logger.hpp"
#include "eks/service/challenge_state.hpp"

namespace eks::service {

using foundation::Bytes;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

ServiceResult<crypto::PublicKey> failed(std::string reason) {
    EKS_LOG_DEBUG(LogCategory::Crypto, "challenge rejected: " + reason);
    return ServiceResult<crypto::PublicKey>::err(
        ServiceError(ErrorCode::ChallengeFailed, std::move(reason)));
}

}  // anonymous namespace

ChallengeAuthority::ChallengeAuthority(crypto::StateCipher cipher, KeyServerConfig config,
                                       Clock clock)
    : cipher_(std::move(cipher)), config_(config), clock_(std::move(clock)) {}

int64_t ChallengeAuthority::systemClock() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

ServiceResult<Challenge> ChallengeAuthority::issue(const crypto::PublicKey& pubkey) const {
    auto strongEnough = pubkey.requireMinimumBits(config_.minRsaBits);
    if (strongEnough.hasError()) {
        return ServiceResult<Challenge>::err(strongEnough.error());
    }

    auto nonce = crypto::randomBytes(kChallengeNonceSize);
    if (nonce.hasError()) {
        return ServiceResult<Challenge>::err(nonce.error());
    }

    ChallengeState state;
    state.challengeNonce = nonce.value();
    state.pubkey = pubkey.der();
    state.issuedAt = clock_();

    auto sealed = cipher_.seal(encodeChallengeState(state));
    OPENSSL_cleanse(state.challengeNonce.data(), state.challengeNonce.size());
    if (sealed.hasError()) {
        return ServiceResult<Challenge>::err(sealed.error());
    }

    auto encrypted = pubkey.encrypt(nonce.value());
    OPENSSL_cleanse(nonce.value().data(), nonce.value().size());
    if (encrypted.hasError()) {
        return ServiceResult<Challenge>::err(encrypted.error());
    }

    Challenge challenge;
    challenge.challenge = std::move(encrypted).value();
    challenge.state = std::move(sealed.value().ciphertext);
    challenge.nonce = std::move(sealed.value().nonce);
    return ServiceResult<Challenge>::ok(std::move(challenge));
}

ServiceResult<crypto::PublicKey> ChallengeAuthority::verify(
    const ChallengeResponse& response) const {
    if (response.nonce.size() != crypto::StateCipher::kNonceSize) {
        return failed("nonce must be 12 bytes");
    }

    auto plaintext = cipher_.open(response.state, response.nonce);
    if (plaintext.hasError()) {
        return failed("state did not authenticate");
    }

    auto state = decodeChallengeState(plaintext.value());
    if (state.hasError()) {
        return failed(std::string(state.error().message()));
    }

    const auto now = clock_();
    const auto issuedAt = state.value().issuedAt;
    // A TTL of zero turns off expiry, never the future issue-time bound.
    const bool pastTtl =
        config_.challengeTtl.count() > 0 && now - issuedAt > config_.challengeTtl.count();
    const bool issuedAhead = issuedAt - now > config_.maxClockSkew.count();
    if (pastTtl || issuedAhead) {
        EKS_LOG_DEBUG(LogCategory::Crypto, "challenge rejected: expired");
        return ServiceResult<crypto::PublicKey>::err(
            ServiceError(ErrorCode::ChallengeExpired, "challenge expired"));
    }

    const auto& expected = state.value().challengeNonce;
    if (expected.size() != response.response.size() ||
        CRYPTO_memcmp(expected.data(), response.response.data(), expected.size()) != 0) {
        return failed("response does not match challenge");
    }

    auto key = crypto::PublicKey::fromDer(state.value().pubkey);
    if (key.hasError()) {
        return failed("sealed public key is unreadable");
    }
    return key;
}

}  // namespace eks::service
