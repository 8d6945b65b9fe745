#include <gtest/gtest.h>

#include <cstdint>
#include <memory>

#include "eks/crypto/public_key.hpp"
#include "eks/crypto/state_cipher.hpp"
#include "eks/foundation/error_code.hpp"
#include "eks/service/challenge_authority.hpp"
#include "support/rsa_test_key.hpp"

using namespace eks::service;
using eks::crypto::PublicKey;
using eks::crypto::StateCipher;
using eks::foundation::Bytes;
using eks::foundation::ErrorCode;
using eks::test::RsaTestKey;

namespace {

constexpr const char* kStateKeyHex =
    "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";

}  // namespace

class ChallengeAuthorityTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = std::make_shared<int64_t>(1700000000);
        authority_ = makeAuthority(KeyServerConfig{});
        auto key = PublicKey::fromDer(RsaTestKey::shared().publicDer());
        ASSERT_TRUE(key.hasValue());
        key_ = std::make_unique<PublicKey>(std::move(key).value());
    }

    std::unique_ptr<ChallengeAuthority> makeAuthority(KeyServerConfig config) {
        auto cipher = StateCipher::fromHex(kStateKeyHex);
        EXPECT_TRUE(cipher.hasValue());
        auto now = now_;
        return std::make_unique<ChallengeAuthority>(std::move(cipher).value(), config,
                                                    [now] { return *now; });
    }

    /// Issue a challenge and answer it the way an honest client would.
    ChallengeResponse answeredChallenge(const ChallengeAuthority& authority) {
        auto challenge = authority.issue(*key_);
        EXPECT_TRUE(challenge.hasValue());
        ChallengeResponse response;
        response.response = RsaTestKey::shared().decrypt(challenge.value().challenge);
        response.state = challenge.value().state;
        response.nonce = challenge.value().nonce;
        response.name = "alice";
        return response;
    }

    std::shared_ptr<int64_t> now_;
    std::unique_ptr<ChallengeAuthority> authority_;
    std::unique_ptr<PublicKey> key_;
};

// =============================================================================
// issue
// =============================================================================

TEST_F(ChallengeAuthorityTest, IssueProducesDecryptableChallenge) {
    auto challenge = authority_->issue(*key_);
    ASSERT_TRUE(challenge.hasValue());

    EXPECT_EQ(challenge.value().challenge.size(), 256u);
    EXPECT_EQ(challenge.value().nonce.size(), StateCipher::kNonceSize);
    EXPECT_FALSE(challenge.value().state.empty());

    auto plain = RsaTestKey::shared().decrypt(challenge.value().challenge);
    EXPECT_EQ(plain.size(), ChallengeAuthority::kChallengeNonceSize);
}

TEST_F(ChallengeAuthorityTest, EachChallengeIsFresh) {
    auto a = authority_->issue(*key_);
    auto b = authority_->issue(*key_);
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_NE(a.value().nonce, b.value().nonce);
    EXPECT_NE(RsaTestKey::shared().decrypt(a.value().challenge),
              RsaTestKey::shared().decrypt(b.value().challenge));
}

TEST_F(ChallengeAuthorityTest, WeakKeyIsRejected) {
    RsaTestKey small(1024);
    auto key = PublicKey::fromDer(small.publicDer());
    ASSERT_TRUE(key.hasValue());

    auto challenge = authority_->issue(key.value());
    ASSERT_TRUE(challenge.hasError());
    EXPECT_EQ(challenge.error().code(), ErrorCode::KeyTooWeak);
}

// =============================================================================
// verify
// =============================================================================

TEST_F(ChallengeAuthorityTest, HonestAnswerReturnsSealedKey) {
    auto response = answeredChallenge(*authority_);
    auto verified = authority_->verify(response);
    ASSERT_TRUE(verified.hasValue());
    EXPECT_TRUE(verified.value() == *key_);
}

TEST_F(ChallengeAuthorityTest, OutstandingChallengesAreIndependent) {
    auto first = answeredChallenge(*authority_);
    auto second = answeredChallenge(*authority_);

    EXPECT_TRUE(authority_->verify(second).hasValue());
    EXPECT_TRUE(authority_->verify(first).hasValue());
}

TEST_F(ChallengeAuthorityTest, AnotherInstanceWithSameKeyVerifies) {
    auto response = answeredChallenge(*authority_);
    auto other = makeAuthority(KeyServerConfig{});
    EXPECT_TRUE(other->verify(response).hasValue());
}

TEST_F(ChallengeAuthorityTest, WrongAnswerFails) {
    auto response = answeredChallenge(*authority_);
    response.response[0] ^= 0x01;

    auto verified = authority_->verify(response);
    ASSERT_TRUE(verified.hasError());
    EXPECT_EQ(verified.error().code(), ErrorCode::ChallengeFailed);
}

TEST_F(ChallengeAuthorityTest, ShortAnswerFails) {
    auto response = answeredChallenge(*authority_);
    response.response.pop_back();

    auto verified = authority_->verify(response);
    ASSERT_TRUE(verified.hasError());
    EXPECT_EQ(verified.error().code(), ErrorCode::ChallengeFailed);
}

TEST_F(ChallengeAuthorityTest, TamperedStateFails) {
    auto response = answeredChallenge(*authority_);
    response.state[response.state.size() / 2] ^= 0x80;

    auto verified = authority_->verify(response);
    ASSERT_TRUE(verified.hasError());
    EXPECT_EQ(verified.error().code(), ErrorCode::ChallengeFailed);
}

TEST_F(ChallengeAuthorityTest, StateFromAnotherServerKeyFails) {
    auto response = answeredChallenge(*authority_);

    auto otherCipher = StateCipher::generate();
    ASSERT_TRUE(otherCipher.hasValue());
    ChallengeAuthority other(std::move(otherCipher).value(), KeyServerConfig{},
                             [this] { return *now_; });

    auto verified = other.verify(response);
    ASSERT_TRUE(verified.hasError());
    EXPECT_EQ(verified.error().code(), ErrorCode::ChallengeFailed);
}

TEST_F(ChallengeAuthorityTest, WrongNonceLengthFails) {
    auto response = answeredChallenge(*authority_);
    response.nonce.resize(8);

    auto verified = authority_->verify(response);
    ASSERT_TRUE(verified.hasError());
    EXPECT_EQ(verified.error().code(), ErrorCode::ChallengeFailed);
}

TEST_F(ChallengeAuthorityTest, SwappedNonceFails) {
    auto first = answeredChallenge(*authority_);
    auto second = answeredChallenge(*authority_);
    first.nonce = second.nonce;

    auto verified = authority_->verify(first);
    ASSERT_TRUE(verified.hasError());
    EXPECT_EQ(verified.error().code(), ErrorCode::ChallengeFailed);
}

// =============================================================================
// Expiry
// =============================================================================

TEST_F(ChallengeAuthorityTest, AnswerWithinTtlIsAccepted) {
    auto response = answeredChallenge(*authority_);
    *now_ += 300;
    EXPECT_TRUE(authority_->verify(response).hasValue());
}

TEST_F(ChallengeAuthorityTest, AnswerAfterTtlIsExpired) {
    auto response = answeredChallenge(*authority_);
    *now_ += 301;

    auto verified = authority_->verify(response);
    ASSERT_TRUE(verified.hasError());
    EXPECT_EQ(verified.error().code(), ErrorCode::ChallengeExpired);
}

TEST_F(ChallengeAuthorityTest, IssueTimeTooFarAheadIsExpired) {
    auto response = answeredChallenge(*authority_);
    *now_ -= 61;

    auto verified = authority_->verify(response);
    ASSERT_TRUE(verified.hasError());
    EXPECT_EQ(verified.error().code(), ErrorCode::ChallengeExpired);
}

TEST_F(ChallengeAuthorityTest, SmallClockSkewIsTolerated) {
    auto response = answeredChallenge(*authority_);
    *now_ -= 60;
    EXPECT_TRUE(authority_->verify(response).hasValue());
}

TEST_F(ChallengeAuthorityTest, ZeroTtlDisablesExpiry) {
    KeyServerConfig config;
    config.challengeTtl = std::chrono::seconds{0};
    auto authority = makeAuthority(config);

    auto response = answeredChallenge(*authority);
    *now_ += 365 * 24 * 3600;
    EXPECT_TRUE(authority->verify(response).hasValue());
}

TEST_F(ChallengeAuthorityTest, ZeroTtlStillRejectsFutureIssueTime) {
    KeyServerConfig config;
    config.challengeTtl = std::chrono::seconds{0};
    auto authority = makeAuthority(config);

    auto response = answeredChallenge(*authority);
    *now_ -= 61;

    auto verified = authority->verify(response);
    ASSERT_TRUE(verified.hasError());
    EXPECT_EQ(verified.error().code(), ErrorCode::ChallengeExpired);
}
