#pragma once

/// @file key_types.hpp
/// @brief Request, reply and record types of the key registration service.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "eks/foundation/bytes.hpp"
#include "eks/foundation/types.hpp"

namespace eks::service {

// -- Wire messages ------------------------------------------------------------

/// Public key exactly as a client sent it.
struct EncodedPublicKey {
    enum class Format : uint8_t {
        Der,  ///< SubjectPublicKeyInfo bytes (JSON byte array).
        Pem   ///< "-----BEGIN PUBLIC KEY-----" text (JSON string).
    };

    Format format = Format::Der;
    foundation::Bytes data;
};

/// Body of POST /challenge.
struct ChallengeRequest {
    EncodedPublicKey pubkey;
};

/// Reply to POST /challenge.
struct Challenge {
    foundation::Bytes challenge;  ///< challenge nonce encrypted to the client key
    foundation::Bytes state;      ///< sealed ChallengeState, GCM tag appended
    foundation::Bytes nonce;      ///< 12-byte GCM nonce for @c state
};

/// Body of POST /response.
struct ChallengeResponse {
    foundation::Bytes response;  ///< the decrypted challenge nonce
    foundation::Bytes state;
    foundation::Bytes nonce;
    std::string name;
};

// -- Storage ------------------------------------------------------------------

/// A registered key.
struct KeyRecord {
    foundation::KeyId id;
    std::string name;
    foundation::Bytes pubkey;  ///< DER SubjectPublicKeyInfo
};

// -- Configuration ------------------------------------------------------------

/// Configuration for the key service.
struct KeyServerConfig {
    /// Maximum challenge age. Zero disables the check.
    std::chrono::seconds challengeTtl{300};

    /// Issue times further ahead than this are treated as expired.
    std::chrono::seconds maxClockSkew{60};

    /// Smallest accepted RSA modulus.
    int minRsaBits = 2048;

    /// Longest accepted name, in bytes.
    std::size_t maxNameLength = 255;
};

}  // namespace eks::service
