#pragma once

/// @file public_key.hpp
/// @brief Client public keys: parsing, canonical DER and RSA-OAEP encryption.

#include <memory>
#include <string>
#include <string_view>

#include <openssl/types.h>

#include "eks/foundation/bytes.hpp"
#include "eks/foundation/service_result.hpp"

namespace eks::crypto {

/// An RSA public key accepted for challenge encryption.
///
/// Keys are held as OpenSSL EVP_PKEY objects and identified by their DER
/// SubjectPublicKeyInfo encoding, which is what gets stored and served.
/// Copies share the underlying key.
///
/// Example:
/// @code
///   auto key = PublicKey::fromPem(pemText);
///   if (key) {
///       auto ct = key.value().encrypt(challengeNonce);
///   }
/// @endcode
class PublicKey {
public:
    /// Parse DER SubjectPublicKeyInfo.
    /// @return InvalidKey on malformed or trailing data, UnsupportedKeyType
    ///         for anything but RSA.
    [[nodiscard]] static foundation::ServiceResult<PublicKey> fromDer(
        const foundation::Bytes& der);

    /// Parse a PEM "PUBLIC KEY" block.
    [[nodiscard]] static foundation::ServiceResult<PublicKey> fromPem(std::string_view pem);

    /// Canonical DER SubjectPublicKeyInfo.
    [[nodiscard]] const foundation::Bytes& der() const noexcept { return der_; }

    /// PEM rendering of der().
    [[nodiscard]] std::string pem() const;

    /// Modulus size in bits.
    [[nodiscard]] int bits() const noexcept { return bits_; }

    /// RSA-OAEP with SHA-256 (digest and MGF1), empty label.
    [[nodiscard]] foundation::ServiceResult<foundation::Bytes> encrypt(
        const foundation::Bytes& plaintext) const;

    /// KeyTooWeak when bits() is below @p minBits.
    [[nodiscard]] foundation::ServiceResult<void> requireMinimumBits(int minBits) const;

    bool operator==(const PublicKey& other) const noexcept { return der_ == other.der_; }

private:
    PublicKey(std::shared_ptr<EVP_PKEY> key, foundation::Bytes der, int bits);

    static foundation::ServiceResult<PublicKey> adopt(EVP_PKEY* raw);

    std::shared_ptr<EVP_PKEY> key_;
    foundation::Bytes der_;
    int bits_ = 0;
};

}  // namespace eks::crypto
