#pragma once

/// @file state_cipher.hpp
/// @brief AES-256-GCM sealing of server-issued challenge state.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "eks/foundation/bytes.hpp"
#include "eks/foundation/service_result.hpp"

namespace eks::crypto {

/// Output of StateCipher::seal().
struct SealedBox {
    foundation::Bytes ciphertext;  ///< encrypted payload with the GCM tag appended
    foundation::Bytes nonce;       ///< 12-byte IV
};

/// AES-256-GCM with a process-held key.
///
/// Each seal() draws a fresh 12-byte nonce. The 16-byte authentication tag
/// is appended to the ciphertext; open() rejects anything that does not
/// authenticate. No associated data is used.
///
/// Example:
/// @code
///   auto cipher = StateCipher::generate().value();
///   auto box = cipher.seal(plaintext).value();
///   auto back = cipher.open(box.ciphertext, box.nonce);
/// @endcode
class StateCipher {
public:
    static constexpr std::size_t kKeySize = 32;
    static constexpr std::size_t kNonceSize = 12;
    static constexpr std::size_t kTagSize = 16;

    using Key = std::array<uint8_t, kKeySize>;

    explicit StateCipher(const Key& key);
    ~StateCipher();

    StateCipher(const StateCipher&) = default;
    StateCipher& operator=(const StateCipher&) = default;

    /// A cipher with a freshly drawn random key.
    [[nodiscard]] static foundation::ServiceResult<StateCipher> generate();

    /// A cipher whose key is given as 64 hex digits.
    /// @return InvalidKey on wrong length or non-hex input.
    [[nodiscard]] static foundation::ServiceResult<StateCipher> fromHex(std::string_view hex);

    /// Encrypt and authenticate @p plaintext under a new random nonce.
    [[nodiscard]] foundation::ServiceResult<SealedBox> seal(
        const foundation::Bytes& plaintext) const;

    /// Encrypt under a caller-chosen nonce. Nonces must never repeat under
    /// the same key.
    [[nodiscard]] foundation::ServiceResult<foundation::Bytes> sealWithNonce(
        const foundation::Bytes& plaintext, const foundation::Bytes& nonce) const;

    /// Authenticate and decrypt.
    /// @return DecryptFailed when the nonce size is wrong, the input is
    ///         shorter than a tag, or authentication fails.
    [[nodiscard]] foundation::ServiceResult<foundation::Bytes> open(
        const foundation::Bytes& ciphertext, const foundation::Bytes& nonce) const;

private:
    Key key_;
};

}  // namespace eks::crypto
