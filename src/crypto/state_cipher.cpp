/// @file state_cipher.cpp
/// @brief AES-256-GCM through the OpenSSL EVP cipher API.

#include "eks/crypto/state_cipher.hpp"

#include <algorithm>

#include <openssl/crypto.h>

#include "eks/crypto/secure_random.hpp"
#include "openssl_util.hpp"

namespace eks::crypto {

using foundation::Bytes;
using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

StateCipher::StateCipher(const Key& key) : key_(key) {}

StateCipher::~StateCipher() {
    OPENSSL_cleanse(key_.data(), key_.size());
}

ServiceResult<StateCipher> StateCipher::generate() {
    Key key{};
    auto filled = fillRandom(key.data(), key.size());
    if (filled.hasError()) {
        return ServiceResult<StateCipher>::err(filled.error());
    }
    StateCipher cipher(key);
    OPENSSL_cleanse(key.data(), key.size());
    return ServiceResult<StateCipher>::ok(std::move(cipher));
}

ServiceResult<StateCipher> StateCipher::fromHex(std::string_view hex) {
    auto decoded = foundation::fromHex(hex);
    if (!decoded || decoded->size() != kKeySize) {
        return ServiceResult<StateCipher>::err(
            ServiceError(ErrorCode::InvalidKey, "state key must be 64 hex digits"));
    }
    Key key{};
    std::copy(decoded->begin(), decoded->end(), key.begin());
    OPENSSL_cleanse(decoded->data(), decoded->size());
    StateCipher cipher(key);
    OPENSSL_cleanse(key.data(), key.size());
    return ServiceResult<StateCipher>::ok(std::move(cipher));
}

ServiceResult<SealedBox> StateCipher::seal(const Bytes& plaintext) const {
    auto nonce = randomBytes(kNonceSize);
    if (nonce.hasError()) {
        return ServiceResult<SealedBox>::err(nonce.error());
    }
    auto ciphertext = sealWithNonce(plaintext, nonce.value());
    if (ciphertext.hasError()) {
        return ServiceResult<SealedBox>::err(ciphertext.error());
    }
    return ServiceResult<SealedBox>::ok(
        SealedBox{std::move(ciphertext).value(), std::move(nonce).value()});
}

ServiceResult<Bytes> StateCipher::sealWithNonce(const Bytes& plaintext,
                                                const Bytes& nonce) const {
    auto fail = [](const char* what) {
        return ServiceResult<Bytes>::err(
            ServiceError(ErrorCode::EncryptFailed, detail::opensslError(what)));
    };

    if (nonce.size() != kNonceSize) {
        return ServiceResult<Bytes>::err(
            ServiceError(ErrorCode::EncryptFailed, "GCM nonce must be 12 bytes"));
    }

    detail::CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return fail("EVP_CIPHER_CTX_new");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce.data()) != 1) {
        return fail("AES-GCM init");
    }

    Bytes out(plaintext.size() + kTagSize);
    int len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
        return fail("AES-GCM update");
    }
    int written = len;

    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) {
        return fail("AES-GCM final");
    }
    written += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize),
                            out.data() + written) != 1) {
        return fail("AES-GCM tag");
    }
    out.resize(static_cast<std::size_t>(written) + kTagSize);
    return ServiceResult<Bytes>::ok(std::move(out));
}

ServiceResult<Bytes> StateCipher::open(const Bytes& ciphertext, const Bytes& nonce) const {
    auto fail = [](std::string what) {
        ERR_clear_error();
        return ServiceResult<Bytes>::err(ServiceError(ErrorCode::DecryptFailed, std::move(what)));
    };

    if (nonce.size() != kNonceSize) {
        return fail("GCM nonce must be 12 bytes");
    }
    if (ciphertext.size() < kTagSize) {
        return fail("sealed data shorter than the GCM tag");
    }

    const std::size_t bodySize = ciphertext.size() - kTagSize;

    detail::CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return fail("EVP_CIPHER_CTX_new failed");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce.data()) != 1) {
        return fail("AES-GCM init failed");
    }

    Bytes out(bodySize + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    if (bodySize > 0 &&
        EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext.data(),
                          static_cast<int>(bodySize)) != 1) {
        return fail("AES-GCM update failed");
    }
    int written = len;

    // EVP_CTRL_GCM_SET_TAG takes a non-const pointer but does not modify it.
    Bytes tag(ciphertext.end() - static_cast<std::ptrdiff_t>(kTagSize), ciphertext.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize),
                            tag.data()) != 1) {
        return fail("AES-GCM tag setup failed");
    }

    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &len) != 1) {
        OPENSSL_cleanse(out.data(), out.size());
        return fail("authentication failed");
    }
    written += len;
    out.resize(static_cast<std::size_t>(written));
    return ServiceResult<Bytes>::ok(std::move(out));
}

}  // namespace eks::crypto
