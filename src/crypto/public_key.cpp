/// @file public_key.cpp
/// @brief PublicKey over the OpenSSL 3.x EVP API.

#include "eks/crypto/public_key.hpp"

#include <climits>

#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include "openssl_util.hpp"

namespace eks::crypto {

using foundation::Bytes;
using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

PublicKey::PublicKey(std::shared_ptr<EVP_PKEY> key, Bytes der, int bits)
    : key_(std::move(key)), der_(std::move(der)), bits_(bits) {}

ServiceResult<PublicKey> PublicKey::adopt(EVP_PKEY* raw) {
    detail::PkeyPtr pkey(raw);

    if (EVP_PKEY_get_base_id(pkey.get()) != EVP_PKEY_RSA) {
        return ServiceResult<PublicKey>::err(
            ServiceError(ErrorCode::UnsupportedKeyType, "only RSA public keys are supported"));
    }

    // Re-encode so that equivalent inputs (DER or PEM) compare equal.
    unsigned char* buf = nullptr;
    int len = i2d_PUBKEY(pkey.get(), &buf);
    if (len <= 0 || buf == nullptr) {
        return ServiceResult<PublicKey>::err(
            ServiceError(ErrorCode::InvalidKey, detail::opensslError("i2d_PUBKEY failed")));
    }
    Bytes der(buf, buf + len);
    OPENSSL_free(buf);

    int bits = EVP_PKEY_get_bits(pkey.get());
    std::shared_ptr<EVP_PKEY> shared(pkey.release(), detail::PkeyDeleter{});
    return ServiceResult<PublicKey>::ok(PublicKey(std::move(shared), std::move(der), bits));
}

ServiceResult<PublicKey> PublicKey::fromDer(const Bytes& der) {
    if (der.empty() || der.size() > static_cast<std::size_t>(LONG_MAX)) {
        return ServiceResult<PublicKey>::err(
            ServiceError(ErrorCode::InvalidKey, "empty public key"));
    }

    const unsigned char* p = der.data();
    EVP_PKEY* raw = d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size()));
    if (raw == nullptr) {
        return ServiceResult<PublicKey>::err(
            ServiceError(ErrorCode::InvalidKey, detail::opensslError("malformed public key")));
    }
    if (p != der.data() + der.size()) {
        EVP_PKEY_free(raw);
        return ServiceResult<PublicKey>::err(
            ServiceError(ErrorCode::InvalidKey, "trailing bytes after public key"));
    }
    return adopt(raw);
}

ServiceResult<PublicKey> PublicKey::fromPem(std::string_view pem) {
    if (pem.empty() || pem.size() > static_cast<std::size_t>(INT_MAX)) {
        return ServiceResult<PublicKey>::err(
            ServiceError(ErrorCode::InvalidKey, "empty public key"));
    }

    detail::BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return ServiceResult<PublicKey>::err(
            ServiceError(ErrorCode::CryptoError, detail::opensslError("BIO_new_mem_buf failed")));
    }

    EVP_PKEY* raw = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
    if (raw == nullptr) {
        return ServiceResult<PublicKey>::err(
            ServiceError(ErrorCode::InvalidKey, detail::opensslError("malformed PEM public key")));
    }
    return adopt(raw);
}

std::string PublicKey::pem() const {
    detail::BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1) {
        ERR_clear_error();
        return {};
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<std::size_t>(len));
}

ServiceResult<Bytes> PublicKey::encrypt(const Bytes& plaintext) const {
    auto fail = [](const char* what) {
        return ServiceResult<Bytes>::err(
            ServiceError(ErrorCode::EncryptFailed, detail::opensslError(what)));
    };

    detail::PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key_.get(), nullptr));
    if (!ctx) {
        return fail("EVP_PKEY_CTX_new_from_pkey");
    }
    if (EVP_PKEY_encrypt_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) != 1 ||
        EVP_PKEY_CTX_set_rsa_oaep_md(ctx.get(), EVP_sha256()) != 1 ||
        EVP_PKEY_CTX_set_rsa_mgf1_md(ctx.get(), EVP_sha256()) != 1) {
        return fail("RSA-OAEP setup");
    }

    std::size_t outLen = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &outLen, plaintext.data(), plaintext.size()) != 1) {
        return fail("RSA-OAEP size query");
    }
    Bytes out(outLen);
    if (EVP_PKEY_encrypt(ctx.get(), out.data(), &outLen, plaintext.data(), plaintext.size()) != 1) {
        return fail("RSA-OAEP encrypt");
    }
    out.resize(outLen);
    return ServiceResult<Bytes>::ok(std::move(out));
}

ServiceResult<void> PublicKey::requireMinimumBits(int minBits) const {
    if (bits_ < minBits) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::KeyTooWeak,
                         "RSA key has " + std::to_string(bits_) + " bits, need at least " +
                             std::to_string(minBits)));
    }
    return ServiceResult<void>::ok();
}

}  // namespace eks::crypto
