/// @file secure_random.cpp
/// @brief RAND_bytes wrappers.

#include "eks/crypto/secure_random.hpp"

#include <climits>

#include <openssl/rand.h>

#include "openssl_util.hpp"

namespace eks::crypto {

using foundation::Bytes;
using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

ServiceResult<void> fillRandom(uint8_t* out, std::size_t count) {
    while (count > 0) {
        int chunk = count > static_cast<std::size_t>(INT_MAX)
                        ? INT_MAX
                        : static_cast<int>(count);
        if (RAND_bytes(out, chunk) != 1) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::RandomFailed, detail::opensslError("RAND_bytes failed")));
        }
        out += chunk;
        count -= static_cast<std::size_t>(chunk);
    }
    return ServiceResult<void>::ok();
}

ServiceResult<Bytes> randomBytes(std::size_t count) {
    Bytes bytes(count);
    auto filled = fillRandom(bytes.data(), bytes.size());
    if (filled.hasError()) {
        return ServiceResult<Bytes>::err(filled.error());
    }
    return ServiceResult<Bytes>::ok(std::move(bytes));
}

}  // namespace eks::crypto
