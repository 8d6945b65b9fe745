/// @file challenge_state.cpp
/// @brief ChallengeState binary codec.

#include "eks/service/challenge_state.hpp"

#include <cstddef>

namespace eks::service {

using foundation::Bytes;
using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

void putU32(Bytes& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

void putI64(Bytes& out, int64_t value) {
    auto v = static_cast<uint64_t>(value);
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

/// Bounds-checked little-endian reader.
class Reader {
public:
    explicit Reader(const Bytes& data) : data_(data) {}

    bool readU8(uint8_t& out) {
        if (remaining() < 1) {
            return false;
        }
        out = data_[pos_++];
        return true;
    }

    bool readU32(uint32_t& out) {
        if (remaining() < 4) {
            return false;
        }
        out = 0;
        for (int i = 0; i < 4; ++i) {
            out |= static_cast<uint32_t>(data_[pos_++]) << (8 * i);
        }
        return true;
    }

    bool readI64(int64_t& out) {
        if (remaining() < 8) {
            return false;
        }
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(data_[pos_++]) << (8 * i);
        }
        out = static_cast<int64_t>(v);
        return true;
    }

    bool readBlob(Bytes& out) {
        uint32_t len = 0;
        if (!readU32(len) || remaining() < len) {
            return false;
        }
        auto first = data_.begin() + static_cast<std::ptrdiff_t>(pos_);
        out.assign(first, first + static_cast<std::ptrdiff_t>(len));
        pos_ += len;
        return true;
    }

    [[nodiscard]] std::size_t remaining() const { return data_.size() - pos_; }

private:
    const Bytes& data_;
    std::size_t pos_ = 0;
};

ServiceResult<ChallengeState> malformed(const char* what) {
    return ServiceResult<ChallengeState>::err(ServiceError(ErrorCode::MalformedState, what));
}

}  // anonymous namespace

Bytes encodeChallengeState(const ChallengeState& state) {
    Bytes out;
    out.reserve(1 + 8 + 4 + state.challengeNonce.size() + 4 + state.pubkey.size());
    out.push_back(kChallengeStateVersion);
    putI64(out, state.issuedAt);
    putU32(out, static_cast<uint32_t>(state.challengeNonce.size()));
    out.insert(out.end(), state.challengeNonce.begin(), state.challengeNonce.end());
    putU32(out, static_cast<uint32_t>(state.pubkey.size()));
    out.insert(out.end(), state.pubkey.begin(), state.pubkey.end());
    return out;
}

ServiceResult<ChallengeState> decodeChallengeState(const Bytes& data) {
    Reader reader(data);
    ChallengeState state;

    uint8_t version = 0;
    if (!reader.readU8(version)) {
        return malformed("empty challenge state");
    }
    if (version != kChallengeStateVersion) {
        return malformed("unsupported challenge state version");
    }
    if (!reader.readI64(state.issuedAt) ||
        !reader.readBlob(state.challengeNonce) ||
        !reader.readBlob(state.pubkey)) {
        return malformed("truncated challenge state");
    }
    if (reader.remaining() != 0) {
        return malformed("trailing bytes in challenge state");
    }
    return ServiceResult<ChallengeState>::ok(std::move(state));
}

}  // namespace eks::service
