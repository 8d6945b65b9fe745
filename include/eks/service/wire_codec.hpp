#pragma once

/// @file wire_codec.hpp
/// @brief JSON bodies of the key service HTTP API.
///
/// Byte strings travel as JSON arrays of integers in [0, 255]. Unknown
/// object members are ignored; missing or mistyped members are errors.

#include <string>
#include <string_view>

#include "eks/foundation/bytes.hpp"
#include "eks/foundation/service_metrics.hpp"
#include "eks/foundation/service_result.hpp"
#include "eks/service/key_types.hpp"

namespace eks::service::wire {

/// `{"pubkey": [..] | "-----BEGIN PUBLIC KEY-----..."}`
/// @return InvalidRequest on malformed JSON or a wrong shape.
[[nodiscard]] foundation::ServiceResult<ChallengeRequest> decodeChallengeRequest(
    std::string_view body);

/// `{"response": [..], "state": [..], "nonce": [..], "name": "..."}`
[[nodiscard]] foundation::ServiceResult<ChallengeResponse> decodeChallengeResponse(
    std::string_view body);

/// `{"challenge": [..], "state": [..], "nonce": [..]}`
[[nodiscard]] std::string encodeChallenge(const Challenge& challenge);

/// `{"pubkey": [..]}`
[[nodiscard]] std::string encodePublicKey(const foundation::Bytes& der);

/// `{"error": "..."}`
[[nodiscard]] std::string encodeError(std::string_view message);

/// `{"status": "...", "service": "...", "uptime_seconds": N, "components": {..}}`
[[nodiscard]] std::string encodeHealth(const foundation::HealthCheckResult& health,
                                       int64_t uptimeSeconds);

/// `{"status": "not_ready", "service": "..."}`
[[nodiscard]] std::string encodeNotReady(std::string_view serviceName);

}  // namespace eks::service::wire
