/// @file key_server.cpp
/// @brief KeyServer implementation.

#include "eks/service/key_server.hpp"

#include <string>

#include "eks/foundation/service_logger.hpp"
#include "eks/foundation/service_metrics.hpp"
#include "eks/service/key_repository.hpp"

namespace eks::service {

using foundation::Bytes;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ServiceError;
using foundation::ServiceLogger;
using foundation::ServiceResult;

ServiceResult<crypto::PublicKey> parsePublicKey(const EncodedPublicKey& encoded) {
    switch (encoded.format) {
        case EncodedPublicKey::Format::Der:
            return crypto::PublicKey::fromDer(encoded.data);
        case EncodedPublicKey::Format::Pem:
            return crypto::PublicKey::fromPem(std::string_view(
                reinterpret_cast<const char*>(encoded.data.data()), encoded.data.size()));
    }
    return ServiceResult<crypto::PublicKey>::err(
        ServiceError(ErrorCode::InvalidKey, "unknown public key encoding"));
}

KeyServer::KeyServer(KeyServerConfig config,
                     crypto::StateCipher cipher,
                     std::shared_ptr<IKeyRepository> repository,
                     foundation::ServiceMetrics& metrics,
                     ChallengeAuthority::Clock clock)
    : config_(config),
      authority_(std::move(cipher), config, std::move(clock)),
      repository_(std::move(repository)),
      metrics_(metrics) {}

KeyServer::~KeyServer() = default;

bool KeyServer::isValidName(std::string_view name) const {
    if (name.empty() || name.size() > config_.maxNameLength) {
        return false;
    }
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F) {
            return false;
        }
    }
    return true;
}

ServiceResult<Challenge> KeyServer::issueChallenge(const ChallengeRequest& request) {
    auto key = parsePublicKey(request.pubkey);
    if (key.hasError()) {
        EKS_LOG_DEBUG(LogCategory::Registry,
                      "rejected public key: " + std::string(key.error().message()));
        return ServiceResult<Challenge>::err(key.error());
    }

    auto challenge = authority_.issue(key.value());
    if (challenge.hasError()) {
        if (challenge.error().code() == ErrorCode::KeyTooWeak) {
            EKS_LOG_DEBUG(LogCategory::Registry, std::string(challenge.error().message()));
        } else {
            EKS_LOG_ERROR(LogCategory::Crypto,
                          "could not create challenge: " +
                              std::string(challenge.error().message()));
        }
        return challenge;
    }

    metrics_.incrementCounter("eks_challenges_issued_total");
    return challenge;
}

ServiceResult<KeyRecord> KeyServer::submitResponse(const ChallengeResponse& response) {
    if (!isValidName(response.name)) {
        return ServiceResult<KeyRecord>::err(
            ServiceError(ErrorCode::InvalidName, "name must be 1-" +
                                                     std::to_string(config_.maxNameLength) +
                                                     " bytes without control characters"));
    }

    auto key = authority_.verify(response);
    if (key.hasError()) {
        metrics_.incrementCounter("eks_challenges_failed_total");
        return ServiceResult<KeyRecord>::err(key.error());
    }

    const auto& der = key.value().der();
    auto id = repository_->insert(response.name, der);
    if (id.hasError()) {
        LogContext ctx;
        ctx.keyName = response.name;
        ServiceLogger::instance().logWithContext(
            LogLevel::Error, LogCategory::Registry,
            "Error inserting key: " + std::string(id.error().message()), ctx);
        return ServiceResult<KeyRecord>::err(id.error());
    }

    LogContext ctx;
    ctx.keyId = id.value();
    ctx.keyName = response.name;
    ServiceLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Registry, "Inserted key for " + response.name, ctx);
    metrics_.incrementCounter("eks_keys_registered_total");

    return ServiceResult<KeyRecord>::ok(KeyRecord{id.value(), response.name, der});
}

ServiceResult<Bytes> KeyServer::lookupKey(std::string_view name) {
    auto found = repository_->find(name);
    if (found.hasError()) {
        EKS_LOG_ERROR(LogCategory::Registry, "Failed to retrieve " + std::string(name) + ": " +
                                                 std::string(found.error().message()));
        return ServiceResult<Bytes>::err(found.error());
    }
    if (!found.value()) {
        EKS_LOG_INFO(LogCategory::Registry, "Failed to retrieve " + std::string(name) +
                                                ": no such name");
        return ServiceResult<Bytes>::err(
            ServiceError(ErrorCode::KeyNotFound, "no key registered under " + std::string(name)));
    }
    return ServiceResult<Bytes>::ok(std::move(found.value()->pubkey));
}

}  // namespace eks::service
