/// @file keyserver_settings.cpp
/// @brief loadKeyserverSettings implementation.

#include "eks/service/keyserver_settings.hpp"

#include <string_view>

namespace eks::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

ServiceError invalidValue(std::string_view key, std::string_view why) {
    return ServiceError(ErrorCode::ConfigInvalidValue,
                        std::string(key) + ": " + std::string(why));
}

/// Integer setting constrained to [minValue, maxValue].
ServiceResult<int64_t> boundedInt(const ConfigManager& config, std::string_view key,
                                  int64_t fallback, int64_t minValue, int64_t maxValue) {
    auto value = config.getOr<int64_t>(key, fallback);
    if (value.hasError()) {
        return value;
    }
    if (value.value() < minValue || value.value() > maxValue) {
        return ServiceResult<int64_t>::err(invalidValue(
            key, "must be between " + std::to_string(minValue) + " and " +
                     std::to_string(maxValue)));
    }
    return value;
}

}  // anonymous namespace

ServiceResult<KeyserverSettings> loadKeyserverSettings(const ConfigManager& config) {
    using Result = ServiceResult<KeyserverSettings>;
    KeyserverSettings s;

    auto bind = config.getOr<std::string>("server.bind_address", s.http.bindAddress);
    if (bind.hasError()) return Result::err(bind.error());
    s.http.bindAddress = std::move(bind).value();

    auto port = boundedInt(config, "server.port", s.http.port, 0, 65535);
    if (port.hasError()) return Result::err(port.error());
    s.http.port = static_cast<uint16_t>(port.value());

    auto workers = boundedInt(config, "server.worker_threads",
                              static_cast<int64_t>(s.workerThreads), 1, 1024);
    if (workers.hasError()) return Result::err(workers.error());
    s.workerThreads = static_cast<std::size_t>(workers.value());

    auto maxBody = boundedInt(config, "server.max_body_bytes",
                              static_cast<int64_t>(s.http.maxBodyBytes), 1, 64 * 1024 * 1024);
    if (maxBody.hasError()) return Result::err(maxBody.error());
    s.http.maxBodyBytes = static_cast<std::size_t>(maxBody.value());

    auto readTimeout = boundedInt(config, "server.read_timeout_ms",
                                  s.http.readTimeout.count(), 1, 600000);
    if (readTimeout.hasError()) return Result::err(readTimeout.error());
    s.http.readTimeout = std::chrono::milliseconds(readTimeout.value());

    auto dbPath = config.getOr<std::string>("database.path", s.database.path);
    if (dbPath.hasError()) return Result::err(dbPath.error());
    if (dbPath.value().empty()) {
        return Result::err(invalidValue("database.path", "must not be empty"));
    }
    s.database.path = std::move(dbPath).value();

    auto maxConns = boundedInt(config, "database.max_connections",
                               s.database.maxConnections, 1, 256);
    if (maxConns.hasError()) return Result::err(maxConns.error());
    s.database.maxConnections = static_cast<uint32_t>(maxConns.value());

    auto ttl = boundedInt(config, "keyserver.challenge_ttl_seconds",
                          s.keyserver.challengeTtl.count(), 0, 7 * 24 * 3600);
    if (ttl.hasError()) return Result::err(ttl.error());
    s.keyserver.challengeTtl = std::chrono::seconds(ttl.value());

    auto minBits = boundedInt(config, "keyserver.min_rsa_bits", s.keyserver.minRsaBits,
                              1024, 16384);
    if (minBits.hasError()) return Result::err(minBits.error());
    s.keyserver.minRsaBits = static_cast<int>(minBits.value());

    if (config.hasKey("keyserver.state_key_hex")) {
        auto hex = config.get<std::string>("keyserver.state_key_hex");
        if (hex.hasError()) return Result::err(hex.error());
        if (!hex.value().empty()) {
            auto decoded = foundation::fromHex(hex.value());
            if (!decoded || decoded->size() != 32) {
                return Result::err(
                    invalidValue("keyserver.state_key_hex", "must be 64 hex digits"));
            }
            s.stateKeyHex = std::move(hex).value();
        }
    }

    auto level = config.getOr<std::string>("logging.level", "info");
    if (level.hasError()) return Result::err(level.error());
    auto parsedLevel = foundation::parseLogLevel(level.value());
    if (!parsedLevel) {
        return Result::err(invalidValue("logging.level", "unknown level '" + level.value() + "'"));
    }
    s.logLevel = *parsedLevel;

    auto format = config.getOr<std::string>("logging.format", "text");
    if (format.hasError()) return Result::err(format.error());
    if (format.value() == "text") {
        s.logFormat = foundation::LogFormat::Text;
    } else if (format.value() == "json") {
        s.logFormat = foundation::LogFormat::Json;
    } else {
        return Result::err(invalidValue("logging.format", "must be 'text' or 'json'"));
    }

    return Result::ok(std::move(s));
}

}  // namespace eks::service
