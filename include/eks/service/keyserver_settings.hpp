#pragma once

/// @file keyserver_settings.hpp
/// @brief Typed settings of the ember-keyserver executable, read from
///        ConfigManager.

#include <cstddef>
#include <optional>
#include <string>

#include "eks/foundation/config_manager.hpp"
#include "eks/foundation/service_database.hpp"
#include "eks/foundation/service_logger.hpp"
#include "eks/foundation/service_result.hpp"
#include "eks/service/http_server.hpp"
#include "eks/service/key_types.hpp"

namespace eks::service {

/// Everything main() needs to assemble the service.
struct KeyserverSettings {
    HttpServerConfig http;
    std::size_t workerThreads = 4;
    foundation::DatabaseConfig database;
    KeyServerConfig keyserver;

    /// 64 hex digits; unset means a random key per process.
    std::optional<std::string> stateKeyHex;

    foundation::LogLevel logLevel = foundation::LogLevel::Info;
    foundation::LogFormat logFormat = foundation::LogFormat::Text;
};

/// Read and validate every setting, falling back to defaults for absent keys.
///
/// | key                               | default      |
/// |-----------------------------------|--------------|
/// | server.bind_address               | 127.0.0.1    |
/// | server.port                       | 3030         |
/// | server.worker_threads             | 4            |
/// | server.max_body_bytes             | 65536        |
/// | server.read_timeout_ms            | 5000         |
/// | database.path                     | keys.sqlite  |
/// | database.max_connections          | 4            |
/// | keyserver.challenge_ttl_seconds   | 300          |
/// | keyserver.state_key_hex           | (unset)      |
/// | keyserver.min_rsa_bits            | 2048         |
/// | logging.level                     | info         |
/// | logging.format                    | text         |
///
/// @return ConfigTypeMismatch or ConfigInvalidValue naming the offending key.
[[nodiscard]] foundation::ServiceResult<KeyserverSettings> loadKeyserverSettings(
    const foundation::ConfigManager& config);

}  // namespace eks::service
