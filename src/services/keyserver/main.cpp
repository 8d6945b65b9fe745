/// @file main.cpp
/// @brief ember-keyserver entry point.
///
/// Loads configuration, opens the key database and serves the key API until
/// SIGINT or SIGTERM.

#include "eks/crypto/state_cipher.hpp"
#include "eks/foundation/config_manager.hpp"
#include "eks/foundation/console_logger.hpp"
#include "eks/foundation/job_scheduler.hpp"
#include "eks/foundation/service_database.hpp"
#include "eks/foundation/service_logger.hpp"
#include "eks/foundation/service_metrics.hpp"
#include "eks/service/http_server.hpp"
#include "eks/service/key_api.hpp"
#include "eks/service/key_repository.hpp"
#include "eks/service/key_server.hpp"
#include "eks/service/keyserver_settings.hpp"
#include "eks/service/route_table.hpp"
#include "eks/service/service_runner.hpp"
#include "eks/version.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using eks::foundation::HealthStatus;
using eks::foundation::LogCategory;
using eks::foundation::LogContext;
using eks::foundation::LogLevel;

namespace {

constexpr const char* kDefaultConfigPath = "keyserver.yaml";

void installLogSink(const eks::service::KeyserverSettings& settings) {
    auto sink = std::make_shared<eks::foundation::ConsoleLogger>(
        stderr, settings.logFormat == eks::foundation::LogFormat::Text);
    kcenon::common::interfaces::GlobalLoggerRegistry::instance().set_default_logger(sink);

    auto& logger = eks::foundation::ServiceLogger::instance();
    logger.setAllLevels(settings.logLevel);
    logger.setFormat(settings.logFormat);
}

eks::foundation::ServiceResult<eks::crypto::StateCipher> makeStateCipher(
    const eks::service::KeyserverSettings& settings) {
    if (settings.stateKeyHex) {
        return eks::crypto::StateCipher::fromHex(*settings.stateKeyHex);
    }
    EKS_LOG_WARN(LogCategory::Crypto,
                 "keyserver.state_key_hex not set; outstanding challenges will not "
                 "survive a restart");
    return eks::crypto::StateCipher::generate();
}

}  // namespace

int main(int argc, char* argv[]) {
    eks::service::SignalHandler signals;

    auto location = eks::service::resolveConfigPath(eks::service::parseConfigArg(argc, argv),
                                                    kDefaultConfigPath);

    eks::foundation::ConfigManager config;
    auto loadResult = eks::service::loadConfig(config, location);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto settingsResult = eks::service::loadKeyserverSettings(config);
    if (!settingsResult) {
        std::cerr << "Invalid config: " << settingsResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto settings = std::move(settingsResult).value();

    installLogSink(settings);

    auto& metrics = eks::foundation::ServiceMetrics::instance();
    metrics.setServiceName("ember-keyserver");
    metrics.setComponentHealth("database", HealthStatus::Unhealthy);
    metrics.setComponentHealth("http", HealthStatus::Unhealthy);

    auto cipher = makeStateCipher(settings);
    if (!cipher) {
        EKS_LOG_ERROR(LogCategory::Crypto,
                      "Failed to set up state key: " + std::string(cipher.error().message()));
        return EXIT_FAILURE;
    }

    // Storage.
    auto db = std::make_shared<eks::foundation::ServiceDatabase>();
    auto dbResult = db->connect(settings.database);
    if (!dbResult) {
        EKS_LOG_ERROR(LogCategory::Database,
                      "Failed to open " + settings.database.path + ": " +
                          std::string(dbResult.error().message()));
        return EXIT_FAILURE;
    }
    auto repository = std::make_shared<eks::service::DatabaseKeyRepository>(db);
    auto initResult = repository->initialize();
    if (!initResult) {
        EKS_LOG_ERROR(LogCategory::Database,
                      "Failed to create keys table: " +
                          std::string(initResult.error().message()));
        db->disconnect();
        return EXIT_FAILURE;
    }
    metrics.setComponentHealth("database", HealthStatus::Healthy);

    // Service and HTTP front end.
    eks::service::KeyServer keyServer(settings.keyserver, std::move(cipher).value(),
                                      repository, metrics);
    eks::service::KeyApi api(keyServer, metrics, "ember-keyserver");

    eks::service::RouteTable routes;
    api.registerRoutes(routes);

    eks::foundation::JobScheduler scheduler(settings.workerThreads);
    eks::service::HttpServer server(settings.http, routes, metrics, scheduler);

    auto startResult = server.start();
    if (!startResult) {
        EKS_LOG_ERROR(LogCategory::Http,
                      "Failed to listen on " + settings.http.bindAddress + ":" +
                          std::to_string(settings.http.port) + ": " +
                          std::string(startResult.error().message()));
        scheduler.shutdown();
        db->disconnect();
        return EXIT_FAILURE;
    }
    metrics.setComponentHealth("http", HealthStatus::Healthy);
    api.setReady(true);

    LogContext ctx;
    ctx.extra["version"] = eks::Version::string;
    ctx.extra["config"] = location.path.string();
    ctx.extra["listen"] = settings.http.bindAddress + ":" + std::to_string(server.boundPort());
    eks::foundation::ServiceLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Core, "Starting server...", ctx);

    eks::service::GracefulShutdown shutdown;
    shutdown.addHook("readiness", [&] { api.setReady(false); });
    shutdown.addHook("http", [&] {
        server.stop();
        metrics.setComponentHealth("http", HealthStatus::Unhealthy);
    });
    shutdown.addHook("workers", [&] { scheduler.shutdown(); });
    shutdown.addHook("database", [&] {
        db->disconnect();
        metrics.setComponentHealth("database", HealthStatus::Unhealthy);
    });
    shutdown.addHook("logger", [] {
        EKS_LOG_INFO(LogCategory::Core, "Key server stopped");
        auto flushed = eks::foundation::ServiceLogger::instance().flush();
        if (!flushed) {
            std::cerr << "Failed to flush logs: " << flushed.error().message() << "\n";
        }
    });

    signals.waitForShutdown();
    EKS_LOG_INFO(LogCategory::Core, "Shutdown requested");
    shutdown.execute();
    return EXIT_SUCCESS;
}
