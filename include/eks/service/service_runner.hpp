#pragma once

/// @file service_runner.hpp
/// @brief Entry-point utilities: signals, config path resolution, ordered
///        shutdown.

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "eks/foundation/config_manager.hpp"
#include "eks/foundation/service_result.hpp"

namespace eks::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. The handler
/// only performs a relaxed store on a lock-free atomic, which is
/// async-signal-safe. Default handlers are restored on destruction.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// True after SIGINT or SIGTERM.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

    /// Raise the flag without a signal (tests, fatal errors).
    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<void()>;

/// Runs named shutdown hooks once, in registration order.
///
/// The key server registers, in order: readiness off, HTTP stop, worker pool
/// drain, database disconnect, logger flush. An exception thrown by one hook
/// is logged and the remaining hooks still run.
///
/// Usage:
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("readiness", [&] { api.setReady(false); });
///   shutdown.addHook("http",      [&] { server.stop(); });
///   shutdown.addHook("database",  [&] { db->disconnect(); });
///   signals.waitForShutdown();
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    void addHook(std::string name, ShutdownHook hook);

    /// Run every hook. Later calls are no-ops.
    void execute();

    [[nodiscard]] std::size_t hookCount() const;

    [[nodiscard]] bool executed() const noexcept { return executed_; }

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
    bool executed_ = false;
};

/// Where the configuration path came from.
enum class ConfigSource { CommandLine, Environment, Default };

struct ConfigLocation {
    std::filesystem::path path;
    ConfigSource source = ConfigSource::Default;
};

/// Environment variable consulted when no --config flag is given.
inline constexpr const char* kConfigPathEnv = "EKS_CONFIG_PATH";

/// Resolve the config path: @p flagPath (if non-empty) > EKS_CONFIG_PATH >
/// @p defaultPath.
[[nodiscard]] ConfigLocation resolveConfigPath(const std::filesystem::path& flagPath,
                                               const std::filesystem::path& defaultPath);

/// Load @p location into @p config.
///
/// A missing file at the Default location is not an error: the service then
/// runs on built-in defaults. A missing file that was asked for explicitly
/// is ConfigLoadFailed.
[[nodiscard]] foundation::ServiceResult<void> loadConfig(foundation::ConfigManager& config,
                                                         const ConfigLocation& location);

/// Parse `--config <path>` or `--config=<path>` from the command line.
/// @return The path, or empty if not given.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

}  // namespace eks::service
