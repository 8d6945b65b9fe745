/// @file service_runner.cpp
/// @brief Implementation of shared service entry-point utilities.

#include "eks/service/service_runner.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <system_error>
#include <thread>

#include "eks/foundation/service_logger.hpp"

namespace eks::service {

using foundation::LogCategory;
using foundation::ServiceResult;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, ShutdownHook hook) {
    hooks_.push_back(Hook{std::move(name), std::move(hook)});
}

void GracefulShutdown::execute() {
    if (executed_) {
        return;
    }
    executed_ = true;

    for (auto& hook : hooks_) {
        EKS_LOG_DEBUG(LogCategory::Core, "shutdown: " + hook.name);
        try {
            hook.callback();
        } catch (const std::exception& e) {
            EKS_LOG_ERROR(LogCategory::Core,
                          "shutdown hook '" + hook.name + "' failed: " + e.what());
        }
    }
}

std::size_t GracefulShutdown::hookCount() const {
    return hooks_.size();
}

// -- Config loading ----------------------------------------------------------

ConfigLocation resolveConfigPath(const std::filesystem::path& flagPath,
                                 const std::filesystem::path& defaultPath) {
    if (!flagPath.empty()) {
        return {flagPath, ConfigSource::CommandLine};
    }
    const char* envPath = std::getenv(kConfigPathEnv);
    if (envPath != nullptr && *envPath != '\0') {
        return {envPath, ConfigSource::Environment};
    }
    return {defaultPath, ConfigSource::Default};
}

ServiceResult<void> loadConfig(foundation::ConfigManager& config,
                               const ConfigLocation& location) {
    std::error_code ec;
    if (location.source == ConfigSource::Default &&
        !std::filesystem::exists(location.path, ec)) {
        EKS_LOG_INFO(LogCategory::Core, "no config file at " + location.path.string() +
                                            ", using built-in defaults");
        return ServiceResult<void>::ok();
    }
    return config.load(location.path);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    constexpr std::string_view kFlag = "--config";
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == kFlag && i + 1 < argc) {
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
        if (arg.size() > kFlag.size() + 1 && arg.substr(0, kFlag.size()) == kFlag &&
            arg[kFlag.size()] == '=') {
            return std::filesystem::path(std::string(arg.substr(kFlag.size() + 1)));
        }
    }
    return {};
}

}  // namespace eks::service
