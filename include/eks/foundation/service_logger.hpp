#pragma once

/// @file service_logger.hpp
/// @brief ServiceLogger wrapping the kcenon logger interface with
///        category-based filtering and structured context.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "eks/foundation/service_result.hpp"
#include "eks/foundation/types.hpp"

namespace eks::foundation {

/// Log severity levels.
///
/// Maps one-to-one onto kcenon::common::interfaces::log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Key server log categories. Each has its own minimum level.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Start-up, configuration, shutdown
    Http     = 1, ///< Listener and request handling
    Database = 2, ///< Key storage
    Crypto   = 3, ///< Challenge sealing and public-key operations
    Registry = 4  ///< Key registration and lookup
};

inline constexpr std::size_t kLogCategoryCount = 5;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Http", "Database", "Crypto", "Registry"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Line layout handed to the underlying ILogger.
enum class LogFormat : uint8_t {
    Text, ///< "[Category] message {key=val, ...}"
    Json  ///< One JsonLogFormatter object per line
};

/// Parse a level name as written in configuration ("info", "WARN", ...).
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.keyName = "alice";
///   ctx.extra["peer"] = "127.0.0.1";
///   logger.logWithContext(LogLevel::Info, LogCategory::Registry,
///                         "Inserted key", ctx);
/// @endcode
struct LogContext {
    std::optional<KeyId> keyId;
    std::optional<std::string> keyName;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category logger over kcenon's GlobalLoggerRegistry.
///
/// Messages are prefixed with their category ("[Http] ...") and forwarded
/// to the logger registered under "eks.<Category>", falling back to the
/// registry's default logger.
///
/// All categories default to Info.
class ServiceLogger {
public:
    ServiceLogger();
    ~ServiceLogger();

    ServiceLogger(const ServiceLogger&) = delete;
    ServiceLogger& operator=(const ServiceLogger&) = delete;
    ServiceLogger(ServiceLogger&&) noexcept;
    ServiceLogger& operator=(ServiceLogger&&) noexcept;

    /// Log a message. No-op below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by its context as {key=val, ...}.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply the same minimum level to every category.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    void setFormat(LogFormat format);

    [[nodiscard]] LogFormat format() const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    ServiceResult<void> flush();

    static ServiceLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace eks::foundation

/// @name EKS_LOG macros
/// @brief Logging macros with a compile-time floor and a runtime level check.
///
/// Define EKS_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold (0=Trace ... 6=Off).
/// @{

#ifndef EKS_MIN_LOG_LEVEL
    #define EKS_MIN_LOG_LEVEL 0
#endif

#define EKS_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= EKS_MIN_LOG_LEVEL &&                        \
            ::eks::foundation::ServiceLogger::instance().isEnabled((level), (cat))) \
        {                                                                          \
            ::eks::foundation::ServiceLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define EKS_LOG_DEBUG(cat, msg) \
    EKS_LOG(::eks::foundation::LogLevel::Debug, (cat), (msg))

#define EKS_LOG_INFO(cat, msg) \
    EKS_LOG(::eks::foundation::LogLevel::Info, (cat), (msg))

#define EKS_LOG_WARN(cat, msg) \
    EKS_LOG(::eks::foundation::LogLevel::Warning, (cat), (msg))

#define EKS_LOG_ERROR(cat, msg) \
    EKS_LOG(::eks::foundation::LogLevel::Error, (cat), (msg))

/// @}
