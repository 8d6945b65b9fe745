#pragma once

/// @file json_log_formatter.hpp
/// @brief Structured JSON log lines and per-thread correlation IDs.

#include "eks/foundation/service_logger.hpp"

#include <string>
#include <string_view>

namespace eks::foundation {

/// Generate a UUID v4 string (e.g. "550e8400-e29b-41d4-a716-446655440000").
[[nodiscard]] std::string generateCorrelationId();

/// Sets the current thread's correlation ID for its lifetime and restores
/// the previous value on destruction.
///
/// @code
///   {
///       CorrelationScope scope(generateCorrelationId());
///       // log lines on this thread carry the id
///   }
/// @endcode
class CorrelationScope {
public:
    explicit CorrelationScope(std::string correlationId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope&) = delete;
    CorrelationScope& operator=(const CorrelationScope&) = delete;

    /// The current thread's correlation ID (empty if none set).
    [[nodiscard]] static const std::string& current();

private:
    std::string previous_;
};

/// Stateless formatter producing one JSON object per log line:
/// @code
///   {"timestamp":"2026-10-19T12:00:00.000Z","level":"INFO",
///    "category":"Registry","correlation_id":"uuid","message":"...",
///    "name":"alice","extra":{"peer":"127.0.0.1"}}
/// @endcode
class JsonLogFormatter {
public:
    [[nodiscard]] static std::string format(LogLevel level,
                                            LogCategory category,
                                            std::string_view message,
                                            const LogContext& ctx = {});

    /// Append @p value to @p out as a quoted, escaped JSON string.
    static void appendString(std::string& out, std::string_view value);

    /// Current UTC time as ISO 8601 with millisecond precision.
    [[nodiscard]] static std::string timestamp();
};

}  // namespace eks::foundation
