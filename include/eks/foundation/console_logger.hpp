#pragma once

/// @file console_logger.hpp
/// @brief kcenon ILogger sink writing one line per entry to a stdio stream.

#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace eks::foundation {

/// Process-wide log sink installed as the GlobalLoggerRegistry default.
///
/// With @p decorate set, each line is prefixed with an ISO 8601 timestamp
/// and the level name; without it, messages are written verbatim (used when
/// ServiceLogger already produces JSON lines).
///
/// Example:
/// @code
///   auto sink = std::make_shared<ConsoleLogger>(stderr, true);
///   GlobalLoggerRegistry::instance().set_default_logger(sink);
/// @endcode
class ConsoleLogger : public kcenon::common::interfaces::ILogger {
public:
    ConsoleLogger(std::FILE* stream, bool decorate);

    kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
                                   const std::string& message) override;

    kcenon::common::VoidResult log(
        kcenon::common::interfaces::log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(kcenon::common::interfaces::log_level level) const override;

    kcenon::common::VoidResult set_level(
        kcenon::common::interfaces::log_level level) override;

    kcenon::common::interfaces::log_level get_level() const override;

    kcenon::common::VoidResult flush() override;

private:
    std::FILE* stream_;
    bool decorate_;
    std::mutex mutex_;
    std::atomic<kcenon::common::interfaces::log_level> minLevel_{
        kcenon::common::interfaces::log_level::trace};
};

}  // namespace eks::foundation
