/// @file console_logger.cpp
/// @brief ConsoleLogger implementation.

#include "eks/foundation/console_logger.hpp"

#include "eks/foundation/json_log_formatter.hpp"

namespace eks::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

std::string_view levelLabel(kci::log_level level) {
    switch (level) {
        case kci::log_level::trace:    return "TRACE";
        case kci::log_level::debug:    return "DEBUG";
        case kci::log_level::info:     return "INFO";
        case kci::log_level::warning:  return "WARN";
        case kci::log_level::error:    return "ERROR";
        case kci::log_level::critical: return "CRIT";
        case kci::log_level::off:      return "OFF";
    }
    return "INFO";
}

}  // anonymous namespace

ConsoleLogger::ConsoleLogger(std::FILE* stream, bool decorate)
    : stream_(stream), decorate_(decorate) {}

kcenon::common::VoidResult ConsoleLogger::log(kci::log_level level,
                                              const std::string& message) {
    if (!is_enabled(level)) {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::string line;
    line.reserve(message.size() + 40);
    if (decorate_) {
        line += JsonLogFormatter::timestamp();
        line += ' ';
        line += levelLabel(level);
        line += ' ';
    }
    line += message;
    line += '\n';

    std::lock_guard lock(mutex_);
    std::fwrite(line.data(), 1, line.size(), stream_);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kcenon::common::VoidResult ConsoleLogger::log(kci::log_level level,
                                              std::string_view message,
                                              const kci::source_location& /*loc*/) {
    return log(level, std::string(message));
}

kcenon::common::VoidResult ConsoleLogger::log(const kci::log_entry& entry) {
    return log(entry.level, entry.message);
}

bool ConsoleLogger::is_enabled(kci::log_level level) const {
    return level != kci::log_level::off &&
           level >= minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::set_level(kci::log_level level) {
    minLevel_.store(level, std::memory_order_release);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kci::log_level ConsoleLogger::get_level() const {
    return minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::flush() {
    std::lock_guard lock(mutex_);
    std::fflush(stream_);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

}  // namespace eks::foundation
