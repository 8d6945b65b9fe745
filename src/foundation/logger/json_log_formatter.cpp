/// @file json_log_formatter.cpp
/// @brief JSON log lines over nlohmann/json, correlation id storage.

#include "eks/foundation/json_log_formatter.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <random>

#include <nlohmann/json.hpp>

#include "eks/foundation/bytes.hpp"

namespace eks::foundation {

namespace {

using ordered_json = nlohmann::ordered_json;

thread_local std::string tl_correlationId;

// Log messages may carry client-supplied bytes; never throw on bad UTF-8.
std::string dumpLine(const ordered_json& doc) {
    return doc.dump(-1, ' ', false, ordered_json::error_handler_t::replace);
}

}  // anonymous namespace

void JsonLogFormatter::appendString(std::string& out, std::string_view value) {
    out += dumpLine(ordered_json(std::string(value)));
}

std::string JsonLogFormatter::timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count() % 1000;

    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&tt, &utc);

    std::array<char, 32> date{};
    std::strftime(date.data(), date.size(), "%Y-%m-%dT%H:%M:%S", &utc);

    std::string out(date.data());
    out += '.';
    out += static_cast<char>('0' + ms / 100);
    out += static_cast<char>('0' + (ms / 10) % 10);
    out += static_cast<char>('0' + ms % 10);
    out += 'Z';
    return out;
}

std::string generateCorrelationId() {
    thread_local std::mt19937_64 gen(std::random_device{}());

    Bytes raw(16);
    for (std::size_t i = 0; i < raw.size(); i += 8) {
        auto word = gen();
        for (std::size_t j = 0; j < 8; ++j) {
            raw[i + j] = static_cast<uint8_t>(word >> (8 * j));
        }
    }
    raw[6] = static_cast<uint8_t>((raw[6] & 0x0F) | 0x40);  // version 4
    raw[8] = static_cast<uint8_t>((raw[8] & 0x3F) | 0x80);  // RFC 4122 variant

    auto hex = toHex(raw);
    return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-' +
           hex.substr(16, 4) + '-' + hex.substr(20);
}

CorrelationScope::CorrelationScope(std::string correlationId)
    : previous_(std::move(tl_correlationId)) {
    tl_correlationId = std::move(correlationId);
}

CorrelationScope::~CorrelationScope() {
    tl_correlationId = std::move(previous_);
}

const std::string& CorrelationScope::current() {
    return tl_correlationId;
}

std::string JsonLogFormatter::format(LogLevel level,
                                     LogCategory category,
                                     std::string_view message,
                                     const LogContext& ctx) {
    ordered_json line;
    line["timestamp"] = timestamp();
    line["level"] = std::string(logLevelName(level));
    line["category"] = std::string(logCategoryName(category));

    // An explicit trace id wins over the thread's.
    const auto& correlationId =
        (ctx.traceId && !ctx.traceId->empty()) ? *ctx.traceId : tl_correlationId;
    if (!correlationId.empty()) {
        line["correlation_id"] = correlationId;
    }

    line["message"] = std::string(message);

    if (ctx.keyId && ctx.keyId->isValid()) {
        line["key_id"] = ctx.keyId->value();
    }
    if (ctx.keyName) {
        line["name"] = *ctx.keyName;
    }
    if (!ctx.extra.empty()) {
        auto& extra = line["extra"];
        for (const auto& [key, value] : ctx.extra) {
            extra[key] = value;
        }
    }
    return dumpLine(line);
}

}  // namespace eks::foundation
