#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the key server.

#include <cstdint>
#include <string_view>

namespace eks::foundation {

/// Error codes grouped by subsystem in 256-value ranges, so the source of
/// an error can be read off the code alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Network (0x0100 - 0x01FF)
    NetworkError = 0x0100,
    ListenFailed = 0x0101,
    ConnectionClosed = 0x0102,
    Timeout = 0x0103,
    SendFailed = 0x0104,
    InvalidMessage = 0x0105,
    PayloadTooLarge = 0x0106,
    HeaderTooLarge = 0x0107,
    LengthRequired = 0x0108,

    // Database (0x0200 - 0x02FF)
    DatabaseError = 0x0200,
    QueryFailed = 0x0201,
    TransactionFailed = 0x0202,
    ConnectionPoolExhausted = 0x0203,
    NotConnected = 0x0204,
    ConstraintViolation = 0x0205,

    // Crypto (0x0300 - 0x03FF)
    CryptoError = 0x0300,
    RandomFailed = 0x0301,
    InvalidKey = 0x0302,
    UnsupportedKeyType = 0x0303,
    KeyTooWeak = 0x0304,
    EncryptFailed = 0x0305,
    DecryptFailed = 0x0306,

    // Challenge (0x0400 - 0x04FF)
    ChallengeFailed = 0x0400,
    ChallengeExpired = 0x0401,
    MalformedState = 0x0402,

    // Registry (0x0500 - 0x05FF)
    InvalidName = 0x0500,
    NameTaken = 0x0501,
    KeyNotFound = 0x0502,
    InvalidRequest = 0x0503,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalidValue = 0x0603,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Network";
        case 0x0200: return "Database";
        case 0x0300: return "Crypto";
        case 0x0400: return "Challenge";
        case 0x0500: return "Registry";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

}  // namespace eks::foundation
