#pragma once

/// @file service_error.hpp
/// @brief Error type carried by ServiceResult<T>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "eks/foundation/error_code.hpp"

namespace eks::foundation {

/// Error code, human-readable message and optional type-erased context.
class ServiceError {
public:
    ServiceError() = default;

    explicit ServiceError(ErrorCode code)
        : code_(code) {}

    ServiceError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ServiceError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Typed context data, or nullptr on type mismatch or when empty.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

}  // namespace eks::foundation
