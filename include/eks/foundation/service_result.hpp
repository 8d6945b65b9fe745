#pragma once

/// @file service_result.hpp
/// @brief ServiceResult<T>: Result specialized with ServiceError.

#include "eks/core/result.hpp"
#include "eks/foundation/service_error.hpp"

namespace eks::foundation {

/// Every adapter and service method that can fail returns ServiceResult<T>.
///
/// Example:
/// @code
///   ServiceResult<uint16_t> parsePort(int raw) {
///       if (raw < 0 || raw > 65535) {
///           return ServiceResult<uint16_t>::err(
///               ServiceError(ErrorCode::ConfigInvalidValue, "port out of range"));
///       }
///       return ServiceResult<uint16_t>::ok(static_cast<uint16_t>(raw));
///   }
/// @endcode
template <typename T>
using ServiceResult = eks::Result<T, ServiceError>;

}  // namespace eks::foundation
