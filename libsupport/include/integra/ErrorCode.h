#ifndef INTEGRA_LIBSUPPORT_INTEGRA_ERRORCODE_H_
#define INTEGRA_LIBSUPPORT_INTEGRA_ERRORCODE_H_

#include <system_error>

#include "integra/config.h"

/// General purpose error codes for libsupport and for argument checks
/// anywhere in integra. Failures of the upload itself use UploadErrorCode in
/// integra/UploadErrors.h.
///
/// Each code maps to a std::errc condition, so `err == std::errc::io_error`
/// holds for a LocalStorageError.
///
/// \file ErrorCode.h

namespace integra {

/// Zero means success in std::error_code and is not a member; return
/// ResultSuccess() instead.
enum class ErrorCode {
  InvalidArgument = 1,
  NotFound = 2,
  JsonDumpFailed = 3,
  LocalStorageError = 4,
};

INTEGRA_EXPORT const std::error_category& ErrorCodeCategory();

inline std::error_code
make_error_code(ErrorCode e) noexcept {
  return {static_cast<int>(e), ErrorCodeCategory()};
}

}  // namespace integra

namespace std {

template <>
struct is_error_code_enum<integra::ErrorCode> : true_type {};

}  // namespace std

#endif
