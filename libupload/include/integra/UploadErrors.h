#ifndef INTEGRA_LIBUPLOAD_INTEGRA_UPLOADERRORS_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_UPLOADERRORS_H_

#include <system_error>

#include "integra/config.h"

namespace integra {

/// Errors surfaced by an upload run. Callers that only care about the broad
/// class of failure can compare against std::errc conditions: configuration
/// and credential problems are invalid_argument, anything the remote store or
/// an integrity check reports is io_error, and cancellation is
/// operation_canceled.
enum class UploadErrorCode {
  ConfigurationError = 1,
  CredentialsError = 2,
  TransportError = 3,
  VerificationError = 4,
  Cancelled = 5,
  WrongRegion = 6,
};

INTEGRA_EXPORT const std::error_category& UploadErrorCategory();

inline std::error_code
make_error_code(UploadErrorCode e) noexcept {
  return {static_cast<int>(e), UploadErrorCategory()};
}

}  // namespace integra

namespace std {

template <>
struct is_error_code_enum<integra::UploadErrorCode> : true_type {};

}  // namespace std

#endif
