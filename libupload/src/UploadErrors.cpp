#include "integra/UploadErrors.h"

#include <string>

namespace {

class Category final : public std::error_category {
public:
  const char* name() const noexcept override { return "upload"; }

  std::string message(int c) const override {
    switch (static_cast<integra::UploadErrorCode>(c)) {
    case integra::UploadErrorCode::ConfigurationError:
      return "configuration error";
    case integra::UploadErrorCode::CredentialsError:
      return "credentials could not be resolved";
    case integra::UploadErrorCode::TransportError:
      return "object store request failed";
    case integra::UploadErrorCode::VerificationError:
      return "integrity verification failed";
    case integra::UploadErrorCode::Cancelled:
      return "upload cancelled";
    case integra::UploadErrorCode::WrongRegion:
      return "object store request may succeed in other region";
    }
    return "unknown error";
  }

  std::error_condition default_error_condition(
      int c) const noexcept override {
    switch (static_cast<integra::UploadErrorCode>(c)) {
    case integra::UploadErrorCode::ConfigurationError:
    case integra::UploadErrorCode::CredentialsError:
      return std::errc::invalid_argument;
    case integra::UploadErrorCode::TransportError:
    case integra::UploadErrorCode::VerificationError:
    case integra::UploadErrorCode::WrongRegion:
      return std::errc::io_error;
    case integra::UploadErrorCode::Cancelled:
      return std::errc::operation_canceled;
    }
    return std::error_condition(c, *this);
  }
};

}  // namespace

const std::error_category&
integra::UploadErrorCategory() {
  static const Category category;
  return category;
}
