#include "integra/ErrorCode.h"

#include <string>

namespace {

class Category final : public std::error_category {
public:
  const char* name() const noexcept override { return "integra"; }

  std::string message(int c) const override {
    switch (static_cast<integra::ErrorCode>(c)) {
    case integra::ErrorCode::InvalidArgument:
      return "invalid argument";
    case integra::ErrorCode::NotFound:
      return "not found";
    case integra::ErrorCode::JsonDumpFailed:
      return "could not render json";
    case integra::ErrorCode::LocalStorageError:
      return "local storage error";
    }
    return "unknown error";
  }

  std::error_condition default_error_condition(
      int c) const noexcept override {
    switch (static_cast<integra::ErrorCode>(c)) {
    case integra::ErrorCode::InvalidArgument:
    case integra::ErrorCode::JsonDumpFailed:
      return std::errc::invalid_argument;
    case integra::ErrorCode::NotFound:
      return std::errc::no_such_file_or_directory;
    case integra::ErrorCode::LocalStorageError:
      return std::errc::io_error;
    }
    return std::error_condition(c, *this);
  }
};

}  // namespace

const std::error_category&
integra::ErrorCodeCategory() {
  static const Category category;
  return category;
}
