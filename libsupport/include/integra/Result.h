#ifndef INTEGRA_LIBSUPPORT_INTEGRA_RESULT_H_
#define INTEGRA_LIBSUPPORT_INTEGRA_RESULT_H_

#include <cerrno>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <boost/outcome/outcome.hpp>
#include <boost/outcome/trait.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include "integra/ErrorCode.h"
#include "integra/Logging.h"
#include "integra/config.h"

/// Every fallible operation in integra returns a `Result<T>`: either a `T` or
/// an ErrorInfo, an error code plus a message that grows as the error is
/// returned toward the caller:
///
///     Result<void> CompleteAll() {
///       ...
///       INTEGRA_CHECKED_CONTEXT(UploadOne(n), "uploading part {}", n);
///     }
///
/// turns a store failure into
///
///     uploading part 3 (Uploader.cpp:88): connection reset (S3Api.cpp:41)
///
/// Callers branch on the code (`res.error() == UploadErrorCode::Cancelled`)
/// and show the message. Messages start in lower case so that joined context
/// reads as one sentence.
///
/// \file

namespace integra {

class CopyableErrorInfo;

/// The message of an ErrorInfo lives in a buffer owned by the thread that
/// made it, and a thread's buffer holds one message at a time: the newest
/// ErrorInfo to be given context owns it. An ErrorInfo must not outlive the
/// next error on its thread or cross to another thread. Convert to
/// CopyableErrorInfo to keep one, e.g., a part failure reported by an upload
/// worker. A stale ErrorInfo still has its code but prints only the code's
/// message.
class INTEGRA_EXPORT [[nodiscard]] ErrorInfo {
public:
  /// Longer messages lose their outermost context.
  static constexpr size_t kMaxMessageSize = 1024;

  ErrorInfo() = default;

  ErrorInfo(const std::error_code& ec) : error_code_(ec) {}

  template <
      typename ErrorEnum,
      typename = std::enable_if_t<std::is_error_code_enum_v<ErrorEnum>>>
  ErrorInfo(ErrorEnum err) : ErrorInfo(make_error_code(err)) {}

  /// The message is exactly text rather than ec.message().
  ErrorInfo(const std::error_code& ec, std::string_view text);

  ErrorInfo(const CopyableErrorInfo& copyable);

  const std::error_code& error_code() const { return error_code_; }

  std::string message() const;

  /// WithContext prepends "<formatted>: " to the message.
  template <typename F, typename... Args>
  ErrorInfo WithContext(F&& fmt_string, Args&&... args) {
    AddContext(fmt::format(
        std::forward<F>(fmt_string), std::forward<Args>(args)...));
    return *this;
  }

  std::ostream& Write(std::ostream& out) const;

private:
  bool OwnsBuffer() const;

  /// Take over the thread's buffer with text as the whole message
  void Claim(std::string_view text);

  void AddContext(std::string_view text);

  std::error_code error_code_;
  /// Owner id of this message in the thread's buffer, 0 for none
  uint64_t message_id_{};
};

/// CopyableErrorInfo owns its message. It is what errors are stored as once
/// they leave the call stack that produced them.
class INTEGRA_EXPORT CopyableErrorInfo {
public:
  CopyableErrorInfo() = default;

  CopyableErrorInfo(const std::error_code& ec) : error_code_(ec) {}

  template <
      typename ErrorEnum,
      typename = std::enable_if_t<std::is_error_code_enum_v<ErrorEnum>>>
  CopyableErrorInfo(ErrorEnum err) : CopyableErrorInfo(make_error_code(err)) {}

  CopyableErrorInfo(const ErrorInfo& ei)
      : error_code_(ei.error_code()), message_(ei.message()) {}

  template <typename F, typename... Args>
  CopyableErrorInfo WithContext(F&& fmt_string, Args&&... args) {
    std::string text = fmt::format(
        std::forward<F>(fmt_string), std::forward<Args>(args)...);
    message_ = message_.empty() ? std::move(text) : text + ": " + message_;
    return *this;
  }

  const std::error_code& error_code() const { return error_code_; }

  /// Empty unless context was added; see Write for the printed form.
  const std::string& message() const { return message_; }

  std::ostream& Write(std::ostream& out) const;

private:
  std::error_code error_code_;
  std::string message_;
};

inline std::ostream&
operator<<(std::ostream& out, const ErrorInfo& ei) {
  return ei.Write(out);
}

inline std::ostream&
operator<<(std::ostream& out, const CopyableErrorInfo& ei) {
  return ei.Write(out);
}

/// Two errors are equal when their codes are; messages are not compared.
inline bool
operator==(const ErrorInfo& a, const ErrorInfo& b) {
  return a.error_code() == b.error_code();
}

inline bool
operator!=(const ErrorInfo& a, const ErrorInfo& b) {
  return !(a == b);
}

/// Compare against a portable condition, e.g.,
/// `res.error() == std::errc::operation_canceled`.
template <
    typename Condition,
    typename = std::enable_if_t<std::is_error_condition_enum_v<Condition>>>
bool
operator==(const ErrorInfo& a, Condition c) {
  return a.error_code() == std::error_condition(c);
}

/// boost::outcome finds this by ADL to map an ErrorInfo to an error code.
inline std::error_code
make_error_code(const ErrorInfo& e) noexcept {
  return e.error_code();
}

namespace internal {

/// Access to the value of a failed Result, or the error of a successful one,
/// aborts.
struct abort_policy : BOOST_OUTCOME_V2_NAMESPACE::policy::base {
  template <class Impl>
  static constexpr void wide_value_check(Impl&& self) {
    if (!base::_has_value(std::forward<Impl>(self))) {
      AbortApplication();
    }
  }

  template <class Impl>
  static constexpr void wide_error_check(Impl&& self) {
    if (!base::_has_error(std::forward<Impl>(self))) {
      AbortApplication();
    }
  }

  template <class Impl>
  static constexpr void wide_exception_check(Impl&& self) {
    if (!base::_has_exception(std::forward<Impl>(self))) {
      AbortApplication();
    }
  }
};

/// CallSite renders " (File.cpp:12)" for the end of an error message.
INTEGRA_EXPORT std::string CallSite(const char* file, int line);

template <typename F, typename... Args>
ErrorInfo
MakeError(
    const char* file, int line, const std::error_code& ec, F fmt_string,
    Args&&... args) {
  return ErrorInfo(
      ec, fmt::format(fmt_string, std::forward<Args>(args)...) +
              CallSite(file, line));
}

}  // namespace internal

}  // namespace integra

#if FMT_VERSION >= 90000
template <>
struct fmt::formatter<integra::ErrorInfo> : fmt::ostream_formatter {};
template <>
struct fmt::formatter<integra::CopyableErrorInfo> : fmt::ostream_formatter {};
#endif

BOOST_OUTCOME_V2_NAMESPACE_BEGIN

namespace trait {

template <>
struct is_error_type<integra::ErrorInfo> {
  static constexpr bool value = true;
};

}  // namespace trait

BOOST_OUTCOME_V2_NAMESPACE_END

namespace integra {

template <class T>
using Result = BOOST_OUTCOME_V2_NAMESPACE::std_result<
    T, ErrorInfo, internal::abort_policy>;

INTEGRA_EXPORT Result<void> ResultSuccess();

/// ResultErrno is the error code of the last failed system call.
inline std::error_code
ResultErrno() {
  return std::error_code(errno, std::system_category());
}

namespace internal {

template <class T>
T
CheckedValue(Result<T>&& result) {
  return std::move(result.value());
}

inline int
CheckedValue(Result<void>&&) {
  return 0;
}

}  // namespace internal

}  // namespace integra

/// INTEGRA_ERROR makes an ErrorInfo with a formatted message that ends in the
/// call site.
#define INTEGRA_ERROR(ec, fmt_string, ...)                                     \
  ::integra::internal::MakeError(                                              \
      __FILE__, __LINE__, (ec), FMT_STRING(fmt_string), ##__VA_ARGS__)

/// INTEGRA_CHECKED_CONTEXT evaluates an expression yielding a Result. On
/// error it returns the error from the enclosing function with the formatted
/// context and the call site prepended. Otherwise it yields the value.
#define INTEGRA_CHECKED_CONTEXT(expression, ...)                               \
  ({                                                                           \
    auto integra_checked_result = (expression);                                \
    if (!integra_checked_result) {                                             \
      return integra_checked_result.error().WithContext(                       \
          "{}{}", fmt::format(__VA_ARGS__),                                    \
          ::integra::internal::CallSite(__FILE__, __LINE__));                  \
    }                                                                          \
    ::integra::internal::CheckedValue(std::move(integra_checked_result));      \
  })

/// INTEGRA_CHECKED is INTEGRA_CHECKED_CONTEXT with only the call site as
/// context.
#define INTEGRA_CHECKED(expression)                                            \
  ({                                                                           \
    auto integra_checked_result = (expression);                                \
    if (!integra_checked_result) {                                             \
      return integra_checked_result.error().WithContext(                       \
          "from {}:{}", ::integra::internal::BaseName(__FILE__), __LINE__);    \
    }                                                                          \
    ::integra::internal::CheckedValue(std::move(integra_checked_result));      \
  })

#endif
