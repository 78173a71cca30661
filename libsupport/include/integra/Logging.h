#ifndef INTEGRA_LIBSUPPORT_INTEGRA_LOGGING_H_
#define INTEGRA_LIBSUPPORT_INTEGRA_LOGGING_H_

#include <string>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "integra/config.h"

/// Diagnostics for people running or debugging integrity-upload. Every line
/// goes to standard error as
///
///     WARNING Uploader.cpp:166: cannot abort upload 1a2b: access denied
///
/// Anything a caller could act on belongs in a Result instead; the log is for
/// what is left once an error has already been returned or cannot be. Phase
/// summaries and checksum tables are program output and go through
/// integra::Reporter, never through here.
///
/// INTEGRA_LOG_LEVEL sets the lowest level printed. It takes a level name
/// (debug, verbose, warning, error) or its number (0, 1, 3, 4) and defaults
/// to verbose. Debug lines are compiled out of NDEBUG builds.
///
/// \file Logging.h

#ifndef FMT_STRING
#define FMT_STRING(...) __VA_ARGS__
#endif

/// Format std::error_code by its message rather than as category:value.
template <>
struct fmt::formatter<std::error_code> : formatter<string_view> {
  template <typename FormatterContext>
  auto format(std::error_code c, FormatterContext& ctx) const {
    return formatter<string_view>::format(c.message(), ctx);
  }
};

namespace integra {

enum class LogLevel {
  Debug = 0,
  Verbose = 1,
  Warning = 3,
  Error = 4,
};

INTEGRA_EXPORT void AbortApplication [[noreturn]] ();

namespace internal {

/// BaseName returns the part of a __FILE__ path after the last separator.
INTEGRA_EXPORT const char* BaseName(const char* path);

INTEGRA_EXPORT bool LogEnabled(LogLevel level);

INTEGRA_EXPORT void WriteLogLine(
    LogLevel level, const char* file, int line, const std::string& text);

template <typename F, typename... Args>
void
LogAt(LogLevel level, const char* file, int line, F fmt_string,
      Args&&... args) {
  if (!LogEnabled(level)) {
    return;
  }
  WriteLogLine(
      level, file, line,
      fmt::format(fmt_string, std::forward<Args>(args)...));
}

}  // namespace internal

}  // namespace integra

#define INTEGRA_LOG_AT(level, fmt_string, ...)                                 \
  ::integra::internal::LogAt(                                                  \
      (level), __FILE__, __LINE__, FMT_STRING(fmt_string), ##__VA_ARGS__)

#define INTEGRA_LOG_ERROR(fmt_string, ...)                                     \
  INTEGRA_LOG_AT(::integra::LogLevel::Error, fmt_string, ##__VA_ARGS__)
#define INTEGRA_LOG_WARN(fmt_string, ...)                                      \
  INTEGRA_LOG_AT(::integra::LogLevel::Warning, fmt_string, ##__VA_ARGS__)
#define INTEGRA_LOG_VERBOSE(fmt_string, ...)                                   \
  INTEGRA_LOG_AT(::integra::LogLevel::Verbose, fmt_string, ##__VA_ARGS__)

#ifndef NDEBUG
#define INTEGRA_LOG_DEBUG(fmt_string, ...)                                     \
  INTEGRA_LOG_AT(::integra::LogLevel::Debug, fmt_string, ##__VA_ARGS__)
#else
#define INTEGRA_LOG_DEBUG(...)                                                 \
  do {                                                                         \
  } while (0)
#endif

/// INTEGRA_LOG_VASSERT aborts with the formatted message unless cond holds.
/// The message arguments are only evaluated on failure.
#define INTEGRA_LOG_VASSERT(cond, fmt_string, ...)                             \
  do {                                                                         \
    if (!(cond)) {                                                             \
      ::integra::internal::WriteLogLine(                                       \
          ::integra::LogLevel::Error, __FILE__, __LINE__,                      \
          fmt::format(FMT_STRING(fmt_string), ##__VA_ARGS__));                 \
      ::integra::AbortApplication();                                           \
    }                                                                          \
  } while (0)

#define INTEGRA_LOG_ASSERT(cond)                                               \
  INTEGRA_LOG_VASSERT(cond, "assertion not true: {}", #cond)

/// Like INTEGRA_LOG_ASSERT but only checked in debug builds, for invariants
/// on hot paths such as part indexing.
#ifndef NDEBUG
#define INTEGRA_LOG_DEBUG_ASSERT(cond) INTEGRA_LOG_ASSERT(cond)
#else
#define INTEGRA_LOG_DEBUG_ASSERT(cond)                                         \
  do {                                                                         \
  } while (0)
#endif

#endif
