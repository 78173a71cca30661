#include "integra/Logging.h"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <optional>

#include "integra/Env.h"
#include "integra/Strings.h"

namespace {

std::optional<integra::LogLevel>
ParseLevel(const std::string& text) {
  std::string name = integra::ToLower(text);
  if (name == "debug" || name == "0") {
    return integra::LogLevel::Debug;
  }
  if (name == "verbose" || name == "1") {
    return integra::LogLevel::Verbose;
  }
  if (name == "warning" || name == "warn" || name == "3") {
    return integra::LogLevel::Warning;
  }
  if (name == "error" || name == "4") {
    return integra::LogLevel::Error;
  }
  return std::nullopt;
}

integra::LogLevel
ThresholdFromEnv() {
  std::optional<std::string> text = integra::GetEnv("INTEGRA_LOG_LEVEL");
  if (!text) {
    return integra::LogLevel::Verbose;
  }
  if (std::optional<integra::LogLevel> level = ParseLevel(*text); level) {
    return *level;
  }
  std::cerr << "WARNING ignoring unknown INTEGRA_LOG_LEVEL " << *text << "\n";
  return integra::LogLevel::Verbose;
}

const char*
LevelName(integra::LogLevel level) {
  switch (level) {
  case integra::LogLevel::Debug:
    return "DEBUG";
  case integra::LogLevel::Verbose:
    return "VERBOSE";
  case integra::LogLevel::Warning:
    return "WARNING";
  case integra::LogLevel::Error:
    return "ERROR";
  }
  return "UNKNOWN";
}

}  // namespace

const char*
integra::internal::BaseName(const char* path) {
  const char* slash = std::strrchr(path, '/');
  return slash == nullptr ? path : slash + 1;
}

bool
integra::internal::LogEnabled(LogLevel level) {
  static const LogLevel threshold = ThresholdFromEnv();
  return static_cast<int>(level) >= static_cast<int>(threshold);
}

void
integra::internal::WriteLogLine(
    LogLevel level, const char* file, int line, const std::string& text) {
  // Upload workers log concurrently; keep their lines whole.
  static std::mutex lock;
  std::lock_guard<std::mutex> guard(lock);

  std::cerr << LevelName(level) << ' ' << BaseName(file) << ':' << line
            << ": " << text << '\n';
  if (level == LogLevel::Error) {
    std::cerr.flush();
  }
}

void
integra::AbortApplication() {
  std::abort();
}
