#include "integra/Logging.h"

#include <string>
#include <system_error>

#include "integra/Env.h"

int
main() {
  // Read once, on the first log line
  INTEGRA_LOG_ASSERT(integra::SetEnv("INTEGRA_LOG_LEVEL", "warning", true));

  INTEGRA_LOG_ASSERT(!integra::internal::LogEnabled(integra::LogLevel::Debug));
  INTEGRA_LOG_ASSERT(
      !integra::internal::LogEnabled(integra::LogLevel::Verbose));
  INTEGRA_LOG_ASSERT(integra::internal::LogEnabled(integra::LogLevel::Warning));
  INTEGRA_LOG_ASSERT(integra::internal::LogEnabled(integra::LogLevel::Error));

  INTEGRA_LOG_ASSERT(
      std::string(integra::internal::BaseName("/a/b/Uploader.cpp")) ==
      "Uploader.cpp");
  INTEGRA_LOG_ASSERT(
      std::string(integra::internal::BaseName("Uploader.cpp")) ==
      "Uploader.cpp");

  INTEGRA_LOG_ERROR("part {} failed", 3);
  INTEGRA_LOG_WARN("retrying in {:.2f}s", 2.0 / 3.0);
  INTEGRA_LOG_WARN(
      "store said: {}", std::make_error_code(std::errc::connection_reset));
  INTEGRA_LOG_VERBOSE("below the threshold");
  INTEGRA_LOG_DEBUG("below the threshold and only in debug builds");

  int evaluated = 0;
  INTEGRA_LOG_VASSERT(true, "not formatted {}", ++evaluated);
  INTEGRA_LOG_ASSERT(evaluated == 0);

  return 0;
}
