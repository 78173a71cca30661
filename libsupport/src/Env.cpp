#include "integra/Env.h"

#include <cstdlib>

#include "integra/Strings.h"

std::optional<std::string>
integra::GetEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::optional<bool>
integra::GetEnvFlag(const std::string& name) {
  std::optional<std::string> value = GetEnv(name);
  if (!value) {
    return std::nullopt;
  }
  std::string lower = ToLower(TrimSpace(*value));
  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  return std::nullopt;
}

bool
integra::SetEnv(
    const std::string& name, const std::string& value, bool overwrite) {
  return setenv(name.c_str(), value.c_str(), overwrite ? 1 : 0) == 0;
}

bool
integra::UnsetEnv(const std::string& name) {
  return unsetenv(name.c_str()) == 0;
}
