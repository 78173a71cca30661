#ifndef INTEGRA_LIBSUPPORT_INTEGRA_ENV_H_
#define INTEGRA_LIBSUPPORT_INTEGRA_ENV_H_

#include <optional>
#include <string>

#include "integra/config.h"

/// Access to the process environment, where the AWS_* settings used to build
/// an S3 client and INTEGRA_LOG_LEVEL come from.
///
/// The getters treat an empty variable the same as an unset one, which is how
/// the AWS tooling reads them.
///
/// \file Env.h

namespace integra {

INTEGRA_EXPORT std::optional<std::string> GetEnv(const std::string& name);

/// GetEnvFlag reads true/false, yes/no, on/off or 1/0 in any case. Any other
/// value is std::nullopt.
INTEGRA_EXPORT std::optional<bool> GetEnvFlag(const std::string& name);

/// SetEnv returns false if the variable could not be set. An existing value
/// is left alone, and true returned, unless overwrite is set.
INTEGRA_EXPORT bool SetEnv(
    const std::string& name, const std::string& value, bool overwrite);

INTEGRA_EXPORT bool UnsetEnv(const std::string& name);

}  // namespace integra

#endif
