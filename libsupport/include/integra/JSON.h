#ifndef INTEGRA_LIBSUPPORT_INTEGRA_JSON_H_
#define INTEGRA_LIBSUPPORT_INTEGRA_JSON_H_

#include <string>

#include <nlohmann/json.hpp>

#include "integra/Result.h"
#include "integra/config.h"

namespace integra {

/// JsonDump renders a request/response document for verbose output. Keys
/// keep their insertion order. A negative indent gives one line. Fails with
/// ErrorCode::JsonDumpFailed, e.g., when a store returned invalid UTF-8.
INTEGRA_EXPORT Result<std::string> JsonDump(
    const nlohmann::ordered_json& doc, int indent = -1);

}  // namespace integra

#endif
