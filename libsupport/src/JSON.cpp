#include "integra/JSON.h"

#include "integra/ErrorCode.h"

integra::Result<std::string>
integra::JsonDump(const nlohmann::ordered_json& doc, int indent) {
  try {
    return doc.dump(indent);
  } catch (const nlohmann::json::exception& e) {
    return INTEGRA_ERROR(
        ErrorCode::JsonDumpFailed, "rendering json: {}", e.what());
  }
}
