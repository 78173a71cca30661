#ifndef INTEGRA_LIBSUPPORT_INTEGRA_FILESYSTEM_H_
#define INTEGRA_LIBSUPPORT_INTEGRA_FILESYSTEM_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "integra/Result.h"
#include "integra/config.h"

namespace integra {

/// ReadFile reads the whole of a local file into memory. A path that is not a
/// regular file is ErrorCode::NotFound.
INTEGRA_EXPORT Result<std::vector<uint8_t>> ReadFile(const std::string& path);

/// WriteFile creates or truncates a local file and writes data to it.
INTEGRA_EXPORT Result<void> WriteFile(
    const std::string& path, const uint8_t* data, uint64_t size);

/// CreateUniqueDirectory creates a fresh directory named prefix followed by
/// six random characters, e.g., for scratch payload files in tests.
INTEGRA_EXPORT Result<std::string> CreateUniqueDirectory(
    std::string_view prefix);

/// RemoveAll deletes path and, if it is a directory, everything under it.
INTEGRA_EXPORT Result<void> RemoveAll(const std::string& path);

/// JoinPath joins a directory and a file name with a single separator.
INTEGRA_EXPORT std::string JoinPath(
    std::string_view dir, std::string_view file);

}  // namespace integra

#endif
