#include "integra/FileSystem.h"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/core.h>

#include "integra/ErrorCode.h"

namespace fs = boost::filesystem;

namespace {

constexpr char kSepChar = '/';

}  // namespace

integra::Result<std::vector<uint8_t>>
integra::ReadFile(const std::string& path) {
  boost::system::error_code err;
  if (!fs::is_regular_file(path, err)) {
    if (err) {
      return INTEGRA_ERROR(
          std::error_code(err.value(), err.category()), "reading {}: {}",
          path, err.message());
    }
    return INTEGRA_ERROR(
        ErrorCode::NotFound, "reading {}: not a regular file", path);
  }

  std::ifstream ifile(path, std::ios_base::binary);
  if (!ifile) {
    return INTEGRA_ERROR(
        ErrorCode::LocalStorageError, "opening {}: {}", path,
        std::strerror(errno));
  }

  std::vector<uint8_t> data(
      (std::istreambuf_iterator<char>(ifile)),
      std::istreambuf_iterator<char>());
  if (ifile.bad()) {
    return INTEGRA_ERROR(ErrorCode::LocalStorageError, "reading {}", path);
  }
  return std::move(data);
}

integra::Result<void>
integra::WriteFile(
    const std::string& path, const uint8_t* data, uint64_t size) {
  std::ofstream out(path, std::ios_base::binary | std::ios_base::trunc);
  if (!out) {
    return INTEGRA_ERROR(
        ErrorCode::LocalStorageError, "creating {}: {}", path,
        std::strerror(errno));
  }
  out.write(reinterpret_cast<const char*>(data), size); /* NOLINT */
  out.close();
  if (out.fail()) {
    return INTEGRA_ERROR(
        ErrorCode::LocalStorageError, "writing {} bytes to {}", size, path);
  }
  return ResultSuccess();
}

integra::Result<std::string>
integra::CreateUniqueDirectory(std::string_view prefix) {
  // mkdtemp fills in the trailing Xs and wants a mutable, terminated name
  std::string name = fmt::format("{}XXXXXX", prefix);
  std::vector<char> buf(name.begin(), name.end());
  buf.emplace_back('\0');

  if (mkdtemp(buf.data()) == nullptr) {
    return INTEGRA_ERROR(
        ResultErrno(), "creating directory {}: {}", name,
        std::strerror(errno));
  }
  return std::string(buf.data());
}

integra::Result<void>
integra::RemoveAll(const std::string& path) {
  boost::system::error_code err;
  fs::remove_all(path, err);
  if (err) {
    return INTEGRA_ERROR(
        std::error_code(err.value(), err.category()), "removing {}: {}", path,
        err.message());
  }
  return ResultSuccess();
}

std::string
integra::JoinPath(std::string_view dir, std::string_view file) {
  if (!dir.empty() && dir.back() == kSepChar) {
    return fmt::format("{}{}", dir, file);
  }
  return fmt::format("{}{}{}", dir, kSepChar, file);
}
