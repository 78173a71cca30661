#include "integra/FileSystem.h"

#include <unistd.h>

#include <string>
#include <system_error>

#include "integra/Logging.h"
#include "integra/Strings.h"

namespace {

void
TestJoinPath() {
  INTEGRA_LOG_ASSERT(
      integra::JoinPath("/home/u/.aws", "credentials") ==
      "/home/u/.aws/credentials");
  INTEGRA_LOG_ASSERT(
      integra::JoinPath("/home/u/.aws/", "credentials") ==
      "/home/u/.aws/credentials");
}

void
TestReadWrite(const std::string& dir) {
  std::string path = integra::JoinPath(dir, "payload.bin");
  std::string contents("Hello, World");
  auto write_res = integra::WriteFile(
      path, reinterpret_cast<const uint8_t*>(contents.data()), contents.size());
  INTEGRA_LOG_VASSERT(write_res, "writing: {}", write_res.error());

  auto read_res = integra::ReadFile(path);
  INTEGRA_LOG_VASSERT(read_res, "reading: {}", read_res.error());
  INTEGRA_LOG_ASSERT(
      std::string(read_res.value().begin(), read_res.value().end()) ==
      contents);

  std::string empty_path = integra::JoinPath(dir, "empty.bin");
  auto empty_write = integra::WriteFile(
      empty_path, reinterpret_cast<const uint8_t*>(contents.data()), 0);
  INTEGRA_LOG_VASSERT(empty_write, "writing: {}", empty_write.error());
  auto empty_read = integra::ReadFile(empty_path);
  INTEGRA_LOG_ASSERT(empty_read && empty_read.value().empty());
}

void
TestReadErrors(const std::string& dir) {
  auto missing = integra::ReadFile(integra::JoinPath(dir, "does-not-exist"));
  INTEGRA_LOG_ASSERT(!missing);
  INTEGRA_LOG_ASSERT(missing.error() == integra::ErrorCode::NotFound);
  INTEGRA_LOG_ASSERT(
      missing.error() == std::errc::no_such_file_or_directory);

  auto dir_read = integra::ReadFile(dir);
  INTEGRA_LOG_ASSERT(!dir_read);
  INTEGRA_LOG_ASSERT(dir_read.error() == integra::ErrorCode::NotFound);
}

}  // namespace

int
main() {
  TestJoinPath();

  std::string prefix("/tmp/integra-filesystem-");
  auto dir_res = integra::CreateUniqueDirectory(prefix);
  INTEGRA_LOG_VASSERT(dir_res, "creating directory: {}", dir_res.error());
  std::string dir = dir_res.value();
  INTEGRA_LOG_ASSERT(integra::HasPrefix(dir, prefix));
  INTEGRA_LOG_ASSERT(dir.size() == prefix.size() + 6);

  TestReadWrite(dir);
  TestReadErrors(dir);

  auto remove_res = integra::RemoveAll(dir);
  INTEGRA_LOG_VASSERT(remove_res, "removing: {}", remove_res.error());
  INTEGRA_LOG_ASSERT(access(dir.c_str(), F_OK) != 0);

  return 0;
}
