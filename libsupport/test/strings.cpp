#include "integra/Strings.h"

#include <list>
#include <string>
#include <vector>

#include "integra/Logging.h"

namespace {

using Pieces = std::vector<std::string_view>;

void
TestAffixes() {
  INTEGRA_LOG_ASSERT(integra::HasSuffix("crc32-3", "-3"));
  INTEGRA_LOG_ASSERT(integra::HasSuffix("crc32", ""));
  INTEGRA_LOG_ASSERT(!integra::HasSuffix("crc32", "-3"));
  INTEGRA_LOG_ASSERT(!integra::HasSuffix("", "-3"));

  INTEGRA_LOG_ASSERT(integra::HasPrefix("https://s3.local", "https://"));
  INTEGRA_LOG_ASSERT(integra::HasPrefix("https://s3.local", ""));
  INTEGRA_LOG_ASSERT(!integra::HasPrefix("http://s3.local", "https://"));
  INTEGRA_LOG_ASSERT(!integra::HasPrefix("", "https://"));

  INTEGRA_LOG_ASSERT(integra::TrimSpace("  key = value \t\r") == "key = value");
  INTEGRA_LOG_ASSERT(integra::TrimSpace(" \t ").empty());
  INTEGRA_LOG_ASSERT(integra::ToLower("Aws_Access_KEY") == "aws_access_key");
}

void
TestSplitView() {
  INTEGRA_LOG_ASSERT(
      integra::SplitView("192.168.5.4", ".") ==
      Pieces({"192", "168", "5", "4"}));
  INTEGRA_LOG_ASSERT(
      integra::SplitView("no delimiter", ";") == Pieces({"no delimiter"}));
  INTEGRA_LOG_ASSERT(integra::SplitView("", " ") == Pieces({""}));
  INTEGRA_LOG_ASSERT(
      integra::SplitView(",a,,b,", ",") == Pieces({"", "a", "", "b", ""}));
  INTEGRA_LOG_ASSERT(
      integra::SplitView("key=value=more", "=", 1) ==
      Pieces({"key", "value=more"}));
  INTEGRA_LOG_ASSERT(
      integra::SplitView("a::b::c", "::") == Pieces({"a", "b", "c"}));
  INTEGRA_LOG_ASSERT(integra::SplitView("abc", "") == Pieces({"abc"}));
}

void
TestJoin() {
  INTEGRA_LOG_ASSERT(
      integra::Join(std::vector<int32_t>{1, 3, 5}, " ") == "1 3 5");
  INTEGRA_LOG_ASSERT(
      integra::Join(std::list<std::string>{"a", "b"}, ", ") == "a, b");
  INTEGRA_LOG_ASSERT(integra::Join(std::vector<int>{7}, ",") == "7");
  INTEGRA_LOG_ASSERT(integra::Join(std::vector<std::string>{}, " ").empty());
}

void
TestBase64() {
  INTEGRA_LOG_ASSERT(integra::ToBase64("") == "");
  INTEGRA_LOG_ASSERT(integra::ToBase64("integrity") == "aW50ZWdyaXR5");
  INTEGRA_LOG_ASSERT(integra::ToBase64("upload") == "dXBsb2Fk");
  INTEGRA_LOG_ASSERT(integra::ToBase64("parts") == "cGFydHM=");
  INTEGRA_LOG_ASSERT(integra::ToBase64("part") == "cGFydA==");
  // Big-endian CRC32 of "Hello, World!"
  INTEGRA_LOG_ASSERT(
      integra::ToBase64(std::string("\xEC\x4A\xC3\xD0", 4)) == "7ErD0A==");

  INTEGRA_LOG_ASSERT(integra::FromBase64("") == "");
  INTEGRA_LOG_ASSERT(integra::FromBase64("cGFydHM=") == "parts");
  INTEGRA_LOG_ASSERT(integra::FromBase64("cGFydA==") == "part");
  INTEGRA_LOG_ASSERT(integra::FromBase64("dXBsb2Fk") == "upload");
  INTEGRA_LOG_ASSERT(
      integra::FromBase64("7ErD0A==") == std::string("\xEC\x4A\xC3\xD0", 4));

  INTEGRA_LOG_ASSERT(integra::IsBase64(""));
  INTEGRA_LOG_ASSERT(integra::IsBase64("cGFydA=="));
  INTEGRA_LOG_ASSERT(integra::IsBase64("cGFydHM="));
  INTEGRA_LOG_ASSERT(!integra::IsBase64("cGFyd"));
  INTEGRA_LOG_ASSERT(!integra::IsBase64("cG=ydA=="));
  INTEGRA_LOG_ASSERT(!integra::IsBase64("cGFyd==="));
  INTEGRA_LOG_ASSERT(!integra::IsBase64("cGF!dA=="));
}

}  // namespace

int
main() {
  TestAffixes();
  TestSplitView();
  TestJoin();
  TestBase64();

  return 0;
}
