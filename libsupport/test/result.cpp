#include "integra/Result.h"

#include <sstream>
#include <string>
#include <type_traits>

#include "integra/ErrorCode.h"
#include "integra/Logging.h"
#include "integra/Strings.h"

namespace {

std::string
ToString(const integra::ErrorInfo& ei) {
  std::ostringstream out;
  out << ei;
  return out.str();
}

void
TestConversions() {
  static_assert(std::is_convertible_v<integra::ErrorCode, std::error_code>);
  static_assert(
      !std::is_convertible_v<integra::ErrorInfo, std::error_code>,
      "dropping the message must be explicit");
  static_assert(
      !std::is_convertible_v<std::errc, integra::ErrorInfo>,
      "conditions are compared against, not returned");

  integra::ErrorInfo not_found = integra::ErrorCode::NotFound;
  INTEGRA_LOG_ASSERT(not_found == integra::ErrorCode::NotFound);
  INTEGRA_LOG_ASSERT(not_found != integra::ErrorCode::InvalidArgument);
  INTEGRA_LOG_ASSERT(not_found == std::errc::no_such_file_or_directory);
  INTEGRA_LOG_ASSERT(!(not_found == std::errc::io_error));
}

void
TestMessages() {
  integra::ErrorInfo err(integra::ErrorCode::NotFound, "0");
  INTEGRA_LOG_ASSERT(ToString(err) == "0");

  err = err.WithContext("1");
  std::string found = ToString(err);
  INTEGRA_LOG_VASSERT(found == "1: 0", "found {}", found);

  err = err.WithContext("part {}", 2);
  found = ToString(err);
  INTEGRA_LOG_VASSERT(found == "part 2: 1: 0", "found {}", found);

  std::string long_string(2 * integra::ErrorInfo::kMaxMessageSize, 'x');
  long_string += "sentinel";
  err = err.WithContext(long_string);
  found = ToString(err);
  INTEGRA_LOG_VASSERT(
      found.size() == integra::ErrorInfo::kMaxMessageSize &&
          integra::HasSuffix(found, "sentinel: part 2: 1: 0"),
      "found {} bytes ending {}", found.size(),
      found.substr(found.size() - 30));
}

void
TestCodeMessage() {
  integra::ErrorInfo bare = integra::ErrorCode::NotFound;
  std::error_code ec = integra::ErrorCode::NotFound;
  INTEGRA_LOG_ASSERT(ToString(bare) == ec.message());

  integra::ErrorInfo err = bare.WithContext("more");
  std::string expected = "more: " + ec.message();
  std::string found = ToString(err);
  INTEGRA_LOG_VASSERT(
      found == expected, "expected {} but found {}", expected, found);
}

void
TestNewerErrorTakesMessage() {
  integra::ErrorInfo older(integra::ErrorCode::NotFound, "1");
  older = older.WithContext("one");
  INTEGRA_LOG_ASSERT(ToString(older) == "one: 1");

  integra::ErrorInfo newer(integra::ErrorCode::InvalidArgument, "2");
  newer = newer.WithContext("two");
  INTEGRA_LOG_ASSERT(ToString(newer) == "two: 2");

  // The older error keeps its code but has lost its message
  INTEGRA_LOG_ASSERT(older == integra::ErrorCode::NotFound);
  std::error_code ec = integra::ErrorCode::NotFound;
  std::string found = ToString(older);
  INTEGRA_LOG_VASSERT(found == ec.message(), "found {}", found);
  INTEGRA_LOG_ASSERT(ToString(newer) == "two: 2");
}

void
TestFmt() {
  integra::Result<void> res = integra::ErrorCode::NotFound;
  INTEGRA_LOG_ASSERT(!res);

  auto err = res.error().WithContext("listing parts");
  std::string streamed = ToString(err);
  std::string formatted = fmt::format("{}", err);
  INTEGRA_LOG_VASSERT(
      formatted == streamed, "streamed {} but formatted {}", streamed,
      formatted);
}

void
TestCopyable() {
  integra::CopyableErrorInfo copied;
  {
    integra::ErrorInfo err(integra::ErrorCode::InvalidArgument, "bad part");
    copied = err.WithContext("uploading");
  }
  // A later error on this thread does not touch the copy
  integra::ErrorInfo later(integra::ErrorCode::NotFound, "later");

  INTEGRA_LOG_ASSERT(
      copied.error_code() == integra::ErrorCode::InvalidArgument);
  INTEGRA_LOG_VASSERT(
      copied.message() == "uploading: bad part", "found {}", copied.message());

  copied = copied.WithContext("worker {}", 3);
  INTEGRA_LOG_ASSERT(copied.message() == "worker 3: uploading: bad part");

  integra::ErrorInfo restored(copied);
  restored = restored.WithContext("restored");
  std::string found = ToString(restored);
  INTEGRA_LOG_VASSERT(
      found == "restored: worker 3: uploading: bad part", "found {}", found);

  integra::CopyableErrorInfo bare = integra::ErrorCode::NotFound;
  INTEGRA_LOG_ASSERT(bare.message().empty());
  std::error_code ec = integra::ErrorCode::NotFound;
  INTEGRA_LOG_ASSERT(fmt::format("{}", bare) == ec.message());
}

integra::Result<int>
Fails() {
  return INTEGRA_ERROR(integra::ErrorCode::NotFound, "no part {}", 7);
}

integra::Result<int>
AddsContext() {
  int v = INTEGRA_CHECKED_CONTEXT(Fails(), "while checking");
  return v + 1;
}

integra::Result<int>
AddsCallSite() {
  int v = INTEGRA_CHECKED(Fails());
  return v + 1;
}

integra::Result<int>
Succeeds() {
  int v = INTEGRA_CHECKED(integra::Result<int>(41));
  INTEGRA_CHECKED(integra::ResultSuccess());
  return v + 1;
}

void
TestChecked() {
  auto res = AddsContext();
  INTEGRA_LOG_ASSERT(!res);
  INTEGRA_LOG_ASSERT(res.error() == integra::ErrorCode::NotFound);
  std::string found = ToString(res.error());
  INTEGRA_LOG_VASSERT(
      integra::HasPrefix(found, "while checking (result.cpp:") &&
          found.find("): no part 7 (result.cpp:") != std::string::npos,
      "found {}", found);

  auto bare = AddsCallSite();
  INTEGRA_LOG_ASSERT(!bare);
  found = ToString(bare.error());
  INTEGRA_LOG_VASSERT(
      integra::HasPrefix(found, "from result.cpp:"), "found {}", found);

  auto ok = Succeeds();
  INTEGRA_LOG_ASSERT(ok && ok.value() == 42);
}

}  // namespace

int
main() {
  TestConversions();
  TestMessages();
  TestCodeMessage();
  TestNewerErrorTakesMessage();
  TestFmt();
  TestCopyable();
  TestChecked();

  return 0;
}
