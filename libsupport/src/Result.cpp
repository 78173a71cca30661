#include "integra/Result.h"

#include <fmt/format.h>

namespace {

/// One per thread. Context is prepended, so the innermost error is at the end.
struct MessageBuffer {
  std::string text;
  uint64_t owner{};
  uint64_t last_id{};
};

thread_local MessageBuffer kBuffer;

}  // namespace

std::string
integra::internal::CallSite(const char* file, int line) {
  return fmt::format(" ({}:{})", BaseName(file), line);
}

integra::ErrorInfo::ErrorInfo(const std::error_code& ec, std::string_view text)
    : error_code_(ec) {
  Claim(text);
}

integra::ErrorInfo::ErrorInfo(const CopyableErrorInfo& copyable)
    : error_code_(copyable.error_code()) {
  if (!copyable.message().empty()) {
    Claim(copyable.message());
  }
}

bool
integra::ErrorInfo::OwnsBuffer() const {
  return message_id_ != 0 && kBuffer.owner == message_id_;
}

void
integra::ErrorInfo::Claim(std::string_view text) {
  message_id_ = ++kBuffer.last_id;
  kBuffer.owner = message_id_;
  if (text.size() > kMaxMessageSize) {
    text.remove_prefix(text.size() - kMaxMessageSize);
  }
  kBuffer.text.assign(text.data(), text.size());
}

void
integra::ErrorInfo::AddContext(std::string_view text) {
  if (!OwnsBuffer()) {
    if (message_id_ != 0) {
      INTEGRA_LOG_WARN(
          "context \"{}\" added to an error whose message was replaced by a "
          "newer error on this thread",
          text);
    }
    Claim(error_code_.message());
  }

  std::string& buf = kBuffer.text;
  buf.insert(0, ": ");
  buf.insert(0, text.data(), text.size());
  if (buf.size() > kMaxMessageSize) {
    buf.erase(0, buf.size() - kMaxMessageSize);
  }
}

std::string
integra::ErrorInfo::message() const {
  if (!OwnsBuffer()) {
    return error_code_.message();
  }
  return kBuffer.text;
}

std::ostream&
integra::ErrorInfo::Write(std::ostream& out) const {
  return out << message();
}

std::ostream&
integra::CopyableErrorInfo::Write(std::ostream& out) const {
  if (message_.empty()) {
    return out << error_code_.message();
  }
  return out << message_;
}

integra::Result<void>
integra::ResultSuccess() {
  return BOOST_OUTCOME_V2_NAMESPACE::success();
}
