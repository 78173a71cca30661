#include "integra/Signals.h"

#include <atomic>
#include <csignal>
#include <initializer_list>

namespace {

std::atomic<integra::CancellationToken*> kToken{nullptr};

void
CancelOnSignal(int) {
  // Only lock-free atomics may be touched here
  if (integra::CancellationToken* token = kToken.load(); token != nullptr) {
    token->Cancel();
  }
}

/// Set the disposition of each signal. While a handler runs every other
/// signal is blocked.
integra::Result<void>
SetDisposition(
    std::initializer_list<int> signals, void (*handler)(int), int flags) {
  struct sigaction action {};
  action.sa_handler = handler;
  action.sa_flags = flags;
  sigfillset(&action.sa_mask);

  for (int sig : signals) {
    if (sigaction(sig, &action, nullptr) != 0) {
      return INTEGRA_ERROR(
          integra::ResultErrno(), "setting disposition of signal {}", sig);
    }
  }
  return integra::ResultSuccess();
}

}  // namespace

integra::Result<void>
integra::InstallCancellationHandlers(CancellationToken* token) {
  if (token == nullptr) {
    return INTEGRA_ERROR(
        ErrorCode::InvalidArgument, "cancellation token must not be null");
  }
  kToken.store(token);

  INTEGRA_CHECKED_CONTEXT(
      SetDisposition(
          {SIGINT, SIGTERM}, CancelOnSignal, static_cast<int>(SA_RESETHAND)),
      "installing interrupt handlers");
  INTEGRA_CHECKED_CONTEXT(
      SetDisposition({SIGPIPE}, SIG_IGN, 0), "ignoring SIGPIPE");
  return ResultSuccess();
}

integra::Result<void>
integra::UninstallCancellationHandlers() {
  INTEGRA_CHECKED_CONTEXT(
      SetDisposition({SIGINT, SIGTERM}, SIG_DFL, 0),
      "restoring interrupt handlers");
  kToken.store(nullptr);
  return ResultSuccess();
}
