#ifndef INTEGRA_LIBSUPPORT_INTEGRA_CANCELLATION_H_
#define INTEGRA_LIBSUPPORT_INTEGRA_CANCELLATION_H_

#include <atomic>

#include "integra/config.h"

namespace integra {

/// A CancellationToken is a one-way flag shared between whoever requests
/// cancellation (a signal handler, a test, a failed worker) and the code that
/// polls for it. Cancel is async-signal-safe.
class INTEGRA_EXPORT CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken& no_copy) = delete;
  CancellationToken& operator=(const CancellationToken& no_copy) = delete;

  void Cancel() { cancelled_.store(true, std::memory_order_release); }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

private:
  std::atomic<bool> cancelled_{false};
  static_assert(std::atomic<bool>::is_always_lock_free);
};

/// Convenience for optional tokens
inline bool
IsCancelled(const CancellationToken* token) {
  return token != nullptr && token->IsCancelled();
}

}  // namespace integra

#endif
