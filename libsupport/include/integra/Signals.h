#ifndef INTEGRA_LIBSUPPORT_INTEGRA_SIGNALS_H_
#define INTEGRA_LIBSUPPORT_INTEGRA_SIGNALS_H_

#include "integra/Cancellation.h"
#include "integra/Result.h"
#include "integra/config.h"

namespace integra {

/// InstallCancellationHandlers routes SIGINT and SIGTERM to token->Cancel().
/// The handlers are one-shot: a second interrupt terminates the process with
/// the default disposition. SIGPIPE is ignored so that a peer closing a
/// connection surfaces as a transport error rather than killing the process.
///
/// The token must outlive the process or a later call to
/// UninstallCancellationHandlers.
INTEGRA_EXPORT Result<void> InstallCancellationHandlers(
    CancellationToken* token);

/// UninstallCancellationHandlers restores the default dispositions of SIGINT
/// and SIGTERM.
INTEGRA_EXPORT Result<void> UninstallCancellationHandlers();

}  // namespace integra

#endif
