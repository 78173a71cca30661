#ifndef INTEGRA_LIBUPLOAD_INTEGRA_UPLOADSTATUS_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_UPLOADSTATUS_H_

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "integra/Result.h"
#include "integra/config.h"

namespace integra {

enum class UploadStage {
  Initialization,
  PartUpload,
  Verification,
  Completion,
};

INTEGRA_EXPORT const char* StageName(UploadStage stage);

/// An UploadPhase is the recorded outcome of one stage of an upload. The part
/// number is only meaningful for UploadStage::PartUpload.
struct INTEGRA_EXPORT UploadPhase {
  UploadStage stage{UploadStage::Initialization};
  int32_t part_number{};
  bool success{};
  std::string message;
  std::optional<CopyableErrorInfo> error;

  /// Summary renders the phase as a single line, e.g.,
  ///
  ///     ✓ part upload (Part 2): Uploaded and verified (10/12 bytes)
  ///     ✗ upload initialization: Failed to initiate upload (bucket ...)
  ///
  /// The error is only shown for failed phases.
  std::string Summary() const;
};

/// UploadStatus is the audit trail of an upload run: an append-only history
/// of phases plus at most one pending phase.
///
/// A phase must be started before it can be ended, and only one phase can be
/// pending at a time. Part uploads run concurrently, so the dispatcher funnels
/// them through a single collector that uses RecordPhase.
///
/// All methods are thread safe.
class INTEGRA_EXPORT UploadStatus {
public:
  UploadStatus() = default;
  UploadStatus(const UploadStatus& no_copy) = delete;
  UploadStatus& operator=(const UploadStatus& no_copy) = delete;

  /// StartPhase begins a phase. It is an error to start a phase while another
  /// phase is pending.
  Result<void> StartPhase(UploadStage stage, int32_t part_number = 0);

  /// EndPhase finishes the pending phase and appends it to the history. It is
  /// an error to end a phase when none is pending.
  Result<void> EndPhase(
      bool success, const std::string& message,
      const std::optional<CopyableErrorInfo>& error = std::nullopt);

  /// RecordPhase starts and ends a phase as one step so that no other caller
  /// can interleave between the two.
  Result<void> RecordPhase(
      UploadStage stage, int32_t part_number, bool success,
      const std::string& message,
      const std::optional<CopyableErrorInfo>& error = std::nullopt);

  std::vector<UploadPhase> phases() const;

  bool HasPendingPhase() const;

  /// FailedPhase returns the first failed phase, if any
  std::optional<UploadPhase> FailedPhase() const;

  /// Summary renders the header "=== Upload Phase Summary ===" followed by
  /// one line per recorded phase.
  std::string Summary() const;

private:
  Result<void> StartPhaseLocked(UploadStage stage, int32_t part_number);
  Result<void> EndPhaseLocked(
      bool success, const std::string& message,
      const std::optional<CopyableErrorInfo>& error);

  mutable std::mutex mutex_;
  std::vector<UploadPhase> phases_;
  std::optional<UploadPhase> pending_;
};

}  // namespace integra

#endif
