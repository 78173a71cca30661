#ifndef INTEGRA_LIBUPLOAD_INTEGRA_UPLOADDISPATCHER_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_UPLOADDISPATCHER_H_

#include <cstdint>
#include <vector>

#include "integra/Cancellation.h"
#include "integra/ObjectStore.h"
#include "integra/Partitioner.h"
#include "integra/Reporter.h"
#include "integra/Result.h"
#include "integra/UploadStatus.h"
#include "integra/WorkQueue.h"
#include "integra/config.h"

namespace integra {

struct DispatchResult {
  /// Ascending by part number
  std::vector<CompletedPart> completed;
  /// Ascending by part number
  std::vector<PartInfo> part_infos;
};

/// UploadDispatcher uploads the parts of one multipart upload with a fixed
/// pool of workers.
///
/// The calling thread feeds a bounded work queue. Workers upload parts and
/// hand results to a single collector thread, which records one PartUpload
/// phase per part in ascending part order. The first failure wins: it stops
/// any further dispatch, parts already in flight are allowed to finish, and
/// exactly one failed PartUpload phase is recorded for it.
///
/// Run does not abort the remote upload on failure; that is up to the
/// caller.
class INTEGRA_EXPORT UploadDispatcher {
public:
  static constexpr uint32_t kDefaultNumWorkers = 10;

  UploadDispatcher(
      ObjectStore* store, UploadRef upload, UploadStatus* status,
      Reporter* reporter, const CancellationToken* token,
      uint32_t num_workers = kDefaultNumWorkers)
      : store_(store),
        upload_(std::move(upload)),
        status_(status),
        reporter_(reporter),
        token_(token),
        num_workers_(num_workers) {}

  /// Run uploads parts, which must be ascending by part number. total_bytes
  /// is only used for progress messages.
  Result<DispatchResult> Run(std::vector<Part> parts, uint64_t total_bytes);

private:
  struct PartResult {
    CompletedPart completed;
    PartInfo info;
  };

  struct PartFailure {
    int32_t part_number{};
    CopyableErrorInfo error;
  };

  Result<PartResult> UploadOne(const Part& part);

  void Work(
      WorkQueue<Part>* work, WorkQueue<PartResult>* results,
      FirstErrorSlot<PartFailure>* first_error);

  void Collect(
      const std::vector<int32_t>& order, uint64_t total_bytes,
      WorkQueue<PartResult>* results, DispatchResult* out);

  ObjectStore* store_;
  UploadRef upload_;
  UploadStatus* status_;
  Reporter* reporter_;
  const CancellationToken* token_;
  uint32_t num_workers_;
};

}  // namespace integra

#endif
