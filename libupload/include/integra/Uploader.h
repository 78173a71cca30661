#ifndef INTEGRA_LIBUPLOAD_INTEGRA_UPLOADER_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_UPLOADER_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "integra/Cancellation.h"
#include "integra/ObjectStore.h"
#include "integra/PartSelector.h"
#include "integra/Partitioner.h"
#include "integra/Reporter.h"
#include "integra/Result.h"
#include "integra/UploadDispatcher.h"
#include "integra/UploadStatus.h"
#include "integra/config.h"

namespace integra {

struct UploadOptions {
  std::string bucket;
  std::string key;
  /// Exactly one of text and file_path must be set
  std::optional<std::string> text;
  std::optional<std::string> file_path;
  uint64_t part_size{kDefaultPartSize};
  uint64_t min_part_size{kMinPartSize};
  /// Part numbers to include in the completed object; empty means all
  std::vector<int32_t> parts;
  bool upload_empty_part{false};
  bool verbose{false};
  uint32_t num_workers{UploadDispatcher::kDefaultNumWorkers};
};

/// An UploadJob is a validated UploadOptions with its payload loaded and
/// partitioned. Copies share the payload.
class INTEGRA_EXPORT UploadJob {
public:
  /// Make fails with ConfigurationError for missing or conflicting options
  /// and with the file system error if the payload file cannot be read.
  static Result<UploadJob> Make(UploadOptions options);

  const UploadOptions& options() const { return options_; }
  const std::vector<uint8_t>& payload() const { return *payload_; }
  const PartitionView& view() const { return view_; }
  const PartSelector& selector() const { return selector_; }

  ObjectRef object() const { return ObjectRef{options_.bucket, options_.key}; }

  /// Source describes where the payload came from, for messages
  std::string Source() const;

private:
  UploadJob(
      UploadOptions options,
      std::shared_ptr<const std::vector<uint8_t>> payload, PartitionView view,
      PartSelector selector)
      : options_(std::move(options)),
        payload_(std::move(payload)),
        view_(view),
        selector_(std::move(selector)) {}

  UploadOptions options_;
  std::shared_ptr<const std::vector<uint8_t>> payload_;
  PartitionView view_;
  PartSelector selector_;
};

struct UploadReport {
  std::string upload_id;
  /// Every uploaded part, ascending
  std::vector<PartInfo> part_infos;
  /// Part numbers the object was completed with, ascending
  std::vector<int32_t> included;
  std::vector<ListedPart> listed;
  CompleteUploadResponse completion;
  /// CRC32 of the whole payload
  std::string object_checksum;
  /// Checksum of the checksums of the included parts
  std::string composite_checksum;
};

/// Uploader runs one integrity-checked multipart upload:
///
///   1. Initialization: create the multipart upload
///   2. PartUpload: upload every part concurrently
///   3. select the parts for completion
///   4. Verification: list the stored parts and compare checksums with the
///      local data, always over every uploaded part
///   5. Completion: complete the upload with the selected parts
///
/// Every stage is recorded in status(), also on failure. Once an upload has
/// been created, any later failure aborts it exactly once before Run
/// returns.
class INTEGRA_EXPORT Uploader {
public:
  Uploader(
      ObjectStore* store, Reporter* reporter, const CancellationToken* token)
      : store_(store), reporter_(reporter), token_(token) {}

  Uploader(const Uploader& no_copy) = delete;
  Uploader& operator=(const Uploader& no_copy) = delete;

  Result<UploadReport> Run(const UploadJob& job);

  const UploadStatus& status() const { return status_; }

private:
  Result<std::string> Initiate(const UploadJob& job);

  Result<std::vector<ListedPart>> Verify(
      const UploadRef& upload, const std::vector<Part>& parts);

  Result<CompleteUploadResponse> Complete(
      const UploadRef& upload, const PartSelection& selection,
      const std::string& object_checksum);

  PartSelection Select(const UploadJob& job, const DispatchResult& dispatched);

  /// EndFailedPhase ends the pending phase as failed with err
  void EndFailedPhase(const std::string& message, const ErrorInfo& err);

  /// Abort aborts upload; failures are logged and otherwise ignored
  void Abort(const UploadRef& upload);

  ObjectStore* store_;
  Reporter* reporter_;
  const CancellationToken* token_;
  UploadStatus status_;
};

}  // namespace integra

#endif
