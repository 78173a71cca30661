#ifndef INTEGRA_LIBUPLOAD_INTEGRA_MEMORYOBJECTSTORE_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_MEMORYOBJECTSTORE_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "integra/ObjectStore.h"
#include "integra/UploadErrors.h"

namespace integra {

/// MemoryObjectStore is an in-process ObjectStore that behaves like S3 for
/// the multipart upload calls. It validates bucket names, rejects unknown
/// buckets and upload ids, checks every part body against its checksum and
/// assembles objects on completion.
///
/// Faults can be injected per part number to exercise failure paths.
class INTEGRA_EXPORT MemoryObjectStore : public ObjectStore {
public:
  struct StoredObject {
    std::vector<uint8_t> data;
    std::string etag;
    std::string checksum;
    std::string object_checksum;
    std::vector<CompletedPart> parts;
  };

  /// Called at the start of each UploadPart with the part number, outside
  /// of any lock. Tests use it to add delays or cancel a token mid-flight.
  using UploadPartHook = std::function<void(int32_t)>;

  MemoryObjectStore() = default;

  void CreateBucket(const std::string& bucket);

  Result<std::string> CreateUpload(
      const ObjectRef& object, ChecksumAlgorithm algorithm,
      const CancellationToken* token) override;

  Result<UploadPartResponse> UploadPart(
      const UploadRef& upload, int32_t part_number, const uint8_t* body,
      uint64_t size, const std::string& checksum,
      const CancellationToken* token) override;

  Result<std::vector<ListedPart>> ListParts(
      const UploadRef& upload, const CancellationToken* token) override;

  Result<CompleteUploadResponse> CompleteUpload(
      const UploadRef& upload, const std::vector<CompletedPart>& parts,
      const std::string& object_checksum,
      const CancellationToken* token) override;

  Result<void> AbortUpload(const UploadRef& upload) override;

  /// Fault injection

  /// UploadPart of part_number fails with a transport error
  void InjectUploadPartFailure(int32_t part_number);
  /// UploadPart of part_number echoes a checksum that does not match the body
  void InjectEchoMismatch(int32_t part_number);
  /// ListParts reports a corrupted checksum for part_number
  void InjectChecksumMismatch(int32_t part_number);
  /// ListParts reports no checksum for part_number
  void InjectMissingChecksum(int32_t part_number);
  /// ListParts omits part_number
  void InjectMissingPart(int32_t part_number);
  /// ListParts reports part_number again in place of the part that follows
  void InjectDuplicateListing(int32_t part_number);
  void InjectCompleteFailure();
  void InjectAbortFailure();
  void SetUploadPartHook(UploadPartHook hook);

  /// Observation

  Result<StoredObject> GetObject(
      const std::string& bucket, const std::string& key) const;
  /// Number of multipart uploads neither completed nor aborted
  size_t open_uploads() const;
  uint64_t create_calls() const { return create_calls_; }
  uint64_t upload_part_calls() const { return upload_part_calls_; }
  uint64_t list_parts_calls() const { return list_parts_calls_; }
  uint64_t complete_calls() const { return complete_calls_; }
  uint64_t abort_calls() const { return abort_calls_; }
  /// Part numbers in the order UploadPart calls arrived
  std::vector<int32_t> upload_part_order() const;

private:
  struct StoredPart {
    std::vector<uint8_t> data;
    std::string etag;
    std::string checksum;
    std::string last_modified;
  };

  struct Upload {
    std::string bucket;
    std::string key;
    std::map<int32_t, StoredPart> parts;
  };

  Result<Upload*> FindUpload(const UploadRef& upload);

  mutable std::mutex mutex_;
  std::set<std::string> buckets_;
  std::unordered_map<std::string, Upload> uploads_;
  std::map<std::pair<std::string, std::string>, StoredObject> objects_;
  uint64_t next_upload_id_{1};
  uint64_t next_version_id_{1};
  std::vector<int32_t> upload_part_order_;

  std::set<int32_t> fail_upload_;
  std::set<int32_t> echo_mismatch_;
  std::set<int32_t> checksum_mismatch_;
  std::set<int32_t> missing_checksum_;
  std::set<int32_t> missing_part_;
  std::set<int32_t> duplicate_listing_;
  bool fail_complete_{false};
  bool fail_abort_{false};
  UploadPartHook upload_part_hook_;

  std::atomic<uint64_t> create_calls_{0};
  std::atomic<uint64_t> upload_part_calls_{0};
  std::atomic<uint64_t> list_parts_calls_{0};
  std::atomic<uint64_t> complete_calls_{0};
  std::atomic<uint64_t> abort_calls_{0};
};

}  // namespace integra

#endif
