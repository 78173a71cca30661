#ifndef INTEGRA_LIBUPLOAD_INTEGRA_OBJECTSTORE_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_OBJECTSTORE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "integra/Cancellation.h"
#include "integra/Result.h"
#include "integra/config.h"

namespace integra {

struct ObjectRef {
  std::string bucket;
  std::string key;
};

/// UploadRef names an in-progress multipart upload
struct UploadRef {
  std::string bucket;
  std::string key;
  std::string upload_id;
};

enum class ChecksumAlgorithm {
  Crc32,
};

struct UploadPartResponse {
  std::string etag;
  /// The checksum the store computed over the received body, if it echoes
  /// one back
  std::optional<std::string> checksum;
};

/// A ListedPart is a part as the store has it on record
struct ListedPart {
  int32_t part_number{};
  uint64_t size{};
  std::string etag;
  std::optional<std::string> checksum;
  std::string last_modified;
};

/// A CompletedPart is the result of a successful part upload: what the
/// completion call needs to reference the part.
struct CompletedPart {
  int32_t part_number{};
  std::string etag;
  std::string checksum;
};

/// A PartInfo is the local record of an uploaded part
struct PartInfo {
  int32_t part_number{};
  uint64_t size{};
  std::string checksum;
};

struct CompleteUploadResponse {
  std::string location;
  std::string etag;
  std::string version_id;
  std::optional<std::string> checksum;
};

/// JSON renderings of the request and response types, used for verbose
/// dumps. Unset optional fields are omitted.
INTEGRA_EXPORT void to_json(nlohmann::ordered_json& j, const ObjectRef& ref);
INTEGRA_EXPORT void to_json(nlohmann::ordered_json& j, const UploadRef& ref);
INTEGRA_EXPORT void to_json(
    nlohmann::ordered_json& j, const UploadPartResponse& resp);
INTEGRA_EXPORT void to_json(nlohmann::ordered_json& j, const ListedPart& part);
INTEGRA_EXPORT void to_json(
    nlohmann::ordered_json& j, const CompletedPart& part);
INTEGRA_EXPORT void to_json(nlohmann::ordered_json& j, const PartInfo& info);
INTEGRA_EXPORT void to_json(
    nlohmann::ordered_json& j, const CompleteUploadResponse& resp);

/// ObjectStore is the multipart upload surface of an S3-compatible store.
///
/// Calls that take a CancellationToken should fail promptly with
/// UploadErrorCode::Cancelled once the token is cancelled. AbortUpload is part
/// of teardown and is not cancellable.
///
/// Implementations must be safe for concurrent use.
class INTEGRA_EXPORT ObjectStore {
public:
  ObjectStore() = default;
  ObjectStore(const ObjectStore& no_copy) = delete;
  ObjectStore(ObjectStore&& no_move) = delete;
  ObjectStore& operator=(const ObjectStore& no_copy) = delete;
  ObjectStore& operator=(ObjectStore&& no_move) = delete;
  virtual ~ObjectStore();

  /// CreateUpload starts a multipart upload and returns its upload id
  virtual Result<std::string> CreateUpload(
      const ObjectRef& object, ChecksumAlgorithm algorithm,
      const CancellationToken* token) = 0;

  /// UploadPart uploads body[0, size) as part_number, tagged with the
  /// encoded checksum of the body.
  virtual Result<UploadPartResponse> UploadPart(
      const UploadRef& upload, int32_t part_number, const uint8_t* body,
      uint64_t size, const std::string& checksum,
      const CancellationToken* token) = 0;

  /// ListParts returns every part the store has on record for the upload,
  /// ascending by part number.
  virtual Result<std::vector<ListedPart>> ListParts(
      const UploadRef& upload, const CancellationToken* token) = 0;

  /// CompleteUpload assembles the object from parts, which must be ascending
  /// by part number.
  virtual Result<CompleteUploadResponse> CompleteUpload(
      const UploadRef& upload, const std::vector<CompletedPart>& parts,
      const std::string& object_checksum, const CancellationToken* token) = 0;

  virtual Result<void> AbortUpload(const UploadRef& upload) = 0;
};

}  // namespace integra

#endif
