#ifndef INTEGRA_LIBUPLOAD_INTEGRA_S3OBJECTSTORE_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_S3OBJECTSTORE_H_

#include <memory>
#include <string>
#include <string_view>

#include <aws/core/Aws.h>
#include <aws/core/utils/memory/stl/AWSString.h>

#include "integra/Credentials.h"
#include "integra/ObjectStore.h"

namespace Aws::S3 {
class S3Client;
}  // namespace Aws::S3

namespace integra {

/// S3Api initializes the AWS SDK for its lifetime. Exactly one must be alive
/// while any S3ObjectStore is in use.
class INTEGRA_EXPORT S3Api {
public:
  S3Api();
  ~S3Api();
  S3Api(const S3Api& no_copy) = delete;
  S3Api& operator=(const S3Api& no_copy) = delete;

private:
  Aws::SDKOptions options_;
};

/// S3ObjectStore is the ObjectStore backed by the AWS SDK for C++.
///
/// When settings carry an endpoint (LocalStack, MinIO, ...), requests use
/// path-style URLs against that endpoint. When settings carry a key pair,
/// those static credentials are used; otherwise credentials come from the
/// usual AWS sources (environment, shared files, container and instance
/// roles).
class INTEGRA_EXPORT S3ObjectStore : public ObjectStore {
public:
  static constexpr uint32_t kDefaultMaxConnections = 25;

  static Result<std::unique_ptr<S3ObjectStore>> Make(
      const ClientSettings& settings,
      uint32_t max_connections = kDefaultMaxConnections);

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

private:
  explicit S3ObjectStore(std::shared_ptr<Aws::S3::S3Client> client)
      : client_(std::move(client)) {}

  std::shared_ptr<Aws::S3::S3Client> client_;
};

/* Utility functions for converting between Aws::String and std::string */
inline std::string_view
FromAwsString(const Aws::String& s) {
  return {s.data(), s.size()};
}
inline Aws::String
ToAwsString(std::string_view s) {
  return Aws::String(s.data(), s.size());
}

}  // namespace integra

#endif
