#include "integra/ObjectStore.h"

integra::ObjectStore::~ObjectStore() = default;

void
integra::to_json(nlohmann::ordered_json& j, const ObjectRef& ref) {
  j = nlohmann::ordered_json{
      {"Bucket", ref.bucket},
      {"Key", ref.key},
  };
}

void
integra::to_json(nlohmann::ordered_json& j, const UploadRef& ref) {
  j = nlohmann::ordered_json{
      {"Bucket", ref.bucket},
      {"Key", ref.key},
      {"UploadId", ref.upload_id},
  };
}

void
integra::to_json(nlohmann::ordered_json& j, const UploadPartResponse& resp) {
  j = nlohmann::ordered_json{{"ETag", resp.etag}};
  if (resp.checksum) {
    j["ChecksumCRC32"] = *resp.checksum;
  }
}

void
integra::to_json(nlohmann::ordered_json& j, const ListedPart& part) {
  j = nlohmann::ordered_json{
      {"PartNumber", part.part_number},
      {"Size", part.size},
      {"ETag", part.etag},
      {"LastModified", part.last_modified},
  };
  if (part.checksum) {
    j["ChecksumCRC32"] = *part.checksum;
  }
}

void
integra::to_json(nlohmann::ordered_json& j, const CompletedPart& part) {
  j = nlohmann::ordered_json{
      {"PartNumber", part.part_number},
      {"ETag", part.etag},
      {"ChecksumCRC32", part.checksum},
  };
}

void
integra::to_json(nlohmann::ordered_json& j, const PartInfo& info) {
  j = nlohmann::ordered_json{
      {"PartNumber", info.part_number},
      {"Size", info.size},
      {"ChecksumCRC32", info.checksum},
  };
}

void
integra::to_json(
    nlohmann::ordered_json& j, const CompleteUploadResponse& resp) {
  j = nlohmann::ordered_json{
      {"Location", resp.location},
      {"ETag", resp.etag},
      {"VersionId", resp.version_id},
  };
  if (resp.checksum) {
    j["ChecksumCRC32"] = *resp.checksum;
  }
}
