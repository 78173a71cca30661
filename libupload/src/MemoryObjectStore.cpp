#include "integra/MemoryObjectStore.h"

#include <algorithm>
#include <cctype>
#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "integra/Checksum.h"
#include "integra/Logging.h"
#include "integra/Random.h"
#include "integra/Strings.h"

namespace {

bool
LooksLikeIpAddress(const std::string& name) {
  std::vector<std::string_view> octets = integra::SplitView(name, ".");
  if (octets.size() != 4) {
    return false;
  }
  return std::all_of(octets.begin(), octets.end(), [](std::string_view o) {
    return !o.empty() && std::all_of(o.begin(), o.end(), [](char c) {
      return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
  });
}

// https://docs.aws.amazon.com/AmazonS3/latest/userguide/bucketnamingrules.html
integra::Result<void>
ValidateBucketName(const std::string& name) {
  auto is_alnum = [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
  };

  if (name.size() < 3 || name.size() > 63) {
    return INTEGRA_ERROR(
        integra::UploadErrorCode::TransportError,
        "InvalidBucketName: bucket name {} must be between 3 and 63 characters "
        "long",
        name);
  }
  for (char c : name) {
    if (!is_alnum(c) && c != '.' && c != '-') {
      return INTEGRA_ERROR(
          integra::UploadErrorCode::TransportError,
          "InvalidBucketName: bucket name {} may only contain lowercase "
          "letters, numbers, dots and hyphens",
          name);
    }
  }
  if (!is_alnum(name.front()) || !is_alnum(name.back())) {
    return INTEGRA_ERROR(
        integra::UploadErrorCode::TransportError,
        "InvalidBucketName: bucket name {} must begin and end with a letter or "
        "number",
        name);
  }
  if (name.find("..") != std::string::npos || LooksLikeIpAddress(name) ||
      integra::HasPrefix(name, "xn--")) {
    return INTEGRA_ERROR(
        integra::UploadErrorCode::TransportError,
        "InvalidBucketName: bucket name {} is not allowed", name);
  }
  return integra::ResultSuccess();
}

integra::Result<void>
CheckCancelled(const integra::CancellationToken* token, const char* op) {
  if (integra::IsCancelled(token)) {
    return INTEGRA_ERROR(
        integra::UploadErrorCode::Cancelled, "{} cancelled", op);
  }
  return integra::ResultSuccess();
}

std::string
Now() {
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(std::time(nullptr)));
}

std::string
CorruptChecksum(const std::string& checksum) {
  auto crc = integra::DecodeCrc32(checksum);
  if (!crc) {
    return "AAAAAA==";
  }
  return integra::EncodeCrc32(~crc.value());
}

}  // namespace

void
integra::MemoryObjectStore::CreateBucket(const std::string& bucket) {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.emplace(bucket);
}

integra::Result<integra::MemoryObjectStore::Upload*>
integra::MemoryObjectStore::FindUpload(const UploadRef& upload) {
  auto it = uploads_.find(upload.upload_id);
  if (it == uploads_.end() || it->second.bucket != upload.bucket ||
      it->second.key != upload.key) {
    return INTEGRA_ERROR(
        UploadErrorCode::TransportError,
        "NoSuchUpload: upload {} of {}/{} does not exist", upload.upload_id,
        upload.bucket, upload.key);
  }
  return &it->second;
}

integra::Result<std::string>
integra::MemoryObjectStore::CreateUpload(
    const ObjectRef& object, ChecksumAlgorithm algorithm,
    const CancellationToken* token) {
  ++create_calls_;
  INTEGRA_CHECKED(CheckCancelled(token, "CreateMultipartUpload"));
  INTEGRA_CHECKED(ValidateBucketName(object.bucket));
  if (algorithm != ChecksumAlgorithm::Crc32) {
    return INTEGRA_ERROR(
        UploadErrorCode::TransportError, "unsupported checksum algorithm");
  }
  if (object.key.empty()) {
    return INTEGRA_ERROR(
        UploadErrorCode::TransportError, "InvalidArgument: empty object key");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (buckets_.count(object.bucket) == 0) {
    return INTEGRA_ERROR(
        UploadErrorCode::TransportError,
        "NoSuchBucket: bucket {} does not exist", object.bucket);
  }

  std::string upload_id = fmt::format(
      "upload-{}-{}", next_upload_id_++, RandomAlphanumericString(8));
  Upload& upload = uploads_[upload_id];
  upload.bucket = object.bucket;
  upload.key = object.key;
  return upload_id;
}

integra::Result<integra::UploadPartResponse>
integra::MemoryObjectStore::UploadPart(
    const UploadRef& upload, int32_t part_number, const uint8_t* body,
    uint64_t size, const std::string& checksum,
    const CancellationToken* token) {
  ++upload_part_calls_;

  UploadPartHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    upload_part_order_.emplace_back(part_number);
    hook = upload_part_hook_;
  }
  if (hook) {
    hook(part_number);
  }

  INTEGRA_CHECKED(CheckCancelled(token, "UploadPart"));

  if (part_number < 1 || part_number > 10000) {
    return INTEGRA_ERROR(
        UploadErrorCode::TransportError,
        "InvalidArgument: part number {} must be between 1 and 10000",
        part_number);
  }

  std::string actual = ComputeCrc32(body, size);
  if (actual != checksum) {
    return INTEGRA_ERROR(
        UploadErrorCode::TransportError,
        "BadDigest: part {} checksum {} does not match the body ({})",
        part_number, checksum, actual);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (fail_upload_.count(part_number) > 0) {
    return INTEGRA_ERROR(
        UploadErrorCode::TransportError,
        "InternalError: injected failure for part {}", part_number);
  }

  Upload* u = INTEGRA_CHECKED(FindUpload(upload));
  StoredPart part;
  part.data.assign(body, body + size);
  part.checksum = actual;
  part.etag = fmt::format("\"{:08x}\"", Crc32(body, size));
  part.last_modified = Now();

  UploadPartResponse response;
  response.etag = part.etag;
  response.checksum = echo_mismatch_.count(part_number) > 0
                          ? CorruptChecksum(actual)
                          : actual;

  u->parts[part_number] = std::move(part);
  return response;
}

integra::Result<std::vector<integra::ListedPart>>
integra::MemoryObjectStore::ListParts(
    const UploadRef& upload, const CancellationToken* token) {
  ++list_parts_calls_;
  INTEGRA_CHECKED(CheckCancelled(token, "ListParts"));

  std::lock_guard<std::mutex> lock(mutex_);
  Upload* u = INTEGRA_CHECKED(FindUpload(upload));

  std::vector<ListedPart> listed;
  for (const auto& [number, part] : u->parts) {
    if (missing_part_.count(number) > 0) {
      continue;
    }
    if (!listed.empty() &&
        duplicate_listing_.count(listed.back().part_number) > 0) {
      // Repeat the previous entry in place of this part
      ListedPart repeated = listed.back();
      listed.emplace_back(std::move(repeated));
      continue;
    }
    ListedPart lp;
    lp.part_number = number;
    lp.size = part.data.size();
    lp.etag = part.etag;
    lp.last_modified = part.last_modified;
    if (missing_checksum_.count(number) == 0) {
      lp.checksum = checksum_mismatch_.count(number) > 0
                        ? CorruptChecksum(part.checksum)
                        : part.checksum;
    }
    listed.emplace_back(std::move(lp));
  }
  return listed;
}

integra::Result<integra::CompleteUploadResponse>
integra::MemoryObjectStore::CompleteUpload(
    const UploadRef& upload, const std::vector<CompletedPart>& parts,
    const std::string& object_checksum, const CancellationToken* token) {
  ++complete_calls_;
  INTEGRA_CHECKED(CheckCancelled(token, "CompleteMultipartUpload"));

  std::lock_guard<std::mutex> lock(mutex_);
  if (fail_complete_) {
    return INTEGRA_ERROR(
        UploadErrorCode::TransportError,
        "InternalError: injected completion failure");
  }

  Upload* u = INTEGRA_CHECKED(FindUpload(upload));
  if (parts.empty()) {
    return INTEGRA_ERROR(
        UploadErrorCode::TransportError,
        "MalformedXML: you must specify at least one part");
  }

  StoredObject object;
  std::vector<std::string> checksums;
  int32_t prev = 0;
  for (const CompletedPart& cp : parts) {
    if (cp.part_number <= prev) {
      return INTEGRA_ERROR(
          UploadErrorCode::TransportError,
          "InvalidPartOrder: part {} follows part {}", cp.part_number, prev);
    }
    prev = cp.part_number;

    auto it = u->parts.find(cp.part_number);
    if (it == u->parts.end() || it->second.etag != cp.etag) {
      return INTEGRA_ERROR(
          UploadErrorCode::TransportError,
          "InvalidPart: part {} with etag {} was not uploaded", cp.part_number,
          cp.etag);
    }
    const StoredPart& sp = it->second;
    object.data.insert(object.data.end(), sp.data.begin(), sp.data.end());
    checksums.emplace_back(sp.checksum);
  }

  object.checksum = INTEGRA_CHECKED(ComputeCompositeCrc32(checksums));
  object.object_checksum = object_checksum;
  object.etag = fmt::format(
      "\"{:08x}-{}\"", Crc32(object.data.data(), object.data.size()),
      parts.size());
  object.parts = parts;

  CompleteUploadResponse response;
  response.location = fmt::format("memory:///{}/{}", u->bucket, u->key);
  response.etag = object.etag;
  response.version_id = fmt::format("v{}", next_version_id_++);
  response.checksum = object.checksum;

  objects_[std::make_pair(u->bucket, u->key)] = std::move(object);
  uploads_.erase(upload.upload_id);
  return response;
}

integra::Result<void>
integra::MemoryObjectStore::AbortUpload(const UploadRef& upload) {
  ++abort_calls_;

  std::lock_guard<std::mutex> lock(mutex_);
  if (fail_abort_) {
    return INTEGRA_ERROR(
        UploadErrorCode::TransportError,
        "InternalError: injected abort failure");
  }
  INTEGRA_CHECKED(FindUpload(upload));
  uploads_.erase(upload.upload_id);
  return ResultSuccess();
}

void
integra::MemoryObjectStore::InjectUploadPartFailure(int32_t part_number) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_upload_.emplace(part_number);
}

void
integra::MemoryObjectStore::InjectEchoMismatch(int32_t part_number) {
  std::lock_guard<std::mutex> lock(mutex_);
  echo_mismatch_.emplace(part_number);
}

void
integra::MemoryObjectStore::InjectChecksumMismatch(int32_t part_number) {
  std::lock_guard<std::mutex> lock(mutex_);
  checksum_mismatch_.emplace(part_number);
}

void
integra::MemoryObjectStore::InjectMissingChecksum(int32_t part_number) {
  std::lock_guard<std::mutex> lock(mutex_);
  missing_checksum_.emplace(part_number);
}

void
integra::MemoryObjectStore::InjectDuplicateListing(int32_t part_number) {
  std::lock_guard<std::mutex> lock(mutex_);
  duplicate_listing_.emplace(part_number);
}

void
integra::MemoryObjectStore::InjectMissingPart(int32_t part_number) {
  std::lock_guard<std::mutex> lock(mutex_);
  missing_part_.emplace(part_number);
}

void
integra::MemoryObjectStore::InjectCompleteFailure() {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_complete_ = true;
}

void
integra::MemoryObjectStore::InjectAbortFailure() {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_abort_ = true;
}

void
integra::MemoryObjectStore::SetUploadPartHook(UploadPartHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  upload_part_hook_ = std::move(hook);
}

integra::Result<integra::MemoryObjectStore::StoredObject>
integra::MemoryObjectStore::GetObject(
    const std::string& bucket, const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = objects_.find(std::make_pair(bucket, key));
  if (it == objects_.end()) {
    return INTEGRA_ERROR(
        ErrorCode::NotFound, "object {}/{} does not exist", bucket, key);
  }
  return it->second;
}

size_t
integra::MemoryObjectStore::open_uploads() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return uploads_.size();
}

std::vector<int32_t>
integra::MemoryObjectStore::upload_part_order() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return upload_part_order_;
}
