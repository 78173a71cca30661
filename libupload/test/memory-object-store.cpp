#include "integra/MemoryObjectStore.h"

#include <algorithm>
#include <string>
#include <vector>

#include "integra/Checksum.h"
#include "integra/ErrorCode.h"
#include "integra/Logging.h"
#include "integra/Strings.h"

namespace {

const uint8_t*
Bytes(const std::string& s) {
  return reinterpret_cast<const uint8_t*>(s.data());
}

bool
ErrorContains(const integra::ErrorInfo& err, const std::string& text) {
  return fmt::format("{}", err).find(text) != std::string::npos;
}

void
TestBucketNames() {
  integra::MemoryObjectStore store;
  for (const char* name :
       {"my-bucket", "abc", "data.example.com", "bucket-2024"}) {
    store.CreateBucket(name);
    auto res = store.CreateUpload(
        integra::ObjectRef{name, "key"}, integra::ChecksumAlgorithm::Crc32,
        nullptr);
    INTEGRA_LOG_VASSERT(res, "bucket {} was rejected", name);
  }

  for (const char* name :
       {"ab", "Invalid_Bucket", "-leading", "trailing-", "two..dots",
        "192.168.5.4", "xn--punycode", "has space"}) {
    store.CreateBucket(name);
    auto res = store.CreateUpload(
        integra::ObjectRef{name, "key"}, integra::ChecksumAlgorithm::Crc32,
        nullptr);
    INTEGRA_LOG_VASSERT(!res, "bucket {} was accepted", name);
    INTEGRA_LOG_ASSERT(
        res.error() == integra::UploadErrorCode::TransportError);
    INTEGRA_LOG_ASSERT(ErrorContains(res.error(), "InvalidBucketName"));
  }

  auto unknown = store.CreateUpload(
      integra::ObjectRef{"not-created", "key"},
      integra::ChecksumAlgorithm::Crc32, nullptr);
  INTEGRA_LOG_ASSERT(!unknown);
  INTEGRA_LOG_ASSERT(ErrorContains(unknown.error(), "NoSuchBucket"));
}

void
TestRoundTrip() {
  integra::MemoryObjectStore store;
  store.CreateBucket("bucket");

  auto id = store.CreateUpload(
      integra::ObjectRef{"bucket", "hello.txt"},
      integra::ChecksumAlgorithm::Crc32, nullptr);
  INTEGRA_LOG_ASSERT(id);
  integra::UploadRef upload{"bucket", "hello.txt", id.value()};
  INTEGRA_LOG_ASSERT(store.open_uploads() == 1);

  std::vector<std::string> bodies = {"Hello", ", Wor", "ld"};
  std::vector<integra::CompletedPart> completed;
  // Upload out of order
  for (int32_t n : {3, 1, 2}) {
    const std::string& body = bodies[n - 1];
    std::string checksum = integra::ComputeCrc32(body);
    auto resp = store.UploadPart(
        upload, n, Bytes(body), body.size(), checksum, nullptr);
    INTEGRA_LOG_ASSERT(resp);
    INTEGRA_LOG_ASSERT(resp.value().checksum == checksum);
    completed.emplace_back(
        integra::CompletedPart{n, resp.value().etag, checksum});
  }
  INTEGRA_LOG_ASSERT(
      store.upload_part_order() == std::vector<int32_t>({3, 1, 2}));

  auto listed = store.ListParts(upload, nullptr);
  INTEGRA_LOG_ASSERT(listed);
  INTEGRA_LOG_ASSERT(listed.value().size() == 3);
  for (size_t i = 0; i < 3; ++i) {
    const integra::ListedPart& lp = listed.value()[i];
    INTEGRA_LOG_ASSERT(lp.part_number == static_cast<int32_t>(i + 1));
    INTEGRA_LOG_ASSERT(lp.size == bodies[i].size());
    INTEGRA_LOG_ASSERT(lp.checksum == integra::ComputeCrc32(bodies[i]));
    INTEGRA_LOG_ASSERT(!lp.last_modified.empty());
  }

  // Completion needs ascending parts
  auto unordered = store.CompleteUpload(upload, completed, "", nullptr);
  INTEGRA_LOG_ASSERT(!unordered);
  INTEGRA_LOG_ASSERT(ErrorContains(unordered.error(), "InvalidPartOrder"));

  std::sort(
      completed.begin(), completed.end(),
      [](const integra::CompletedPart& a, const integra::CompletedPart& b) {
        return a.part_number < b.part_number;
      });

  std::vector<integra::CompletedPart> bad_etag = completed;
  bad_etag[1].etag = "\"wrong\"";
  auto bad = store.CompleteUpload(upload, bad_etag, "", nullptr);
  INTEGRA_LOG_ASSERT(!bad);
  INTEGRA_LOG_ASSERT(ErrorContains(bad.error(), "InvalidPart"));

  std::string whole = integra::ComputeCrc32("Hello, World");
  auto done = store.CompleteUpload(upload, completed, whole, nullptr);
  INTEGRA_LOG_ASSERT(done);
  INTEGRA_LOG_ASSERT(done.value().location == "memory:///bucket/hello.txt");
  INTEGRA_LOG_ASSERT(integra::HasSuffix(*done.value().checksum, "-3"));
  INTEGRA_LOG_ASSERT(store.open_uploads() == 0);

  auto object = store.GetObject("bucket", "hello.txt");
  INTEGRA_LOG_ASSERT(object);
  INTEGRA_LOG_ASSERT(
      std::string(object.value().data.begin(), object.value().data.end()) ==
      "Hello, World");
  INTEGRA_LOG_ASSERT(object.value().object_checksum == whole);
  INTEGRA_LOG_ASSERT(object.value().parts.size() == 3);

  auto gone = store.GetObject("bucket", "missing");
  INTEGRA_LOG_ASSERT(!gone);
  INTEGRA_LOG_ASSERT(gone.error() == integra::ErrorCode::NotFound);

  // The upload no longer exists
  auto after = store.ListParts(upload, nullptr);
  INTEGRA_LOG_ASSERT(!after);
  INTEGRA_LOG_ASSERT(ErrorContains(after.error(), "NoSuchUpload"));
}

void
TestRejects() {
  integra::MemoryObjectStore store;
  store.CreateBucket("bucket");
  auto id = store.CreateUpload(
      integra::ObjectRef{"bucket", "key"}, integra::ChecksumAlgorithm::Crc32,
      nullptr);
  INTEGRA_LOG_ASSERT(id);
  integra::UploadRef upload{"bucket", "key", id.value()};
  std::string body = "payload";

  auto bad_digest = store.UploadPart(
      upload, 1, Bytes(body), body.size(), integra::ComputeCrc32("other"),
      nullptr);
  INTEGRA_LOG_ASSERT(!bad_digest);
  INTEGRA_LOG_ASSERT(ErrorContains(bad_digest.error(), "BadDigest"));

  auto bad_number = store.UploadPart(
      upload, 0, Bytes(body), body.size(), integra::ComputeCrc32(body),
      nullptr);
  INTEGRA_LOG_ASSERT(!bad_number);

  integra::UploadRef unknown{"bucket", "key", "no-such-upload"};
  auto no_upload = store.UploadPart(
      unknown, 1, Bytes(body), body.size(), integra::ComputeCrc32(body),
      nullptr);
  INTEGRA_LOG_ASSERT(!no_upload);
  INTEGRA_LOG_ASSERT(ErrorContains(no_upload.error(), "NoSuchUpload"));

  auto no_parts = store.CompleteUpload(upload, {}, "", nullptr);
  INTEGRA_LOG_ASSERT(!no_parts);
  INTEGRA_LOG_ASSERT(ErrorContains(no_parts.error(), "MalformedXML"));

  integra::CancellationToken token;
  token.Cancel();
  auto cancelled = store.UploadPart(
      upload, 1, Bytes(body), body.size(), integra::ComputeCrc32(body),
      &token);
  INTEGRA_LOG_ASSERT(!cancelled);
  INTEGRA_LOG_ASSERT(cancelled.error() == integra::UploadErrorCode::Cancelled);
  INTEGRA_LOG_ASSERT(cancelled.error() == std::errc::operation_canceled);

  INTEGRA_LOG_ASSERT(store.AbortUpload(upload));
  INTEGRA_LOG_ASSERT(store.open_uploads() == 0);
  INTEGRA_LOG_ASSERT(!store.AbortUpload(upload));
  INTEGRA_LOG_ASSERT(store.abort_calls() == 2);
}

void
TestInjectedFaults() {
  integra::MemoryObjectStore store;
  store.CreateBucket("bucket");
  auto id = store.CreateUpload(
      integra::ObjectRef{"bucket", "key"}, integra::ChecksumAlgorithm::Crc32,
      nullptr);
  INTEGRA_LOG_ASSERT(id);
  integra::UploadRef upload{"bucket", "key", id.value()};

  store.InjectUploadPartFailure(2);
  store.InjectEchoMismatch(3);
  store.InjectChecksumMismatch(1);
  store.InjectMissingChecksum(3);
  store.InjectMissingPart(4);

  std::string body = "body";
  std::string checksum = integra::ComputeCrc32(body);
  for (int32_t n = 1; n <= 4; ++n) {
    auto resp = store.UploadPart(
        upload, n, Bytes(body), body.size(), checksum, nullptr);
    if (n == 2) {
      INTEGRA_LOG_ASSERT(!resp);
      INTEGRA_LOG_ASSERT(ErrorContains(resp.error(), "InternalError"));
      continue;
    }
    INTEGRA_LOG_ASSERT(resp);
    if (n == 3) {
      INTEGRA_LOG_ASSERT(resp.value().checksum != checksum);
    } else {
      INTEGRA_LOG_ASSERT(resp.value().checksum == checksum);
    }
  }

  auto listed = store.ListParts(upload, nullptr);
  INTEGRA_LOG_ASSERT(listed);
  // Part 2 failed and part 4 is hidden
  INTEGRA_LOG_ASSERT(listed.value().size() == 2);
  INTEGRA_LOG_ASSERT(listed.value()[0].part_number == 1);
  INTEGRA_LOG_ASSERT(listed.value()[0].checksum != checksum);
  INTEGRA_LOG_ASSERT(listed.value()[1].part_number == 3);
  INTEGRA_LOG_ASSERT(!listed.value()[1].checksum);

  store.InjectAbortFailure();
  INTEGRA_LOG_ASSERT(!store.AbortUpload(upload));
  INTEGRA_LOG_ASSERT(store.open_uploads() == 1);
}

}  // namespace

int
main() {
  TestBucketNames();
  TestRoundTrip();
  TestRejects();
  TestInjectedFaults();
}
