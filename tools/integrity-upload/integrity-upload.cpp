#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "integra/Cancellation.h"
#include "integra/Credentials.h"
#include "integra/Logging.h"
#include "integra/Reporter.h"
#include "integra/S3ObjectStore.h"
#include "integra/Signals.h"
#include "integra/Uploader.h"
#include "llvm/Support/CommandLine.h"

namespace cll = llvm::cl;

/* usage: integrity-upload --bucket <bucket> --key <key> (--file <path> |
 *            --text <text>) [options]
 *
 * uploads the payload as an S3 multipart upload with CRC32 checksums on
 * every part, verifies the stored parts against the local data, and
 * completes the object with all parts or with the parts named by --parts
 */

static cll::opt<std::string> file_path(
    "file", cll::desc("Path to the file to upload"), cll::init(""));
static cll::opt<std::string> text(
    "text", cll::desc("Text content to upload"), cll::init(""));
static cll::opt<std::string> bucket(
    "bucket", cll::desc("S3 bucket name"), cll::init(""));
static cll::opt<std::string> key(
    "key", cll::desc("S3 object key"), cll::init(""));
static cll::opt<std::string> endpoint_url(
    "endpoint-url", cll::desc("S3 endpoint URL"), cll::init(""));
static cll::opt<std::string> region(
    "region", cll::desc("AWS region"), cll::init(integra::kDefaultRegion));
static cll::opt<std::string> profile(
    "profile", cll::desc("AWS profile name"), cll::init(""));
static cll::opt<std::string> access_key(
    "access-key", cll::desc("AWS access key id"), cll::init(""));
static cll::opt<std::string> secret_key(
    "secret-key", cll::desc("AWS secret access key"), cll::init(""));
static cll::opt<bool> verbose(
    "verbose", cll::desc("Enable verbose output"), cll::init(false));
static cll::alias verbose_short(
    "v", cll::desc("Alias for --verbose"), cll::aliasopt(verbose));
static cll::opt<bool> upload_empty_part(
    "upload-empty-part", cll::desc("Upload an empty part as the final part"),
    cll::init(false));
static cll::list<int32_t> parts(
    "parts",
    cll::desc("Comma-separated list of part numbers to complete the object "
              "with (e.g., 1,2,4)"),
    cll::CommaSeparated);
static cll::opt<unsigned long long> part_size(
    "part-size", cll::desc("Size of each part in bytes (minimum 5MiB)"),
    cll::init(integra::kDefaultPartSize));
static cll::opt<uint32_t> workers(
    "workers", cll::desc("Number of parts uploaded concurrently"),
    cll::init(integra::UploadDispatcher::kDefaultNumWorkers));
static cll::opt<bool> no_color(
    "no-color", cll::desc("Disable colored output"), cll::init(false));

namespace {

int
Fail(const integra::ErrorInfo& err) {
  fmt::print(stderr, "Error: {}\n", err);
  return EXIT_FAILURE;
}

integra::UploadOptions
OptionsFromFlags() {
  integra::UploadOptions options;
  options.bucket = bucket;
  options.key = key;
  if (text.getNumOccurrences() > 0) {
    options.text = text.getValue();
  }
  if (file_path.getNumOccurrences() > 0) {
    options.file_path = file_path.getValue();
  }
  options.part_size = part_size;
  options.parts.assign(parts.begin(), parts.end());
  options.upload_empty_part = upload_empty_part;
  options.verbose = verbose;
  options.num_workers = workers;
  return options;
}

nlohmann::ordered_json
DescribeOptions(const integra::UploadOptions& options) {
  nlohmann::ordered_json doc{
      {"Bucket", options.bucket},
      {"Key", options.key},
      {"PartSize", options.part_size},
      {"Parts", options.parts},
      {"UploadEmptyPart", options.upload_empty_part},
      {"Workers", options.num_workers},
  };
  if (options.file_path) {
    doc["FilePath"] = *options.file_path;
  } else if (options.text) {
    doc["DataSize"] = options.text->size();
  }
  return doc;
}

}  // namespace

int
main(int argc, char** argv) {
  cll::ParseCommandLineOptions(
      argc, argv, "Integrity-checked S3 multipart upload\n");

  integra::UploadOptions options = OptionsFromFlags();
  auto job_res = integra::UploadJob::Make(options);
  if (!job_res) {
    return Fail(job_res.error());
  }
  const integra::UploadJob& job = job_res.value();

  integra::Reporter reporter(
      std::cout, verbose, !no_color && isatty(STDOUT_FILENO) == 1);
  reporter.Dump("Verbose mode enabled", DescribeOptions(options));

  integra::ProfileCredentialResolver resolver;
  auto settings_res = resolver.Resolve(integra::ResolveRequest{
      profile, access_key, secret_key, region, endpoint_url});
  if (!settings_res) {
    return Fail(settings_res.error());
  }
  const integra::ClientSettings& settings = settings_res.value();
  if (verbose) {
    reporter.Print("Using endpoint URL: {}", settings.endpoint_url);
    reporter.Print("Using region: {}", settings.region);
  }

  integra::S3Api api;
  auto store_res = integra::S3ObjectStore::Make(
      settings,
      std::max<uint32_t>(
          workers, integra::S3ObjectStore::kDefaultMaxConnections));
  if (!store_res) {
    return Fail(store_res.error());
  }
  std::unique_ptr<integra::S3ObjectStore> store = std::move(store_res.value());

  integra::CancellationToken token;
  if (auto res = integra::InstallCancellationHandlers(&token); !res) {
    return Fail(res.error());
  }

  integra::Uploader uploader(store.get(), &reporter, &token);
  auto upload_res = uploader.Run(job);

  if (auto res = integra::UninstallCancellationHandlers(); !res) {
    INTEGRA_LOG_WARN("cannot restore signal handlers: {}", res.error());
  }

  reporter.PrintSummary(uploader.status());
  if (!upload_res) {
    return Fail(upload_res.error());
  }
  return EXIT_SUCCESS;
}
