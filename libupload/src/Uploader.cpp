#include "integra/Uploader.h"

#include <algorithm>

#include "integra/Checksum.h"
#include "integra/FileSystem.h"
#include "integra/Logging.h"
#include "integra/Strings.h"
#include "integra/UploadErrors.h"
#include "integra/Verification.h"

integra::Result<integra::UploadJob>
integra::UploadJob::Make(UploadOptions options) {
  if (options.bucket.empty()) {
    return INTEGRA_ERROR(
        UploadErrorCode::ConfigurationError, "bucket name is required");
  }
  if (options.key.empty()) {
    return INTEGRA_ERROR(
        UploadErrorCode::ConfigurationError, "object key is required");
  }
  if (options.text && options.file_path) {
    return INTEGRA_ERROR(
        UploadErrorCode::ConfigurationError,
        "inline text and a file path are mutually exclusive");
  }
  if (!options.text && !options.file_path) {
    return INTEGRA_ERROR(
        UploadErrorCode::ConfigurationError,
        "either inline text or a file path is required");
  }
  if (options.num_workers == 0) {
    return INTEGRA_ERROR(
        UploadErrorCode::ConfigurationError,
        "at least one upload worker is required");
  }

  PartSelector selector(options.parts, options.upload_empty_part);
  INTEGRA_CHECKED(selector.Validate());

  std::shared_ptr<const std::vector<uint8_t>> payload;
  if (options.file_path) {
    auto data = INTEGRA_CHECKED_CONTEXT(
        ReadFile(*options.file_path), "reading {}", *options.file_path);
    payload = std::make_shared<const std::vector<uint8_t>>(std::move(data));
  } else {
    payload = std::make_shared<const std::vector<uint8_t>>(
        options.text->begin(), options.text->end());
  }

  auto view = INTEGRA_CHECKED(PartitionView::Make(
      payload->data(), payload->size(), options.part_size,
      options.min_part_size, options.upload_empty_part));

  if (options.upload_empty_part && view.num_parts() >= kMaxParts) {
    return INTEGRA_ERROR(
        UploadErrorCode::ConfigurationError,
        "no part number left for the empty part after {} parts",
        view.num_parts());
  }

  return UploadJob(
      std::move(options), std::move(payload), view, std::move(selector));
}

std::string
integra::UploadJob::Source() const {
  if (options_.file_path) {
    return *options_.file_path;
  }
  return "data input";
}

void
integra::Uploader::EndFailedPhase(
    const std::string& message, const ErrorInfo& err) {
  if (auto res = status_.EndPhase(false, message, CopyableErrorInfo(err));
      !res) {
    INTEGRA_LOG_ERROR("cannot record failure \"{}\": {}", message, res.error());
  }
}

void
integra::Uploader::Abort(const UploadRef& upload) {
  reporter_->Print("Aborting multipart upload {}...", upload.upload_id);
  reporter_->Dump(
      "AbortMultipartUpload", nlohmann::ordered_json{{"Request", upload}});

  if (auto res = store_->AbortUpload(upload); !res) {
    INTEGRA_LOG_ERROR(
        "cannot abort upload {} of {}/{}: {}", upload.upload_id, upload.bucket,
        upload.key, res.error());
    return;
  }
  reporter_->Print("✓ Multipart upload {} aborted", upload.upload_id);
}

integra::Result<std::string>
integra::Uploader::Initiate(const UploadJob& job) {
  ObjectRef object = job.object();

  reporter_->Print("\nInitiating multipart upload...");
  INTEGRA_CHECKED(status_.StartPhase(UploadStage::Initialization));

  if (IsCancelled(token_)) {
    ErrorInfo err =
        INTEGRA_ERROR(UploadErrorCode::Cancelled, "upload was not started");
    EndFailedPhase("Failed to initiate upload", err);
    return err;
  }

  nlohmann::ordered_json request = object;
  request["ChecksumAlgorithm"] = "CRC32";

  auto res = store_->CreateUpload(object, ChecksumAlgorithm::Crc32, token_);
  if (!res) {
    ErrorInfo err = res.error().WithContext(
        "creating upload for {}/{}", object.bucket, object.key);
    EndFailedPhase("Failed to initiate upload", err);
    return err;
  }

  reporter_->Dump(
      "CreateMultipartUpload",
      nlohmann::ordered_json{
          {"Request", request},
          {"Response",
           UploadRef{object.bucket, object.key, res.value()}},
      });

  INTEGRA_CHECKED(status_.EndPhase(true, "Upload initiated successfully"));
  reporter_->Print("✓ Upload initiated: {}", res.value());
  return res.value();
}

integra::PartSelection
integra::Uploader::Select(
    const UploadJob& job, const DispatchResult& dispatched) {
  const PartSelector& selector = job.selector();
  PartSelection selection = selector.Select(dispatched.completed);

  if (!selector.has_allow_list()) {
    reporter_->Print("\nNo part filtering specified - using all parts");
    return selection;
  }

  reporter_->Print(
      "\nFiltering parts based on specified indices: [{}]",
      Join(selector.allow_list(), " "));

  // Print in part order, as the parts were uploaded
  std::vector<int32_t> included = selection.included_numbers();
  size_t i = 0;
  size_t j = 0;
  while (i < included.size() || j < selection.skipped.size()) {
    if (j == selection.skipped.size() ||
        (i < included.size() && included[i] < selection.skipped[j])) {
      reporter_->PrintLine(reporter_->Colorize(
          Color::Orange, fmt::format("Including part {}", included[i++])));
    } else {
      reporter_->Print("Skipping part {}", selection.skipped[j++]);
    }
  }

  for (int32_t missing : selection.unmatched) {
    INTEGRA_LOG_WARN(
        "part {} was requested for completion but no such part was uploaded",
        missing);
  }
  if (selection.included.empty()) {
    INTEGRA_LOG_WARN(
        "no parts selected for completion; the store is expected to reject "
        "the upload");
  }

  reporter_->Print(
      "Selected {} parts for completion", selection.included.size());
  return selection;
}

integra::Result<std::vector<integra::ListedPart>>
integra::Uploader::Verify(
    const UploadRef& upload, const std::vector<Part>& parts) {
  reporter_->Print("\nVerifying uploaded parts...");
  INTEGRA_CHECKED(status_.StartPhase(UploadStage::Verification));

  if (IsCancelled(token_)) {
    ErrorInfo err = INTEGRA_ERROR(
        UploadErrorCode::Cancelled,
        "upload {} was cancelled before verification", upload.upload_id);
    EndFailedPhase("Failed to verify parts", err);
    return err;
  }

  auto res = VerifyUploadedParts(*store_, upload, parts, token_, reporter_);
  if (!res) {
    EndFailedPhase("Failed to verify parts", res.error());
    return res.error();
  }

  INTEGRA_CHECKED(status_.EndPhase(true, "All parts verified successfully"));
  reporter_->Print("✓ All parts verified successfully");
  return res;
}

integra::Result<integra::CompleteUploadResponse>
integra::Uploader::Complete(
    const UploadRef& upload, const PartSelection& selection,
    const std::string& object_checksum) {
  reporter_->Print("\nCompleting multipart upload...");
  INTEGRA_CHECKED(status_.StartPhase(UploadStage::Completion));

  if (IsCancelled(token_)) {
    ErrorInfo err = INTEGRA_ERROR(
        UploadErrorCode::Cancelled, "upload {} was cancelled before completion",
        upload.upload_id);
    EndFailedPhase("Failed to complete upload", err);
    return err;
  }

  nlohmann::ordered_json request = upload;
  request["MultipartUpload"] =
      nlohmann::ordered_json{{"Parts", selection.included}};
  request["ChecksumCRC32"] = object_checksum;

  auto res = store_->CompleteUpload(
      upload, selection.included, object_checksum, token_);
  if (!res) {
    ErrorInfo err = res.error().WithContext(
        "completing upload {} with {} parts", upload.upload_id,
        selection.included.size());
    EndFailedPhase("Failed to complete upload", err);
    return err;
  }

  reporter_->Dump(
      "CompleteMultipartUpload",
      nlohmann::ordered_json{{"Request", request}, {"Response", res.value()}});

  INTEGRA_CHECKED(status_.EndPhase(true, "Upload completed successfully"));
  return res;
}

integra::Result<integra::UploadReport>
integra::Uploader::Run(const UploadJob& job) {
  UploadReport report;
  ObjectRef object = job.object();
  const std::vector<uint8_t>& payload = job.payload();

  report.upload_id = INTEGRA_CHECKED(Initiate(job));
  UploadRef upload{object.bucket, object.key, report.upload_id};

  // From here on every failure aborts the upload. Errors are copied out of
  // the thread's error context before Abort can make new ones.
  std::vector<Part> parts = job.selector().PlanParts(job.view());
  UploadDispatcher dispatcher(
      store_, upload, &status_, reporter_, token_, job.options().num_workers);
  auto dispatch_res = dispatcher.Run(parts, payload.size());
  if (!dispatch_res) {
    CopyableErrorInfo err = dispatch_res.error();
    Abort(upload);
    return ErrorInfo(err);
  }
  report.part_infos = dispatch_res.value().part_infos;

  PartSelection selection = Select(job, dispatch_res.value());
  report.included = selection.included_numbers();

  auto verify_res = Verify(upload, parts);
  if (!verify_res) {
    CopyableErrorInfo err = verify_res.error();
    Abort(upload);
    return ErrorInfo(err);
  }
  report.listed = std::move(verify_res.value());

  report.object_checksum = ComputeCrc32(payload.data(), payload.size());
  std::vector<std::string> included_checksums;
  for (const CompletedPart& part : selection.included) {
    included_checksums.emplace_back(part.checksum);
  }
  auto composite_res = ComputeCompositeCrc32(included_checksums);
  if (!composite_res) {
    CopyableErrorInfo err = composite_res.error();
    Abort(upload);
    return ErrorInfo(err);
  }
  report.composite_checksum = std::move(composite_res.value());

  auto complete_res = Complete(upload, selection, report.object_checksum);
  if (!complete_res) {
    CopyableErrorInfo err = complete_res.error();
    Abort(upload);
    return ErrorInfo(err);
  }
  report.completion = std::move(complete_res.value());

  reporter_->Print(
      "✓ Upload completed: {} → {}/{}", job.Source(), object.bucket,
      object.key);
  reporter_->PrintChecksumSummary(
      report.part_infos, report.included, report.completion.checksum,
      report.composite_checksum);

  return report;
}
