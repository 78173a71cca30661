#include "integra/UploadStatus.h"

#include <string>
#include <thread>
#include <vector>

#include "integra/ErrorCode.h"
#include "integra/Logging.h"
#include "integra/Strings.h"
#include "integra/UploadErrors.h"

namespace {

void
TestTransitions() {
  integra::UploadStatus status;
  INTEGRA_LOG_ASSERT(!status.HasPendingPhase());

  auto end_first = status.EndPhase(true, "nothing started");
  INTEGRA_LOG_ASSERT(!end_first);
  INTEGRA_LOG_ASSERT(end_first.error() == integra::ErrorCode::InvalidArgument);

  INTEGRA_LOG_ASSERT(status.StartPhase(integra::UploadStage::Initialization));
  INTEGRA_LOG_ASSERT(status.HasPendingPhase());

  auto twice = status.StartPhase(integra::UploadStage::Verification);
  INTEGRA_LOG_ASSERT(!twice);
  INTEGRA_LOG_ASSERT(twice.error() == integra::ErrorCode::InvalidArgument);

  auto record_while_pending = status.RecordPhase(
      integra::UploadStage::PartUpload, 1, true, "interleaved");
  INTEGRA_LOG_ASSERT(!record_while_pending);

  INTEGRA_LOG_ASSERT(status.EndPhase(true, "Upload initiated successfully"));
  INTEGRA_LOG_ASSERT(!status.HasPendingPhase());
  INTEGRA_LOG_ASSERT(status.phases().size() == 1);
  INTEGRA_LOG_ASSERT(!status.FailedPhase());
}

void
TestSummary() {
  integra::UploadStatus status;
  INTEGRA_LOG_ASSERT(status.StartPhase(integra::UploadStage::Initialization));
  INTEGRA_LOG_ASSERT(status.EndPhase(true, "Upload initiated successfully"));
  INTEGRA_LOG_ASSERT(status.RecordPhase(
      integra::UploadStage::PartUpload, 1, true,
      "Uploaded and verified (5/12 bytes)"));

  integra::CopyableErrorInfo err = INTEGRA_ERROR(
      integra::UploadErrorCode::VerificationError, "part 2 missing CRC32");
  INTEGRA_LOG_ASSERT(status.StartPhase(integra::UploadStage::Verification));
  INTEGRA_LOG_ASSERT(status.EndPhase(false, "Failed to verify parts", err));

  std::vector<integra::UploadPhase> phases = status.phases();
  INTEGRA_LOG_ASSERT(phases.size() == 3);

  INTEGRA_LOG_VASSERT(
      phases[0].Summary() ==
          "✓ upload initialization: Upload initiated successfully",
      "got {}", phases[0].Summary());
  INTEGRA_LOG_VASSERT(
      phases[1].Summary() ==
          "✓ part upload (Part 1): Uploaded and verified (5/12 bytes)",
      "got {}", phases[1].Summary());

  std::string failed = phases[2].Summary();
  INTEGRA_LOG_VASSERT(
      integra::HasPrefix(
          failed, "✗ verification: Failed to verify parts (") &&
          failed.find("part 2 missing CRC32") != std::string::npos,
      "got {}", failed);

  auto first_failed = status.FailedPhase();
  INTEGRA_LOG_ASSERT(first_failed);
  INTEGRA_LOG_ASSERT(
      first_failed->stage == integra::UploadStage::Verification);
  INTEGRA_LOG_ASSERT(
      first_failed->error->error_code() ==
      integra::UploadErrorCode::VerificationError);

  std::string summary = status.Summary();
  INTEGRA_LOG_ASSERT(
      integra::HasPrefix(summary, "=== Upload Phase Summary ===\n"));
  std::vector<std::string_view> lines = integra::SplitView(summary, "\n");
  // header, three phases, trailing empty
  INTEGRA_LOG_VASSERT(lines.size() == 5, "got {} lines", lines.size());
}

void
TestErrorHiddenOnSuccess() {
  integra::UploadPhase phase;
  phase.stage = integra::UploadStage::Completion;
  phase.success = true;
  phase.error = integra::CopyableErrorInfo(
      integra::UploadErrorCode::TransportError);
  INTEGRA_LOG_ASSERT(phase.Summary() == "✓ completion");
}

void
TestConcurrentRecord() {
  integra::UploadStatus status;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&status, t] {
      for (int i = 0; i < 50; ++i) {
        auto res = status.RecordPhase(
            integra::UploadStage::PartUpload, t * 50 + i + 1, true, "ok");
        INTEGRA_LOG_ASSERT(res);
      }
    });
  }
  for (std::thread& t : threads) {
    t.join();
  }
  INTEGRA_LOG_ASSERT(status.phases().size() == 400);
  INTEGRA_LOG_ASSERT(!status.HasPendingPhase());
}

void
TestStageNames() {
  INTEGRA_LOG_ASSERT(
      std::string(integra::StageName(integra::UploadStage::Initialization)) ==
      "upload initialization");
  INTEGRA_LOG_ASSERT(
      std::string(integra::StageName(integra::UploadStage::PartUpload)) ==
      "part upload");
  INTEGRA_LOG_ASSERT(
      std::string(integra::StageName(integra::UploadStage::Verification)) ==
      "verification");
  INTEGRA_LOG_ASSERT(
      std::string(integra::StageName(integra::UploadStage::Completion)) ==
      "completion");
}

}  // namespace

int
main() {
  TestTransitions();
  TestSummary();
  TestErrorHiddenOnSuccess();
  TestConcurrentRecord();
  TestStageNames();
}
