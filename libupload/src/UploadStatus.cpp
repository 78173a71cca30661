#include "integra/UploadStatus.h"

#include <fmt/format.h>

const char*
integra::StageName(UploadStage stage) {
  switch (stage) {
  case UploadStage::Initialization:
    return "upload initialization";
  case UploadStage::PartUpload:
    return "part upload";
  case UploadStage::Verification:
    return "verification";
  case UploadStage::Completion:
    return "completion";
  default:
    return "unknown stage";
  }
}

std::string
integra::UploadPhase::Summary() const {
  std::string msg =
      fmt::format("{} {}", success ? "✓" : "✗", StageName(stage));
  if (stage == UploadStage::PartUpload) {
    msg += fmt::format(" (Part {})", part_number);
  }
  if (!message.empty()) {
    msg += fmt::format(": {}", message);
  }
  if (error && !success) {
    msg += fmt::format(" ({})", *error);
  }
  return msg;
}

integra::Result<void>
integra::UploadStatus::StartPhaseLocked(
    UploadStage stage, int32_t part_number) {
  if (pending_) {
    return INTEGRA_ERROR(
        ErrorCode::InvalidArgument,
        "cannot start {} while {} is still pending", StageName(stage),
        StageName(pending_->stage));
  }
  UploadPhase phase;
  phase.stage = stage;
  phase.part_number = part_number;
  pending_ = std::move(phase);
  return ResultSuccess();
}

integra::Result<void>
integra::UploadStatus::EndPhaseLocked(
    bool success, const std::string& message,
    const std::optional<CopyableErrorInfo>& error) {
  if (!pending_) {
    return INTEGRA_ERROR(
        ErrorCode::InvalidArgument, "cannot end a phase that was not started");
  }
  pending_->success = success;
  pending_->message = message;
  pending_->error = error;
  phases_.emplace_back(std::move(*pending_));
  pending_.reset();
  return ResultSuccess();
}

integra::Result<void>
integra::UploadStatus::StartPhase(UploadStage stage, int32_t part_number) {
  std::lock_guard<std::mutex> lock(mutex_);
  return StartPhaseLocked(stage, part_number);
}

integra::Result<void>
integra::UploadStatus::EndPhase(
    bool success, const std::string& message,
    const std::optional<CopyableErrorInfo>& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  return EndPhaseLocked(success, message, error);
}

integra::Result<void>
integra::UploadStatus::RecordPhase(
    UploadStage stage, int32_t part_number, bool success,
    const std::string& message, const std::optional<CopyableErrorInfo>& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  INTEGRA_CHECKED(StartPhaseLocked(stage, part_number));
  return EndPhaseLocked(success, message, error);
}

std::vector<integra::UploadPhase>
integra::UploadStatus::phases() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return phases_;
}

bool
integra::UploadStatus::HasPendingPhase() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.has_value();
}

std::optional<integra::UploadPhase>
integra::UploadStatus::FailedPhase() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const UploadPhase& phase : phases_) {
    if (!phase.success) {
      return phase;
    }
  }
  return std::nullopt;
}

std::string
integra::UploadStatus::Summary() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string out = "=== Upload Phase Summary ===\n";
  for (const UploadPhase& phase : phases_) {
    out += phase.Summary();
    out += "\n";
  }
  return out;
}
