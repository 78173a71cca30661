#include "integra/UploadDispatcher.h"

#include <algorithm>
#include <map>
#include <thread>

#include "integra/Checksum.h"
#include "integra/Logging.h"
#include "integra/UploadErrors.h"

integra::Result<integra::UploadDispatcher::PartResult>
integra::UploadDispatcher::UploadOne(const Part& part) {
  const std::string& checksum = part.Checksum();

  auto resp = INTEGRA_CHECKED_CONTEXT(
      store_->UploadPart(
          upload_, part.number(), part.data(), part.size(), checksum, token_),
      "uploading part {}", part.number());

  if (reporter_->verbose()) {
    nlohmann::ordered_json request = upload_;
    request["PartNumber"] = part.number();
    request["ContentLength"] = part.size();
    request["ChecksumCRC32"] = checksum;
    reporter_->Dump(
        fmt::format("UploadPart {}", part.number()),
        nlohmann::ordered_json{{"Request", request}, {"Response", resp}});
  }

  // Stores that compute their own checksum over the received body echo it
  if (resp.checksum && *resp.checksum != checksum) {
    return INTEGRA_ERROR(
        UploadErrorCode::VerificationError,
        "part {} checksum mismatch: sent {}, store computed {}", part.number(),
        DescribeCrc32(checksum), DescribeCrc32(*resp.checksum));
  }

  PartResult result;
  result.completed = CompletedPart{part.number(), resp.etag, checksum};
  result.info = PartInfo{part.number(), part.size(), checksum};
  return result;
}

void
integra::UploadDispatcher::Work(
    WorkQueue<Part>* work, WorkQueue<PartResult>* results,
    FirstErrorSlot<PartFailure>* first_error) {
  while (auto part = work->Pop()) {
    if (first_error->HasValue() || IsCancelled(token_)) {
      continue;
    }

    auto res = UploadOne(*part);
    if (!res) {
      if (first_error->Offer(PartFailure{part->number(), res.error()})) {
        work->Cancel();
      } else {
        INTEGRA_LOG_DEBUG(
            "discarding error for part {}: {}", part->number(), res.error());
      }
      continue;
    }

    if (!results->Push(std::move(res.value()))) {
      INTEGRA_LOG_ERROR("result for part {} was dropped", part->number());
    }
  }
}

void
integra::UploadDispatcher::Collect(
    const std::vector<int32_t>& order, uint64_t total_bytes,
    WorkQueue<PartResult>* results, DispatchResult* out) {
  // Results arrive in completion order; phases are recorded in part order
  std::map<int32_t, PartResult> waiting;
  size_t next = 0;
  uint64_t bytes_uploaded = 0;

  auto record = [&](PartResult&& result) {
    bytes_uploaded += result.info.size;
    std::string message = fmt::format(
        "Uploaded and verified ({}/{} bytes)", bytes_uploaded, total_bytes);
    if (auto res = status_->RecordPhase(
            UploadStage::PartUpload, result.info.part_number, true, message);
        !res) {
      INTEGRA_LOG_ERROR(
          "cannot record part {}: {}", result.info.part_number, res.error());
    }
    reporter_->Print(
        "✓ Part {} uploaded and verified ({}/{} bytes)",
        result.info.part_number, bytes_uploaded, total_bytes);
    out->completed.emplace_back(std::move(result.completed));
    out->part_infos.emplace_back(std::move(result.info));
  };

  while (auto result = results->Pop()) {
    int32_t number = result->info.part_number;
    waiting.emplace(number, std::move(*result));

    while (next < order.size()) {
      auto it = waiting.find(order[next]);
      if (it == waiting.end()) {
        break;
      }
      record(std::move(it->second));
      waiting.erase(it);
      ++next;
    }
  }

  // Parts after a failed one
  for (auto& [number, result] : waiting) {
    record(std::move(result));
  }
}

integra::Result<integra::DispatchResult>
integra::UploadDispatcher::Run(std::vector<Part> parts, uint64_t total_bytes) {
  DispatchResult out;
  if (parts.empty()) {
    return out;
  }

  std::vector<int32_t> order;
  order.reserve(parts.size());
  for (const Part& part : parts) {
    if (!order.empty() && part.number() <= order.back()) {
      return INTEGRA_ERROR(
          ErrorCode::InvalidArgument,
          "parts must be ascending: part {} follows part {}", part.number(),
          order.back());
    }
    order.emplace_back(part.number());
  }

  uint32_t num_workers = static_cast<uint32_t>(
      std::min<uint64_t>(std::max<uint32_t>(num_workers_, 1), parts.size()));

  WorkQueue<Part> work(num_workers);
  WorkQueue<PartResult> results;
  FirstErrorSlot<PartFailure> first_error;

  std::thread collector(
      [&] { Collect(order, total_bytes, &results, &out); });

  std::vector<std::thread> workers;
  workers.reserve(num_workers);
  for (uint32_t i = 0; i < num_workers; ++i) {
    workers.emplace_back([&] { Work(&work, &results, &first_error); });
  }

  for (Part& part : parts) {
    if (first_error.HasValue() || IsCancelled(token_)) {
      break;
    }

    if (part.size() == 0) {
      reporter_->Print("Queueing final empty part {}...", part.number());
    } else {
      reporter_->Print("Queueing part {}...", part.number());
    }
    if (!work.Push(std::move(part))) {
      break;
    }
  }

  work.Close();
  for (std::thread& worker : workers) {
    worker.join();
  }
  results.Close();
  collector.join();

  // Cancelled without an in-flight failure: blame the first part that did
  // not complete
  if (!first_error.HasValue() && out.completed.size() < order.size()) {
    int32_t missing = order[out.completed.size()];
    for (size_t i = 0; i < out.completed.size(); ++i) {
      if (out.completed[i].part_number != order[i]) {
        missing = order[i];
        break;
      }
    }
    first_error.Offer(PartFailure{
        missing, CopyableErrorInfo(UploadErrorCode::Cancelled)
                     .WithContext("part {} was not uploaded", missing)});
  }

  if (auto failure = first_error.value(); failure) {
    reporter_->Print(
        "✗ Part {} failed: {}", failure->part_number, failure->error);
    INTEGRA_CHECKED(status_->RecordPhase(
        UploadStage::PartUpload, failure->part_number, false,
        "Failed to upload part", failure->error));
    return ErrorInfo(failure->error);
  }

  return out;
}
