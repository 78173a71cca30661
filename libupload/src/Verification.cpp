#include "integra/Verification.h"

#include <map>
#include <set>

#include "integra/Checksum.h"
#include "integra/UploadErrors.h"

integra::Result<std::vector<integra::ListedPart>>
integra::VerifyUploadedParts(
    ObjectStore& store, const UploadRef& upload,
    const std::vector<Part>& uploaded, const CancellationToken* token,
    Reporter* reporter) {
  reporter->Print("Listing parts for verification...");

  auto listed =
      INTEGRA_CHECKED_CONTEXT(store.ListParts(upload, token), "listing parts");

  reporter->Dump(
      "ListParts", nlohmann::ordered_json{
                       {"Request", upload},
                       {"Response", nlohmann::ordered_json{{"Parts", listed}}},
                   });
  reporter->PrintPartsTable(listed);

  if (listed.size() != uploaded.size()) {
    return INTEGRA_ERROR(
        UploadErrorCode::VerificationError,
        "parts count mismatch: uploaded {}, listed {}", uploaded.size(),
        listed.size());
  }

  std::map<int32_t, const Part*> by_number;
  for (const Part& part : uploaded) {
    by_number.emplace(part.number(), &part);
  }

  std::set<int32_t> seen;
  for (const ListedPart& lp : listed) {
    if (!seen.emplace(lp.part_number).second) {
      return INTEGRA_ERROR(
          UploadErrorCode::VerificationError,
          "store lists part {} more than once", lp.part_number);
    }
    auto it = by_number.find(lp.part_number);
    if (it == by_number.end()) {
      return INTEGRA_ERROR(
          UploadErrorCode::VerificationError,
          "store lists part {} which was never uploaded", lp.part_number);
    }
    const Part& part = *it->second;

    if (lp.size != part.size()) {
      return INTEGRA_ERROR(
          UploadErrorCode::VerificationError,
          "size mismatch for part {}: expected {}, got {}", lp.part_number,
          part.size(), lp.size);
    }

    if (!lp.checksum || lp.checksum->empty()) {
      return INTEGRA_ERROR(
          UploadErrorCode::VerificationError, "part {} missing CRC32 checksum",
          lp.part_number);
    }

    std::string expected = part.RecomputeChecksum();
    if (*lp.checksum != expected) {
      return INTEGRA_ERROR(
          UploadErrorCode::VerificationError,
          "checksum mismatch for part {}: expected {}, got {}", lp.part_number,
          DescribeCrc32(expected), DescribeCrc32(*lp.checksum));
    }
  }

  for (const auto& [number, part] : by_number) {
    if (seen.count(number) == 0) {
      return INTEGRA_ERROR(
          UploadErrorCode::VerificationError,
          "part {} was uploaded but the store does not list it", number);
    }
  }

  return listed;
}
