#ifndef INTEGRA_LIBUPLOAD_INTEGRA_PARTSELECTOR_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_PARTSELECTOR_H_

#include <cstdint>
#include <vector>

#include "integra/ObjectStore.h"
#include "integra/Partitioner.h"
#include "integra/Result.h"
#include "integra/config.h"

namespace integra {

/// The parts handed to the completion call and what was left out
struct PartSelection {
  /// Ascending by part number
  std::vector<CompletedPart> included;
  std::vector<int32_t> skipped;
  /// Allow-list entries that match no uploaded part
  std::vector<int32_t> unmatched;

  std::vector<int32_t> included_numbers() const;
};

/// PartSelector decides which parts get uploaded and which of the uploaded
/// parts make up the completed object.
///
/// With an empty allow-list every uploaded part is included. A non-empty
/// allow-list keeps only the listed part numbers, which builds a partial
/// object. Independently, an extra zero-length part can be
/// appended after the last real part.
class INTEGRA_EXPORT PartSelector {
public:
  PartSelector() = default;
  PartSelector(std::vector<int32_t> allow_list, bool upload_empty_part)
      : allow_list_(std::move(allow_list)),
        upload_empty_part_(upload_empty_part) {}

  /// Validate fails with ConfigurationError if any part number is below 1
  Result<void> Validate() const;

  /// PlanParts returns the parts to upload: every part of view, followed by
  /// the empty trailing part if requested.
  std::vector<Part> PlanParts(const PartitionView& view) const;

  /// Select filters the uploaded parts. It does not modify all.
  PartSelection Select(const std::vector<CompletedPart>& all) const;

  bool has_allow_list() const { return !allow_list_.empty(); }
  const std::vector<int32_t>& allow_list() const { return allow_list_; }
  bool upload_empty_part() const { return upload_empty_part_; }

private:
  std::vector<int32_t> allow_list_;
  bool upload_empty_part_{false};
};

}  // namespace integra

#endif
