#include "integra/PartSelector.h"

#include <algorithm>
#include <set>

#include "integra/UploadErrors.h"

std::vector<int32_t>
integra::PartSelection::included_numbers() const {
  std::vector<int32_t> numbers;
  numbers.reserve(included.size());
  for (const CompletedPart& part : included) {
    numbers.emplace_back(part.part_number);
  }
  return numbers;
}

integra::Result<void>
integra::PartSelector::Validate() const {
  for (int32_t index : allow_list_) {
    if (index < 1) {
      return INTEGRA_ERROR(
          UploadErrorCode::ConfigurationError,
          "part numbers must be at least 1, got {}", index);
    }
  }
  return ResultSuccess();
}

std::vector<integra::Part>
integra::PartSelector::PlanParts(const PartitionView& view) const {
  std::vector<Part> parts;
  parts.reserve(view.num_parts() + (upload_empty_part_ ? 1 : 0));
  for (Part part : view) {
    parts.emplace_back(std::move(part));
  }

  if (upload_empty_part_) {
    const uint8_t* end = view.data() ? view.data() + view.size() : nullptr;
    parts.emplace_back(
        static_cast<int32_t>(view.num_parts() + 1), view.size(), 0, end);
  }
  return parts;
}

integra::PartSelection
integra::PartSelector::Select(const std::vector<CompletedPart>& all) const {
  PartSelection selection;

  std::vector<CompletedPart> sorted(all);
  std::sort(
      sorted.begin(), sorted.end(),
      [](const CompletedPart& a, const CompletedPart& b) {
        return a.part_number < b.part_number;
      });

  if (allow_list_.empty()) {
    selection.included = std::move(sorted);
    return selection;
  }

  std::set<int32_t> allowed(allow_list_.begin(), allow_list_.end());
  std::set<int32_t> uploaded;
  for (CompletedPart& part : sorted) {
    uploaded.insert(part.part_number);
    if (allowed.count(part.part_number) > 0) {
      selection.included.emplace_back(std::move(part));
    } else {
      selection.skipped.emplace_back(part.part_number);
    }
  }

  for (int32_t index : allowed) {
    if (uploaded.count(index) == 0) {
      selection.unmatched.emplace_back(index);
    }
  }
  return selection;
}
