#include "integra/Partitioner.h"

#include <algorithm>

#include "integra/Checksum.h"
#include "integra/UploadErrors.h"

const std::string&
integra::Part::Checksum() const {
  if (!checksum_) {
    checksum_ = RecomputeChecksum();
  }
  return *checksum_;
}

std::string
integra::Part::RecomputeChecksum() const {
  return ComputeCrc32(data_, size_);
}

integra::Result<integra::PartitionView>
integra::PartitionView::Make(
    const uint8_t* data, uint64_t size, uint64_t part_size,
    uint64_t min_part_size, bool allow_empty) {
  if (part_size == 0 || part_size < min_part_size) {
    return INTEGRA_ERROR(
        UploadErrorCode::ConfigurationError,
        "part size {} is below the minimum of {} bytes", part_size,
        min_part_size);
  }
  if (size == 0 && !allow_empty) {
    return INTEGRA_ERROR(
        UploadErrorCode::ConfigurationError,
        "payload is empty; at least one byte of content is required");
  }
  if (size > 0 && data == nullptr) {
    return INTEGRA_ERROR(
        UploadErrorCode::ConfigurationError, "payload of {} bytes has no data",
        size);
  }

  PartitionView view(data, size, part_size);
  if (view.num_parts() > kMaxParts) {
    return INTEGRA_ERROR(
        UploadErrorCode::ConfigurationError,
        "payload of {} bytes needs {} parts of {} bytes, more than the limit "
        "of {}",
        size, view.num_parts(), part_size, kMaxParts);
  }
  return view;
}

integra::Part
integra::PartitionView::operator[](uint64_t index) const {
  INTEGRA_LOG_DEBUG_ASSERT(index < num_parts_);
  uint64_t offset = index * part_size_;
  uint64_t len = std::min(part_size_, size_ - offset);
  return Part(static_cast<int32_t>(index + 1), offset, len, data_ + offset);
}

integra::Result<integra::Part>
integra::PartitionView::PartFor(int32_t part_number) const {
  if (part_number < 1 || static_cast<uint64_t>(part_number) > num_parts_) {
    return INTEGRA_ERROR(
        ErrorCode::NotFound, "no part {} in a payload of {} parts", part_number,
        num_parts_);
  }
  return (*this)[part_number - 1];
}
