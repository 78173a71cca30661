#ifndef INTEGRA_LIBUPLOAD_INTEGRA_PARTITIONER_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_PARTITIONER_H_

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>

#include "integra/Result.h"
#include "integra/config.h"

namespace integra {

constexpr uint64_t
MiB(uint64_t v) {
  return v << 20;
}

/// S3 rejects non-final parts smaller than 5 MiB.
constexpr uint64_t kMinPartSize = MiB(5);
constexpr uint64_t kDefaultPartSize = MiB(5);
/// S3 limits a multipart upload to this many parts.
constexpr uint64_t kMaxParts = 10000;

/// A Part is one contiguous slice of an upload payload. It borrows the bytes
/// from the payload, which must outlive it.
///
/// The checksum is computed on first use and cached, so a Part must not be
/// shared between threads while Checksum() may still be called for the first
/// time.
class INTEGRA_EXPORT Part {
public:
  Part() = default;
  Part(int32_t number, uint64_t offset, uint64_t size, const uint8_t* data)
      : number_(number), offset_(offset), size_(size), data_(data) {}

  int32_t number() const { return number_; }
  uint64_t offset() const { return offset_; }
  uint64_t size() const { return size_; }
  const uint8_t* data() const { return data_; }

  /// Checksum returns the encoded CRC32 of this part, computing it once.
  const std::string& Checksum() const;

  /// RecomputeChecksum always recomputes the checksum from the bytes and
  /// ignores any cached value.
  std::string RecomputeChecksum() const;

private:
  int32_t number_{};
  uint64_t offset_{};
  uint64_t size_{};
  const uint8_t* data_{};
  mutable std::optional<std::string> checksum_;
};

/// A PartitionView splits a borrowed payload into parts of part_size bytes;
/// the last part may be shorter. Parts are produced lazily and the view can
/// be iterated any number of times.
class INTEGRA_EXPORT PartitionView {
public:
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Part;
    using difference_type = std::ptrdiff_t;
    using pointer = const Part*;
    using reference = Part;

    iterator() = default;
    iterator(const PartitionView* view, uint64_t index)
        : view_(view), index_(index) {}

    Part operator*() const { return (*view_)[index_]; }

    iterator& operator++() {
      ++index_;
      return *this;
    }

    iterator operator++(int) {
      iterator tmp = *this;
      ++index_;
      return tmp;
    }

    bool operator==(const iterator& other) const {
      return view_ == other.view_ && index_ == other.index_;
    }

    bool operator!=(const iterator& other) const { return !(*this == other); }

  private:
    const PartitionView* view_{};
    uint64_t index_{};
  };

  /// Make validates the partitioning parameters. It fails with
  /// ConfigurationError when part_size < min_part_size, when the payload is
  /// empty and allow_empty is false, or when the payload would need more
  /// than kMaxParts parts.
  static Result<PartitionView> Make(
      const uint8_t* data, uint64_t size, uint64_t part_size,
      uint64_t min_part_size = kMinPartSize, bool allow_empty = false);

  PartitionView() = default;

  iterator begin() const { return iterator(this, 0); }
  iterator end() const { return iterator(this, num_parts_); }

  uint64_t num_parts() const { return num_parts_; }
  uint64_t size() const { return size_; }
  uint64_t part_size() const { return part_size_; }
  const uint8_t* data() const { return data_; }

  /// operator[] returns the part at a 0-based index
  Part operator[](uint64_t index) const;

  /// PartFor returns the part with the given 1-based part number
  Result<Part> PartFor(int32_t part_number) const;

private:
  PartitionView(const uint8_t* data, uint64_t size, uint64_t part_size)
      : data_(data),
        size_(size),
        part_size_(part_size),
        num_parts_((size + part_size - 1) / part_size) {}

  const uint8_t* data_{};
  uint64_t size_{};
  uint64_t part_size_{};
  uint64_t num_parts_{};
};

}  // namespace integra

#endif
