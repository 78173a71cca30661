#include "integra/Partitioner.h"

#include <string>
#include <vector>

#include "integra/Checksum.h"
#include "integra/ErrorCode.h"
#include "integra/Logging.h"
#include "integra/Random.h"
#include "integra/UploadErrors.h"

namespace {

const uint8_t*
Bytes(const std::string& s) {
  return reinterpret_cast<const uint8_t*>(s.data());
}

std::vector<uint8_t>
Reassemble(const integra::PartitionView& view) {
  std::vector<uint8_t> out;
  int32_t expected = 1;
  for (integra::Part part : view) {
    INTEGRA_LOG_ASSERT(part.number() == expected);
    INTEGRA_LOG_ASSERT(part.data() == view.data() + part.offset());
    out.insert(out.end(), part.data(), part.data() + part.size());
    ++expected;
  }
  return out;
}

void
TestHelloWorld() {
  std::string payload = "Hello, World";
  auto view_res = integra::PartitionView::Make(
      Bytes(payload), payload.size(), 5, 5);
  INTEGRA_LOG_ASSERT(view_res);
  const integra::PartitionView& view = view_res.value();

  INTEGRA_LOG_ASSERT(view.num_parts() == 3);
  INTEGRA_LOG_ASSERT(view[0].size() == 5);
  INTEGRA_LOG_ASSERT(view[1].size() == 5);
  INTEGRA_LOG_ASSERT(view[2].size() == 2);
  INTEGRA_LOG_ASSERT(view[2].offset() == 10);

  INTEGRA_LOG_ASSERT(view[0].Checksum() == integra::ComputeCrc32("Hello"));
  INTEGRA_LOG_ASSERT(view[1].Checksum() == integra::ComputeCrc32(", Wor"));
  INTEGRA_LOG_ASSERT(view[2].Checksum() == integra::ComputeCrc32("ld"));

  std::vector<uint8_t> out = Reassemble(view);
  INTEGRA_LOG_ASSERT(std::string(out.begin(), out.end()) == payload);

  // The view is restartable
  INTEGRA_LOG_ASSERT(Reassemble(view) == out);

  auto part = view.PartFor(2);
  INTEGRA_LOG_ASSERT(part);
  INTEGRA_LOG_ASSERT(part.value().offset() == 5);
  INTEGRA_LOG_ASSERT(
      part.value().RecomputeChecksum() == view[1].Checksum());

  auto none = view.PartFor(4);
  INTEGRA_LOG_ASSERT(!none);
  INTEGRA_LOG_ASSERT(none.error() == integra::ErrorCode::NotFound);
  INTEGRA_LOG_ASSERT(!view.PartFor(0));
}

void
TestReconstructs() {
  for (int i = 0; i < 20; ++i) {
    uint64_t size = integra::RandomInRange<uint64_t>(1, 4096);
    uint64_t part_size = integra::RandomInRange<uint64_t>(16, 1024);
    std::vector<uint8_t> payload = integra::RandomBytes(size);

    auto view_res =
        integra::PartitionView::Make(payload.data(), size, part_size, 16);
    INTEGRA_LOG_ASSERT(view_res);
    const integra::PartitionView& view = view_res.value();

    INTEGRA_LOG_VASSERT(
        view.num_parts() == (size + part_size - 1) / part_size,
        "size {} part size {} gave {} parts", size, part_size,
        view.num_parts());
    INTEGRA_LOG_ASSERT(Reassemble(view) == payload);
  }
}

void
TestInvalid() {
  std::string payload = "Hello, World";

  auto too_small =
      integra::PartitionView::Make(Bytes(payload), payload.size(), 4, 5);
  INTEGRA_LOG_ASSERT(!too_small);
  INTEGRA_LOG_ASSERT(
      too_small.error() == integra::UploadErrorCode::ConfigurationError);

  auto zero =
      integra::PartitionView::Make(Bytes(payload), payload.size(), 0, 0);
  INTEGRA_LOG_ASSERT(!zero);

  auto default_floor = integra::PartitionView::Make(
      Bytes(payload), payload.size(), integra::MiB(5) - 1);
  INTEGRA_LOG_ASSERT(!default_floor);

  auto empty = integra::PartitionView::Make(nullptr, 0, 5, 5);
  INTEGRA_LOG_ASSERT(!empty);
  INTEGRA_LOG_ASSERT(
      empty.error() == integra::UploadErrorCode::ConfigurationError);

  auto allowed = integra::PartitionView::Make(nullptr, 0, 5, 5, true);
  INTEGRA_LOG_ASSERT(allowed);
  INTEGRA_LOG_ASSERT(allowed.value().num_parts() == 0);
  INTEGRA_LOG_ASSERT(allowed.value().begin() == allowed.value().end());

  auto no_data = integra::PartitionView::Make(nullptr, 10, 5, 5);
  INTEGRA_LOG_ASSERT(!no_data);
}

void
TestMaxParts() {
  std::vector<uint8_t> payload(integra::kMaxParts + 1, 'x');

  auto at_limit = integra::PartitionView::Make(
      payload.data(), integra::kMaxParts, 1, 1);
  INTEGRA_LOG_ASSERT(at_limit);
  INTEGRA_LOG_ASSERT(at_limit.value().num_parts() == integra::kMaxParts);

  auto over_limit =
      integra::PartitionView::Make(payload.data(), payload.size(), 1, 1);
  INTEGRA_LOG_ASSERT(!over_limit);
  INTEGRA_LOG_ASSERT(
      over_limit.error() == integra::UploadErrorCode::ConfigurationError);
}

}  // namespace

int
main() {
  TestHelloWorld();
  TestReconstructs();
  TestInvalid();
  TestMaxParts();
}
