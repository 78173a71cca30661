#include "integra/Checksum.h"

#include <array>

#include <boost/crc.hpp>
#include <fmt/format.h>

#include "integra/Strings.h"
#include "integra/UploadErrors.h"

namespace {

constexpr size_t kCrc32Bytes = 4;

std::string
ToBigEndian(uint32_t crc) {
  std::array<char, kCrc32Bytes> buf{
      static_cast<char>((crc >> 24) & 0xff),
      static_cast<char>((crc >> 16) & 0xff),
      static_cast<char>((crc >> 8) & 0xff),
      static_cast<char>(crc & 0xff),
  };
  return std::string(buf.begin(), buf.end());
}

}  // namespace

uint32_t
integra::Crc32(const uint8_t* data, uint64_t size) {
  boost::crc_32_type crc;
  if (size > 0) {
    crc.process_bytes(data, size);
  }
  return crc.checksum();
}

std::string
integra::EncodeCrc32(uint32_t crc) {
  return ToBase64(ToBigEndian(crc));
}

integra::Result<uint32_t>
integra::DecodeCrc32(const std::string& encoded) {
  std::string text = StripPartCountSuffix(encoded);
  if (!IsBase64(text)) {
    return INTEGRA_ERROR(
        ErrorCode::InvalidArgument, "checksum {} is not base64", encoded);
  }
  std::string raw = FromBase64(text);
  if (raw.size() != kCrc32Bytes) {
    return INTEGRA_ERROR(
        ErrorCode::InvalidArgument,
        "checksum {} decodes to {} bytes, expected {}", encoded, raw.size(),
        kCrc32Bytes);
  }

  uint32_t crc = 0;
  for (char c : raw) {
    crc = (crc << 8) | static_cast<uint8_t>(c);
  }
  return crc;
}

std::string
integra::ComputeCrc32(const uint8_t* data, uint64_t size) {
  return EncodeCrc32(Crc32(data, size));
}

std::string
integra::ComputeCrc32(std::string_view data) {
  return ComputeCrc32(
      reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

integra::Result<std::string>
integra::ComputeCompositeCrc32(const std::vector<std::string>& part_checksums) {
  std::string concatenated;
  concatenated.reserve(part_checksums.size() * kCrc32Bytes);
  for (const std::string& checksum : part_checksums) {
    uint32_t crc = INTEGRA_CHECKED_CONTEXT(
        DecodeCrc32(checksum), "computing composite checksum");
    concatenated += ToBigEndian(crc);
  }

  return fmt::format(
      "{}-{}", ComputeCrc32(concatenated), part_checksums.size());
}

std::string
integra::StripPartCountSuffix(const std::string& checksum) {
  size_t dash = checksum.rfind('-');
  if (dash == std::string::npos || dash + 1 == checksum.size()) {
    return checksum;
  }
  for (size_t i = dash + 1; i < checksum.size(); ++i) {
    if (checksum[i] < '0' || checksum[i] > '9') {
      return checksum;
    }
  }
  return checksum.substr(0, dash);
}

std::string
integra::DescribeCrc32(const std::string& encoded) {
  auto res = DecodeCrc32(encoded);
  if (!res) {
    return encoded;
  }
  return fmt::format("{} (0x{:08x}, {})", encoded, res.value(), res.value());
}
