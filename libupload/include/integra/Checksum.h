#ifndef INTEGRA_LIBUPLOAD_INTEGRA_CHECKSUM_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_CHECKSUM_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "integra/Result.h"
#include "integra/config.h"

/// @file Checksum.h
///
/// CRC32 checksums in the form S3 puts on the wire: the IEEE CRC of the exact
/// bytes, serialized big-endian into four bytes and base64 encoded. Each call
/// is independent; there is no incremental state carried between parts.

namespace integra {

/// Crc32 returns the IEEE CRC32 of data[0, size).
INTEGRA_EXPORT uint32_t Crc32(const uint8_t* data, uint64_t size);

/// EncodeCrc32 serializes crc big-endian and base64 encodes the four bytes.
INTEGRA_EXPORT std::string EncodeCrc32(uint32_t crc);

/// DecodeCrc32 is the inverse of EncodeCrc32. Any "-N" part count suffix is
/// ignored.
INTEGRA_EXPORT Result<uint32_t> DecodeCrc32(const std::string& encoded);

INTEGRA_EXPORT std::string ComputeCrc32(const uint8_t* data, uint64_t size);
INTEGRA_EXPORT std::string ComputeCrc32(std::string_view data);

/// ComputeCompositeCrc32 returns the "checksum of checksums" S3 reports for a
/// multipart object: the CRC32 of the concatenated decoded part checksums,
/// base64 encoded, followed by "-<number of parts>".
INTEGRA_EXPORT Result<std::string> ComputeCompositeCrc32(
    const std::vector<std::string>& part_checksums);

/// StripPartCountSuffix removes a trailing "-N" from a composite checksum.
INTEGRA_EXPORT std::string StripPartCountSuffix(const std::string& checksum);

/// DescribeCrc32 renders an encoded checksum with its hex and decimal forms,
/// e.g., "AAAAAA== (0x00000000, 0)", or just the text when it does not
/// decode.
INTEGRA_EXPORT std::string DescribeCrc32(const std::string& encoded);

}  // namespace integra

#endif
