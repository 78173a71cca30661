#ifndef INTEGRA_LIBSUPPORT_INTEGRA_STRINGS_H_
#define INTEGRA_LIBSUPPORT_INTEGRA_STRINGS_H_

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "integra/config.h"

/// String helpers for checksum text, credential files and store messages.
///
/// \file Strings.h

namespace integra {

/// ToBase64 is standard, padded base64, the form S3 uses for checksums.
INTEGRA_EXPORT std::string ToBase64(const std::string& bytes);

/// FromBase64 decodes padded base64. Check the input with IsBase64 first;
/// characters outside the alphabet are not reported.
INTEGRA_EXPORT std::string FromBase64(const std::string& text);

/// IsBase64 is true when s is whole groups of four characters from the
/// standard alphabet with at most two '=' at the end.
INTEGRA_EXPORT bool IsBase64(std::string_view s);

INTEGRA_EXPORT bool HasPrefix(std::string_view s, std::string_view prefix);

INTEGRA_EXPORT bool HasSuffix(std::string_view s, std::string_view suffix);

INTEGRA_EXPORT std::string_view TrimSpace(std::string_view s);

INTEGRA_EXPORT std::string ToLower(std::string_view s);

/// SplitView splits s at each sep, at most max times, so there are at most
/// max + 1 pieces. The pieces point into s. An empty sep does not split.
INTEGRA_EXPORT std::vector<std::string_view> SplitView(
    std::string_view s, std::string_view sep,
    uint64_t max = std::numeric_limits<uint64_t>::max());

/// Join writes each item with operator<< and puts sep between them.
template <typename Range>
std::string
Join(const Range& items, std::string_view sep) {
  std::ostringstream out;
  std::string_view next_sep;
  for (const auto& item : items) {
    out << next_sep << item;
    next_sep = sep;
  }
  return out.str();
}

}  // namespace integra

#endif
