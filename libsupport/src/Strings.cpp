#include "integra/Strings.h"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>

namespace {

bool
IsBase64Char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

}  // namespace

bool
integra::HasPrefix(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

bool
integra::HasSuffix(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.substr(s.size() - suffix.size()) == suffix;
}

std::string_view
integra::TrimSpace(std::string_view s) {
  auto is_space = [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  while (!s.empty() && is_space(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

std::string
integra::ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::vector<std::string_view>
integra::SplitView(std::string_view s, std::string_view sep, uint64_t max) {
  std::vector<std::string_view> pieces;
  if (sep.empty()) {
    pieces.emplace_back(s);
    return pieces;
  }
  while (pieces.size() < max) {
    size_t at = s.find(sep);
    if (at == std::string_view::npos) {
      break;
    }
    pieces.emplace_back(s.substr(0, at));
    s.remove_prefix(at + sep.size());
  }
  pieces.emplace_back(s);
  return pieces;
}

bool
integra::IsBase64(std::string_view s) {
  if (s.size() % 4 != 0) {
    return false;
  }
  size_t data_len = s.size();
  while (data_len > 0 && s.size() - data_len < 2 && s[data_len - 1] == '=') {
    --data_len;
  }
  return std::all_of(s.begin(), s.begin() + data_len, IsBase64Char);
}

std::string
integra::FromBase64(const std::string& text) {
  namespace bai = boost::archive::iterators;
  using Decoder = bai::transform_width<
      bai::binary_from_base64<std::string::const_iterator>, 8, 6>;
  // '=' decodes as zero bits; each one adds a byte that is not data
  size_t pad = 0;
  while (pad < 2 && pad < text.size() && text[text.size() - 1 - pad] == '=') {
    ++pad;
  }
  std::string bytes(Decoder(text.begin()), Decoder(text.end()));
  bytes.resize(bytes.size() - std::min(bytes.size(), pad));
  return bytes;
}

std::string
integra::ToBase64(const std::string& bytes) {
  namespace bai = boost::archive::iterators;
  using Encoder = bai::base64_from_binary<
      bai::transform_width<std::string::const_iterator, 6, 8>>;
  std::string text(Encoder(bytes.cbegin()), Encoder(bytes.cend()));
  return text.append((3 - bytes.size() % 3) % 3, '=');
}
