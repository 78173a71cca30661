#include "integra/Reporter.h"

#include <algorithm>
#include <set>

#include "integra/JSON.h"
#include "integra/Logging.h"

namespace {

constexpr const char* kReset = "\033[0m";
const std::string kRule(80, '-');
const std::string kDoubleRule(80, '=');

const char*
AnsiCode(integra::Color color) {
  switch (color) {
  case integra::Color::Green:
    return "\033[32m";
  case integra::Color::Yellow:
    return "\033[33m";
  case integra::Color::Orange:
    return "\033[38;5;208m";
  default:
    return "";
  }
}

}  // namespace

void
integra::Reporter::PrintLine(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line << "\n";
  out_.flush();
}

void
integra::Reporter::Dump(
    const std::string& title, const nlohmann::ordered_json& doc) {
  if (!verbose_) {
    return;
  }

  auto text_res = JsonDump(doc, 2);
  if (!text_res) {
    INTEGRA_LOG_WARN("cannot render {}: {}", title, text_res.error());
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  out_ << kDoubleRule << "\n"
       << title << ":\n\n"
       << text_res.value() << "\n"
       << kDoubleRule << "\n\n";
  out_.flush();
}

std::string
integra::Reporter::Colorize(Color color, const std::string& text) const {
  if (!color_) {
    return text;
  }
  return fmt::format("{}{}{}", AnsiCode(color), text, kReset);
}

void
integra::Reporter::PrintPartsTable(const std::vector<ListedPart>& parts) {
  fmt::memory_buffer buf;
  fmt::format_to(std::back_inserter(buf), "\nFound {} parts:\n", parts.size());
  fmt::format_to(std::back_inserter(buf), "{}\n", kRule);
  fmt::format_to(
      std::back_inserter(buf), "{:<8} {:<12} {:<32} {:<24} {}\n", "Part #",
      "Size", "ETag", "Last Modified", "Checksum (CRC32)");
  fmt::format_to(std::back_inserter(buf), "{}\n", kRule);
  for (const ListedPart& part : parts) {
    fmt::format_to(
        std::back_inserter(buf), "{:<8} {:<12} {:<32} {:<24} {}\n",
        part.part_number, part.size, part.etag, part.last_modified,
        part.checksum.value_or(""));
  }
  fmt::format_to(std::back_inserter(buf), "{}", kRule);

  PrintLine(fmt::to_string(buf));
}

void
integra::Reporter::PrintChecksumSummary(
    const std::vector<PartInfo>& infos, const std::vector<int32_t>& included,
    const std::optional<std::string>& final_checksum,
    const std::string& composite) {
  std::set<int32_t> included_set(included.begin(), included.end());

  std::vector<PartInfo> sorted(infos);
  std::sort(
      sorted.begin(), sorted.end(), [](const PartInfo& a, const PartInfo& b) {
        return a.part_number < b.part_number;
      });

  fmt::memory_buffer buf;
  fmt::format_to(std::back_inserter(buf), "\n=== Checksums Summary ===\n");
  fmt::format_to(
      std::back_inserter(buf), "{}\n",
      Colorize(
          Color::Green,
          fmt::format(
              "{:<8} {:<12} {:<15} {}", "Part #", "Size (bytes)", "Status",
              "Checksum (CRC32)")));
  fmt::format_to(std::back_inserter(buf), "{}\n", kRule);

  for (const PartInfo& info : sorted) {
    bool is_included = included_set.count(info.part_number) > 0;
    std::string columns = fmt::format(
        "{:<8} {:<12} {:<15}", info.part_number, info.size,
        is_included ? "included" : "skipped");
    if (is_included) {
      columns = Colorize(Color::Orange, columns);
    }
    fmt::format_to(
        std::back_inserter(buf), "{} {}\n", columns,
        Colorize(Color::Yellow, info.checksum));
  }

  fmt::format_to(std::back_inserter(buf), "{}", kRule);
  if (final_checksum) {
    fmt::format_to(
        std::back_inserter(buf), "\n{}{}",
        Colorize(Color::Green, "Final object CRC32: "),
        Colorize(Color::Yellow, *final_checksum));
  }
  if (!composite.empty()) {
    fmt::format_to(
        std::back_inserter(buf), "\n{}{}",
        Colorize(Color::Green, "Checksum of checksums: "),
        Colorize(Color::Yellow, composite));
  }
  fmt::format_to(std::back_inserter(buf), "\n");

  PrintLine(fmt::to_string(buf));
}

void
integra::Reporter::PrintSummary(const UploadStatus& status) {
  // Summary() ends with a newline
  std::string summary = status.Summary();
  if (!summary.empty() && summary.back() == '\n') {
    summary.pop_back();
  }
  PrintLine("\n" + summary);
}
