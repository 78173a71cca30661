#ifndef INTEGRA_LIBUPLOAD_INTEGRA_REPORTER_H_
#define INTEGRA_LIBUPLOAD_INTEGRA_REPORTER_H_

#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "integra/ObjectStore.h"
#include "integra/UploadStatus.h"
#include "integra/config.h"

namespace integra {

enum class Color {
  Green,
  Yellow,
  Orange,
};

/// Reporter writes the user-facing output of an upload: progress lines,
/// tables, verbose request and response dumps, and the phase summary.
///
/// Diagnostics meant for developers go through Logging.h instead.
///
/// All methods are thread safe; each call writes whole lines.
class INTEGRA_EXPORT Reporter {
public:
  Reporter(std::ostream& out, bool verbose, bool color)
      : out_(out), verbose_(verbose), color_(color) {}

  Reporter(const Reporter& no_copy) = delete;
  Reporter& operator=(const Reporter& no_copy) = delete;

  bool verbose() const { return verbose_; }
  bool color() const { return color_; }

  /// Print formats a message and writes it followed by a newline.
  template <typename F, typename... Args>
  void Print(F fmt_string, Args&&... args) {
    PrintLine(fmt::format(fmt_string, std::forward<Args>(args)...));
  }

  void PrintLine(const std::string& line);

  /// Dump writes doc as indented JSON between two rules, titled with the
  /// name of the call it belongs to. Only emitted in verbose mode.
  void Dump(const std::string& title, const nlohmann::ordered_json& doc);

  /// Colorize wraps text in the ANSI sequence for color, or returns it
  /// unchanged when color is disabled.
  std::string Colorize(Color color, const std::string& text) const;

  /// PrintPartsTable lists the parts the store has on record
  void PrintPartsTable(const std::vector<ListedPart>& parts);

  /// PrintChecksumSummary lists every uploaded part, whether it was included
  /// in the completed object, and its checksum. final_checksum is what the
  /// store reported for the object, composite is the checksum of checksums
  /// computed locally over the included parts.
  void PrintChecksumSummary(
      const std::vector<PartInfo>& infos, const std::vector<int32_t>& included,
      const std::optional<std::string>& final_checksum,
      const std::string& composite);

  void PrintSummary(const UploadStatus& status);

private:
  std::ostream& out_;
  bool verbose_;
  bool color_;
  std::mutex mutex_;
};

}  // namespace integra

#endif
