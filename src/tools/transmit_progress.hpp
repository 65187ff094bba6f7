#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace binpost::tools {

enum class ProgressKind {
  kNone,
  // "Uploading N article(s) ... X MiB"
  kTotals,
  // "Uploaded X/Y articles" or "article X of Y"
  kArticles,
  // Bare "NN%" or "NN.N%"
  kPercent,
  // "Finished uploading X MiB ... (Y MiB/s)"
  kFinished,
};

struct ProgressUpdate {
  ProgressKind kind = ProgressKind::kNone;
  std::uint64_t current_articles = 0;
  std::uint64_t total_articles = 0;
  double size_mib = 0.0;
  double speed_mib_per_sec = 0.0;
  // Completion in [0, 1] when the line allows one to be computed.
  std::optional<double> fraction;
};

// Line-oriented parser for transmit tool output. It only feeds log output and
// must never influence stage control flow.
class TransmitProgressParser {
public:
  ProgressUpdate ParseLine(std::string_view line);

  // Returns the 10% step (1..10) newly reached by `fraction`, or nullopt when
  // no new step has been crossed since the last call that returned one.
  std::optional<int> NextLogStep(double fraction);

  std::optional<std::uint64_t> TotalArticles() const { return total_articles_; }
  std::optional<double> TotalMib() const { return total_mib_; }

private:
  std::optional<std::uint64_t> total_articles_;
  std::optional<double> total_mib_;
  int last_logged_step_ = 0;
};

} // namespace binpost::tools
