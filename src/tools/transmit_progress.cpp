#include "tools/transmit_progress.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>

namespace binpost::tools {

namespace {

std::string ToLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

void SkipSpaces(std::string_view text, std::size_t& pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
}

bool ConsumeLiteral(std::string_view text, std::size_t& pos, std::string_view literal) {
  if (text.substr(pos, literal.size()) != literal) {
    return false;
  }
  pos += literal.size();
  return true;
}

bool ParseUintAt(std::string_view text, std::size_t& pos, std::uint64_t& value) {
  SkipSpaces(text, pos);
  if (pos >= text.size()) {
    return false;
  }
  const char* begin = text.data() + pos;
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr == begin) {
    return false;
  }
  pos += static_cast<std::size_t>(ptr - begin);
  return true;
}

bool IsDecimalChar(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.';
}

bool ParseDecimal(std::string_view digits, double& value) {
  if (digits.empty() || digits.front() == '.') {
    return false;
  }
  const std::string text(digits);
  char* parse_end = nullptr;
  value = std::strtod(text.c_str(), &parse_end);
  return parse_end != nullptr && *parse_end == '\0';
}

bool ParseDecimalAt(std::string_view text, std::size_t& pos, double& value) {
  SkipSpaces(text, pos);
  const std::size_t start = pos;
  while (pos < text.size() && IsDecimalChar(text[pos])) {
    ++pos;
  }
  return ParseDecimal(text.substr(start, pos - start), value);
}

// Parses the decimal that ends right before `end` (trailing spaces allowed).
bool ParseDecimalBefore(std::string_view text, std::size_t end, double& value) {
  while (end > 0U && text[end - 1] == ' ') {
    --end;
  }
  std::size_t start = end;
  while (start > 0U && IsDecimalChar(text[start - 1])) {
    --start;
  }
  return ParseDecimal(text.substr(start, end - start), value);
}

bool ParseFinished(std::string_view lower, ProgressUpdate& update) {
  std::size_t pos = lower.find("finished uploading");
  if (pos == std::string_view::npos) {
    return false;
  }
  pos += std::string_view("finished uploading").size();

  double size_mib = 0.0;
  if (ParseDecimalAt(lower, pos, size_mib)) {
    SkipSpaces(lower, pos);
    if (ConsumeLiteral(lower, pos, "mib")) {
      update.size_mib = size_mib;
    }
  }

  std::size_t speed_pos = lower.find('(', pos);
  if (speed_pos != std::string_view::npos) {
    ++speed_pos;
    double speed = 0.0;
    if (ParseDecimalAt(lower, speed_pos, speed)) {
      SkipSpaces(lower, speed_pos);
      if (ConsumeLiteral(lower, speed_pos, "mib/s")) {
        update.speed_mib_per_sec = speed;
      }
    }
  }

  update.kind = ProgressKind::kFinished;
  update.fraction = 1.0;
  return true;
}

bool ParseTotals(std::string_view lower, ProgressUpdate& update) {
  std::size_t pos = lower.find("uploading ");
  if (pos == std::string_view::npos) {
    return false;
  }
  pos += std::string_view("uploading ").size();

  std::uint64_t articles = 0;
  if (!ParseUintAt(lower, pos, articles)) {
    return false;
  }
  SkipSpaces(lower, pos);
  if (!ConsumeLiteral(lower, pos, "article")) {
    return false;
  }

  update.kind = ProgressKind::kTotals;
  update.total_articles = articles;
  const std::size_t mib_pos = lower.find(" mib", pos);
  if (mib_pos != std::string_view::npos) {
    double size_mib = 0.0;
    if (ParseDecimalBefore(lower, mib_pos, size_mib)) {
      update.size_mib = size_mib;
    }
  }
  return true;
}

bool ParseUploadedRatio(std::string_view lower, ProgressUpdate& update) {
  std::size_t pos = lower.find("uploaded ");
  if (pos == std::string_view::npos) {
    return false;
  }
  pos += std::string_view("uploaded ").size();

  std::uint64_t current = 0;
  std::uint64_t total = 0;
  if (!ParseUintAt(lower, pos, current)) {
    return false;
  }
  SkipSpaces(lower, pos);
  if (!ConsumeLiteral(lower, pos, "/") || !ParseUintAt(lower, pos, total)) {
    return false;
  }
  SkipSpaces(lower, pos);
  if (!ConsumeLiteral(lower, pos, "article")) {
    return false;
  }

  update.kind = ProgressKind::kArticles;
  update.current_articles = current;
  update.total_articles = total;
  return true;
}

bool ParseArticleOf(std::string_view lower, ProgressUpdate& update) {
  std::size_t search_from = 0;
  while (true) {
    const std::size_t found = lower.find("article ", search_from);
    if (found == std::string_view::npos) {
      return false;
    }
    search_from = found + 1U;

    std::size_t pos = found + std::string_view("article ").size();
    std::uint64_t current = 0;
    std::uint64_t total = 0;
    if (!ParseUintAt(lower, pos, current)) {
      continue;
    }
    SkipSpaces(lower, pos);
    if (!ConsumeLiteral(lower, pos, "of") || !ParseUintAt(lower, pos, total)) {
      continue;
    }

    update.kind = ProgressKind::kArticles;
    update.current_articles = current;
    update.total_articles = total;
    return true;
  }
}

bool ParsePercent(std::string_view lower, ProgressUpdate& update) {
  const std::size_t pos = lower.find('%');
  if (pos == std::string_view::npos || pos == 0U) {
    return false;
  }
  double percent = 0.0;
  if (!ParseDecimalBefore(lower, pos, percent)) {
    return false;
  }
  if (percent < 0.0 || percent > 100.0) {
    return false;
  }
  update.kind = ProgressKind::kPercent;
  update.fraction = percent / 100.0;
  return true;
}

} // namespace

ProgressUpdate TransmitProgressParser::ParseLine(std::string_view line) {
  ProgressUpdate update;
  const std::string lower = ToLower(line);

  if (ParseFinished(lower, update)) {
    return update;
  }
  if (ParseTotals(lower, update)) {
    total_articles_ = update.total_articles;
    if (update.size_mib > 0.0) {
      total_mib_ = update.size_mib;
    }
    return update;
  }
  if (ParseUploadedRatio(lower, update) || ParseArticleOf(lower, update)) {
    if (update.total_articles > 0U) {
      total_articles_ = update.total_articles;
      update.fraction = std::min(1.0, static_cast<double>(update.current_articles) /
                                          static_cast<double>(update.total_articles));
    }
    return update;
  }
  if (ParsePercent(lower, update)) {
    return update;
  }
  return ProgressUpdate{};
}

std::optional<int> TransmitProgressParser::NextLogStep(double fraction) {
  if (!(fraction >= 0.0)) {
    return std::nullopt;
  }
  const int step = std::min(10, static_cast<int>(std::floor(fraction * 10.0)));
  if (step <= last_logged_step_) {
    return std::nullopt;
  }
  last_logged_step_ = step;
  return step;
}

} // namespace binpost::tools
