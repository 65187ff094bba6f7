#include "tools/ffprobe_media_probe.hpp"

#include "core/process/shell_command.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace binpost::tools {

namespace {

// Roughly 31 years; anything longer is a bogus container header.
constexpr double kMaxDurationSeconds = 1.0e9;

struct StreamFields {
  std::string codec_type;
  std::string codec_name;
  std::optional<std::uint32_t> width;
  std::optional<std::uint32_t> height;
};

std::string_view Trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

bool IsUnavailable(std::string_view value) {
  return value.empty() || value == "N/A" || value == "unknown";
}

template <typename T> std::optional<T> ParseUnsigned(std::string_view value) {
  if (IsUnavailable(value)) {
    return std::nullopt;
  }
  T parsed = 0;
  const char* begin = value.data();
  const char* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<double> ParseSeconds(std::string_view value) {
  if (IsUnavailable(value)) {
    return std::nullopt;
  }
  const std::string text(value);
  char* parse_end = nullptr;
  const double parsed = std::strtod(text.c_str(), &parse_end);
  if (parse_end == nullptr || *parse_end != '\0' || !std::isfinite(parsed) || parsed < 0.0 ||
      parsed > kMaxDurationSeconds) {
    return std::nullopt;
  }
  return parsed;
}

void CommitStream(const StreamFields& stream, MediaAttributes& attributes) {
  if (stream.codec_type == "video" && attributes.video_codec.empty()) {
    attributes.video_codec = stream.codec_name;
    attributes.width = stream.width;
    attributes.height = stream.height;
  } else if (stream.codec_type == "audio" && attributes.audio_codec.empty()) {
    attributes.audio_codec = stream.codec_name;
  }
}

} // namespace

bool ParseFfprobeOutput(const std::vector<std::string>& lines, MediaAttributes& attributes,
                        std::string& error) {
  attributes = MediaAttributes{};
  error.clear();

  enum class Section { kNone, kStream, kFormat };
  Section section = Section::kNone;
  StreamFields stream;
  bool saw_section = false;

  for (const auto& raw_line : lines) {
    const std::string_view line = Trim(raw_line);
    if (line == "[STREAM]") {
      section = Section::kStream;
      stream = StreamFields{};
      saw_section = true;
      continue;
    }
    if (line == "[/STREAM]") {
      CommitStream(stream, attributes);
      section = Section::kNone;
      continue;
    }
    if (line == "[FORMAT]") {
      section = Section::kFormat;
      saw_section = true;
      continue;
    }
    if (line == "[/FORMAT]") {
      section = Section::kNone;
      continue;
    }

    const std::size_t eq = line.find('=');
    if (eq == std::string_view::npos || section == Section::kNone) {
      continue;
    }
    const std::string_view key = line.substr(0, eq);
    const std::string_view value = line.substr(eq + 1U);

    if (section == Section::kStream) {
      if (key == "codec_type") {
        stream.codec_type = std::string(value);
      } else if (key == "codec_name" && !IsUnavailable(value)) {
        stream.codec_name = std::string(value);
      } else if (key == "width") {
        stream.width = ParseUnsigned<std::uint32_t>(value);
      } else if (key == "height") {
        stream.height = ParseUnsigned<std::uint32_t>(value);
      }
    } else {
      if (key == "filename") {
        attributes.complete_name = std::string(value);
      } else if (key == "duration") {
        attributes.duration_seconds = ParseSeconds(value);
      } else if (key == "bit_rate") {
        attributes.bit_rate = ParseUnsigned<std::uint64_t>(value);
      }
    }
  }

  if (!saw_section) {
    error = "probe output contained no stream or format section";
    return false;
  }
  return true;
}

FfprobeMediaProbe::FfprobeMediaProbe(std::string executable)
    : executable_(std::move(executable)) {}

bool FfprobeMediaProbe::Available() const {
  return core::process::IsCommandAvailable(executable_);
}

std::string FfprobeMediaProbe::BuildCommand(const fs::path& media_path) const {
  return core::process::JoinShellCommand({
      executable_,
      "-v",
      "error",
      "-show_entries",
      "format=filename,duration,bit_rate:stream=codec_type,codec_name,width,height",
      "-of",
      "default",
      media_path.string(),
  });
}

bool FfprobeMediaProbe::Probe(const fs::path& media_path, MediaAttributes& attributes,
                              std::string& error) {
  std::vector<std::string> lines;
  core::process::CommandResult result;
  const auto collect = [&lines](std::string_view line) { lines.emplace_back(line); };
  if (!core::process::RunShellCommand(BuildCommand(media_path), collect, result, error)) {
    return false;
  }
  if (result.exit_code != 0) {
    error = executable_ + " exited with code " + std::to_string(result.exit_code);
    const std::string tail = core::process::SummarizeOutputTail(result.output_tail);
    if (!tail.empty()) {
      error += ": " + tail;
    }
    return false;
  }
  return ParseFfprobeOutput(lines, attributes, error);
}

} // namespace binpost::tools
