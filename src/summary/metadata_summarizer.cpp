#include "summary/metadata_summarizer.hpp"

#include "config/run_config.hpp"
#include "core/fs_utils.hpp"
#include "core/size_format.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace binpost::summary {

namespace {

constexpr std::array<std::string_view, 19> kMediaExtensions = {
    ".mkv", ".mp4", ".m4v", ".avi", ".mov", ".wmv", ".flv", ".webm", ".ts", ".mpg",
    ".mpeg", ".mp3", ".flac", ".m4a", ".aac", ".ogg", ".opus", ".wav", ".wma",
};

constexpr double kMaxRenderedSeconds = 1.0e9;

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

void RenderMedia(const tools::MediaAttributes& media, std::ostringstream& out) {
  if (!media.complete_name.empty()) {
    out << "    Complete name: " << BareFileName(media.complete_name) << '\n';
  }
  if (media.duration_seconds.has_value() && std::isfinite(media.duration_seconds.value())) {
    const double seconds = std::clamp(media.duration_seconds.value(), 0.0, kMaxRenderedSeconds);
    const auto millis = std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
    out << "    Duration: " << core::FormatClockDuration(millis) << '\n';
  }
  if (media.width.has_value() && media.height.has_value()) {
    out << "    Resolution: " << media.width.value() << 'x' << media.height.value() << '\n';
  }
  if (!media.video_codec.empty()) {
    out << "    Video codec: " << media.video_codec << '\n';
  }
  if (!media.audio_codec.empty()) {
    out << "    Audio codec: " << media.audio_codec << '\n';
  }
  if (media.bit_rate.has_value()) {
    out << "    Bit rate: " << (media.bit_rate.value() / 1000U) << " kb/s\n";
  }
}

} // namespace

fs::path DescriptorPathFor(const fs::path& source, const config::DescriptorSettings& settings) {
  const fs::path directory =
      settings.output_dir.empty() ? source.parent_path() : settings.output_dir;
  return directory / (config::SourceIdentifier(source) + ".nfo");
}

bool IsMediaFile(const fs::path& path) {
  const std::string extension = ToLower(path.extension().string());
  return std::find(kMediaExtensions.begin(), kMediaExtensions.end(), extension) !=
         kMediaExtensions.end();
}

std::string BareFileName(std::string_view reported_path) {
  const std::size_t separator = reported_path.find_last_of("/\\");
  if (separator == std::string_view::npos) {
    return std::string(reported_path);
  }
  return std::string(reported_path.substr(separator + 1U));
}

std::string RenderDescriptor(const DescriptorContent& content) {
  std::uint64_t total_bytes = 0;
  for (const auto& entry : content.entries) {
    total_bytes += entry.size_bytes;
  }

  std::ostringstream out;
  out << (content.banner.empty() ? std::string(kDefaultBanner) : content.banner) << "\n\n";
  out << "Name: " << content.name << '\n';
  out << "Type: " << (content.is_folder ? "folder" : "file") << '\n';
  out << "Files: " << content.entries.size() << '\n';
  out << "Total size: " << core::FormatByteSize(total_bytes) << " (" << total_bytes
      << " bytes)\n";

  if (content.is_folder) {
    out << "\nContents:\n";
    for (const auto& entry : content.entries) {
      out << "  " << entry.relative_path.generic_string() << "  "
          << core::FormatByteSize(entry.size_bytes) << '\n';
    }
  }

  bool media_header_written = false;
  for (const auto& entry : content.entries) {
    if (!entry.media.has_value()) {
      continue;
    }
    if (!media_header_written) {
      out << "\nMedia:\n";
      media_header_written = true;
    }
    out << "  " << entry.relative_path.generic_string() << '\n';
    RenderMedia(entry.media.value(), out);
  }
  return out.str();
}

SummaryResult MetadataSummarizer::Summarize(const fs::path& source,
                                            const config::DescriptorSettings& settings,
                                            bool dry_run) {
  SummaryResult result;
  const fs::path descriptor_path = DescriptorPathFor(source, settings);

  std::error_code ec;
  if (core::IsSameOrWithin(descriptor_path, source)) {
    logger_.Warn(fs::is_directory(source, ec)
                     ? "descriptor skipped: output would land inside the source folder"
                     : "descriptor skipped: output would replace the source file",
                 {{"descriptor", descriptor_path.string()}});
    return result;
  }

  if (dry_run) {
    logger_.Info("descriptor simulated", {{"descriptor", descriptor_path.string()}});
    result.descriptor_path = descriptor_path;
    result.simulated = true;
    return result;
  }

  DescriptorContent content;
  content.banner = settings.banner;
  content.name = config::SourceIdentifier(source);
  std::string error;
  if (!CollectEntries(source, content, error)) {
    logger_.Warn("descriptor skipped", {{"reason", error}});
    return result;
  }

  if (core::PathExists(descriptor_path)) {
    logger_.Warn("descriptor replaces an existing file",
                 {{"descriptor", descriptor_path.string()}});
  }
  if (!core::WriteTextFileAtomic(descriptor_path, RenderDescriptor(content), error)) {
    logger_.Warn("descriptor write failed",
                 {{"descriptor", descriptor_path.string()}, {"reason", error}});
    return result;
  }

  logger_.Info("descriptor written", {{"descriptor", descriptor_path.string()},
                                      {"files", std::to_string(content.entries.size())}});
  result.descriptor_path = descriptor_path;
  return result;
}

bool MetadataSummarizer::CollectEntries(const fs::path& source, DescriptorContent& content,
                                        std::string& error) {
  std::error_code ec;
  if (fs::is_regular_file(source, ec)) {
    DescriptorEntry entry;
    entry.relative_path = source.filename();
    entry.size_bytes = core::FileSizeOrZero(source);
    if (IsMediaFile(source)) {
      ProbeMedia(source, entry);
    }
    content.entries.push_back(std::move(entry));
    return true;
  }

  if (!fs::is_directory(source, ec)) {
    error = "source is neither a file nor a folder: " + source.string();
    return false;
  }

  content.is_folder = true;
  fs::recursive_directory_iterator it(source, ec);
  if (ec) {
    error = "failed to list " + source.string() + ": " + ec.message();
    return false;
  }
  std::vector<fs::path> files;
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      error = "failed to list " + source.string() + ": " + ec.message();
      return false;
    }
    std::error_code type_ec;
    if (it->is_regular_file(type_ec)) {
      files.push_back(it->path());
    }
  }
  std::sort(files.begin(), files.end());

  for (const auto& file : files) {
    DescriptorEntry entry;
    entry.relative_path = file.lexically_relative(source);
    entry.size_bytes = core::FileSizeOrZero(file);
    if (IsMediaFile(file)) {
      ProbeMedia(file, entry);
    }
    content.entries.push_back(std::move(entry));
  }
  return true;
}

void MetadataSummarizer::ProbeMedia(const fs::path& media_path, DescriptorEntry& entry) {
  if (probe_ == nullptr) {
    return;
  }
  if (!probe_checked_) {
    probe_checked_ = true;
    probe_usable_ = probe_->Available();
    if (!probe_usable_) {
      logger_.Warn("media probe unavailable; descriptor will omit media attributes",
                   {{"probe", probe_->Name()}});
    }
  }
  if (!probe_usable_) {
    return;
  }

  tools::MediaAttributes attributes;
  std::string error;
  if (!probe_->Probe(media_path, attributes, error)) {
    logger_.Warn("media probe failed",
                 {{"file", media_path.filename().string()}, {"reason", error}});
    return;
  }
  // Probes echo the absolute input path; only the file name may reach the
  // descriptor.
  attributes.complete_name = BareFileName(attributes.complete_name);
  entry.media = std::move(attributes);
}

} // namespace binpost::summary
