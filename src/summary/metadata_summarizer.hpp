#pragma once

#include "config/run_config.hpp"
#include "core/logging/logger.hpp"
#include "tools/media_probe.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace binpost::summary {

inline constexpr std::string_view kDefaultBanner = "== binpost release descriptor ==";

// One row of the descriptor's content listing. `relative_path` is relative to
// the source folder (or the bare file name for single-file input).
struct DescriptorEntry {
  std::filesystem::path relative_path;
  std::uint64_t size_bytes = 0;
  std::optional<tools::MediaAttributes> media;
};

struct DescriptorContent {
  std::string banner;
  std::string name;
  bool is_folder = false;
  std::vector<DescriptorEntry> entries;
};

// `<dir>/<name>.nfo`, where dir defaults to the source's parent directory.
std::filesystem::path DescriptorPathFor(const std::filesystem::path& source,
                                        const config::DescriptorSettings& settings);

bool IsMediaFile(const std::filesystem::path& path);

// Reduces a probe-reported path (POSIX or Windows separators) to its file name.
std::string BareFileName(std::string_view reported_path);

std::string RenderDescriptor(const DescriptorContent& content);

struct SummaryResult {
  // Set when a descriptor was written, or would be written in dry-run.
  std::optional<std::filesystem::path> descriptor_path;
  bool simulated = false;
};

// Best-effort descriptor generation. Failures are logged as warnings and
// reported as an empty result; nothing here can fail a run.
class MetadataSummarizer {
public:
  // `probe` may be null, in which case media attributes are omitted.
  MetadataSummarizer(tools::IMediaProbe* probe, core::logging::Logger& logger)
      : probe_(probe), logger_(logger) {}

  SummaryResult Summarize(const std::filesystem::path& source,
                          const config::DescriptorSettings& settings, bool dry_run);

private:
  bool CollectEntries(const std::filesystem::path& source, DescriptorContent& content,
                      std::string& error);
  void ProbeMedia(const std::filesystem::path& media_path, DescriptorEntry& entry);

  tools::IMediaProbe* probe_ = nullptr;
  core::logging::Logger& logger_;
  bool probe_checked_ = false;
  bool probe_usable_ = false;
};

} // namespace binpost::summary
