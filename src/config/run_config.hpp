#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace binpost::config {

// Closed set of parity generators. Resolved once to a concrete tool by
// tools::MakeParityTool; nothing downstream branches on the name string.
enum class ParityBackend {
  kParpar,
  kPar2,
};

// What to do when the manifest path already exists on disk.
enum class ConflictPolicy {
  kRename,
  kOverwrite,
  kFail,
};

const char* ToString(ParityBackend backend);
const char* ToString(ConflictPolicy policy);

bool ParseParityBackend(std::string_view raw, ParityBackend& backend, std::string& error);
bool ParseConflictPolicy(std::string_view raw, ConflictPolicy& policy, std::string& error);

// Parses "20M", "700K", "1G", "512", "20MiB", "20MB" into bytes using binary
// multiples. Zero and malformed values are rejected.
bool ParseSizeString(std::string_view raw, std::uint64_t& bytes, std::string& error);

// Server settings for the transmit tool, loaded from the credential file.
struct TransmitCredentials {
  std::string host;
  std::uint16_t port = 563;
  bool ssl = true;
  std::string user;
  std::string password;
  std::uint32_t connections = 50;
  std::string article_size = "700K";
  // Group from the credential file; `RunConfiguration::group` wins when set.
  std::string group;
};

struct DescriptorSettings {
  bool enabled = true;
  // Empty means the built-in banner.
  std::string banner;
  // Empty means the source's parent directory.
  std::filesystem::path output_dir;
};

inline constexpr int kDefaultRedundancyPercent = 15;
inline constexpr std::string_view kDefaultPostSize = "20M";
inline constexpr std::string_view kDefaultManifestTemplate = "{name}.nzb";
inline constexpr std::string_view kDefaultEnvFile = ".env";

// Immutable per-invocation configuration. Built once by the CLI (flags plus
// the credential file) and handed to the pipeline by value; stage logic never
// reads process environment directly.
struct RunConfiguration {
  std::filesystem::path source_path;
  int redundancy_percent = kDefaultRedundancyPercent;
  ParityBackend parity_backend = ParityBackend::kParpar;
  std::string post_size = std::string(kDefaultPostSize);
  std::uint64_t post_size_bytes = 20ULL * 1024ULL * 1024ULL;
  // Empty means the source identifier.
  std::string subject;
  // Empty means TransmitCredentials::group.
  std::string group;

  bool dry_run = false;
  bool skip_archive = false;
  bool skip_parity = false;
  bool skip_transmit = false;
  bool force_overwrite = false;
  bool keep_intermediate_files = false;

  ConflictPolicy conflict_policy = ConflictPolicy::kRename;
  std::string manifest_path_template = std::string(kDefaultManifestTemplate);
  std::optional<std::filesystem::path> env_file;

  DescriptorSettings descriptor;
  TransmitCredentials credentials;
};

// Absolute, lexically normal source path without a trailing separator, so
// "photos/" and "./photos" name the same thing.
std::filesystem::path NormalizeSourcePath(const std::filesystem::path& source_path);

// Base name used to expand templates and name artifacts: the folder name for
// directories, the file stem for single files.
std::string SourceIdentifier(const std::filesystem::path& source_path);

std::string EffectiveSubject(const RunConfiguration& config);
std::string EffectiveGroup(const RunConfiguration& config);

// Field-level validation run in the pipeline's Init state. Filesystem checks
// cover existence and readability of the source only.
bool ValidateRunConfiguration(const RunConfiguration& config, std::string& error);

} // namespace binpost::config
