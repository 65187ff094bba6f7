#include "config/run_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <system_error>

namespace fs = std::filesystem;

namespace binpost::config {

namespace {

std::string ToLower(std::string_view raw) {
  std::string lowered(raw);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

bool IsSourceReadable(const fs::path& source, std::string& error) {
  std::error_code ec;
  if (fs::is_directory(source, ec) && !ec) {
    fs::directory_iterator it(source, ec);
    if (ec) {
      error = "source folder is not readable: " + source.string() + " (" + ec.message() + ")";
      return false;
    }
    return true;
  }

  if (!fs::is_regular_file(source, ec) || ec) {
    error = "source must be a folder or a regular file: " + source.string();
    return false;
  }

  std::ifstream probe(source, std::ios::binary);
  if (!probe) {
    error = "source file is not readable: " + source.string();
    return false;
  }
  return true;
}

} // namespace

const char* ToString(ParityBackend backend) {
  switch (backend) {
  case ParityBackend::kParpar:
    return "parpar";
  case ParityBackend::kPar2:
    return "par2";
  }
  return "parpar";
}

const char* ToString(ConflictPolicy policy) {
  switch (policy) {
  case ConflictPolicy::kRename:
    return "rename";
  case ConflictPolicy::kOverwrite:
    return "overwrite";
  case ConflictPolicy::kFail:
    return "fail";
  }
  return "rename";
}

bool ParseParityBackend(std::string_view raw, ParityBackend& backend, std::string& error) {
  const std::string normalized = ToLower(raw);
  if (normalized == "parpar") {
    backend = ParityBackend::kParpar;
    return true;
  }
  if (normalized == "par2") {
    backend = ParityBackend::kPar2;
    return true;
  }
  error = "invalid parity backend '" + std::string(raw) + "' (expected parpar|par2)";
  return false;
}

bool ParseConflictPolicy(std::string_view raw, ConflictPolicy& policy, std::string& error) {
  const std::string normalized = ToLower(raw);
  if (normalized == "rename") {
    policy = ConflictPolicy::kRename;
    return true;
  }
  if (normalized == "overwrite") {
    policy = ConflictPolicy::kOverwrite;
    return true;
  }
  if (normalized == "fail") {
    policy = ConflictPolicy::kFail;
    return true;
  }
  error = "invalid conflict policy '" + std::string(raw) + "' (expected rename|overwrite|fail)";
  return false;
}

bool ParseSizeString(std::string_view raw, std::uint64_t& bytes, std::string& error) {
  if (raw.empty()) {
    error = "size value cannot be empty";
    return false;
  }

  std::uint64_t value = 0;
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr == begin) {
    error = "invalid size '" + std::string(raw) + "' (expected e.g. 700K, 20M, 1G)";
    return false;
  }

  std::string suffix = ToLower(std::string_view(ptr, static_cast<std::size_t>(end - ptr)));
  if (suffix.size() >= 3U && suffix.compare(suffix.size() - 2U, 2U, "ib") == 0) {
    suffix.erase(suffix.size() - 2U);
  } else if (suffix.size() >= 2U && suffix.back() == 'b') {
    suffix.pop_back();
  } else if (suffix == "b") {
    suffix.clear();
  }

  std::uint64_t multiplier = 1;
  if (suffix.empty()) {
    multiplier = 1;
  } else if (suffix == "k") {
    multiplier = 1024ULL;
  } else if (suffix == "m") {
    multiplier = 1024ULL * 1024ULL;
  } else if (suffix == "g") {
    multiplier = 1024ULL * 1024ULL * 1024ULL;
  } else {
    error = "invalid size suffix in '" + std::string(raw) + "' (expected K, M or G)";
    return false;
  }

  if (value == 0U) {
    error = "size must be greater than zero: " + std::string(raw);
    return false;
  }
  if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
    error = "size is out of range: " + std::string(raw);
    return false;
  }

  bytes = value * multiplier;
  return true;
}

fs::path NormalizeSourcePath(const fs::path& source_path) {
  if (source_path.empty()) {
    return source_path;
  }

  std::error_code ec;
  fs::path normalized = fs::absolute(source_path, ec);
  if (ec) {
    normalized = source_path;
  }
  normalized = normalized.lexically_normal();
  if (normalized.filename().empty() && normalized.has_parent_path() &&
      normalized != normalized.root_path()) {
    normalized = normalized.parent_path();
  }
  return normalized;
}

std::string SourceIdentifier(const fs::path& source_path) {
  const fs::path normalized = NormalizeSourcePath(source_path);
  std::error_code ec;
  if (fs::is_regular_file(normalized, ec) && !ec) {
    return normalized.stem().string();
  }
  return normalized.filename().string();
}

std::string EffectiveSubject(const RunConfiguration& config) {
  if (!config.subject.empty()) {
    return config.subject;
  }
  return SourceIdentifier(config.source_path);
}

std::string EffectiveGroup(const RunConfiguration& config) {
  if (!config.group.empty()) {
    return config.group;
  }
  return config.credentials.group;
}

bool ValidateRunConfiguration(const RunConfiguration& config, std::string& error) {
  if (config.source_path.empty()) {
    error = "source path cannot be empty";
    return false;
  }

  std::error_code ec;
  if (!fs::exists(config.source_path, ec) || ec) {
    error = "source path does not exist: " + config.source_path.string();
    return false;
  }
  if (!IsSourceReadable(config.source_path, error)) {
    return false;
  }
  if (SourceIdentifier(config.source_path).empty()) {
    error = "cannot derive a name from source path: " + config.source_path.string();
    return false;
  }

  if (config.redundancy_percent < 1 || config.redundancy_percent > 100) {
    error = "redundancy must be between 1 and 100 percent (got " +
            std::to_string(config.redundancy_percent) + ")";
    return false;
  }
  if (config.post_size_bytes == 0U) {
    error = "post size must be greater than zero";
    return false;
  }
  if (config.manifest_path_template.empty()) {
    error = "manifest path template cannot be empty";
    return false;
  }

  if (config.skip_transmit) {
    return true;
  }

  const TransmitCredentials& creds = config.credentials;
  if (creds.host.empty() || creds.user.empty() || creds.password.empty()) {
    error = "transmit credentials are incomplete (NNTP_HOST, NNTP_USER and NNTP_PASS are required)";
    return false;
  }
  if (creds.port == 0U) {
    error = "transmit port must be greater than zero";
    return false;
  }
  if (creds.connections == 0U) {
    error = "transmit connection count must be greater than zero";
    return false;
  }
  if (EffectiveGroup(config).empty()) {
    error = "no destination group configured (use --group or USENET_GROUP)";
    return false;
  }
  return true;
}

} // namespace binpost::config
