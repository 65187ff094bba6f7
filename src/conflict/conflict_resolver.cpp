#include "conflict/conflict_resolver.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace binpost::conflict {

namespace {

constexpr std::string_view kNamePlaceholder = "{name}";

} // namespace

const char* ToString(ConflictAction action) {
  switch (action) {
  case ConflictAction::kProceed:
    return "proceed";
  case ConflictAction::kProceedRenamed:
    return "proceed_renamed";
  case ConflictAction::kAbort:
    return "abort";
  }
  return "proceed";
}

FileProbe DefaultFileProbe() {
  return [](const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
  };
}

std::string ExpandManifestTemplate(std::string_view path_template,
                                   std::string_view source_identifier) {
  std::string expanded(path_template);
  std::size_t pos = 0;
  while ((pos = expanded.find(kNamePlaceholder, pos)) != std::string::npos) {
    expanded.replace(pos, kNamePlaceholder.size(), source_identifier);
    pos += source_identifier.size();
  }
  return expanded;
}

fs::path RenamedCandidate(const fs::path& base_path, std::size_t index) {
  const fs::path stem = base_path.stem();
  const fs::path extension = base_path.extension();
  fs::path renamed = stem;
  renamed += "_" + std::to_string(index);
  renamed += extension;
  return base_path.parent_path() / renamed;
}

ConflictDecision Resolve(std::string_view manifest_path_template,
                         std::string_view source_identifier, config::ConflictPolicy policy,
                         const FileProbe& probe, const fs::path& base_dir) {
  ConflictDecision decision;

  const std::string expanded = ExpandManifestTemplate(manifest_path_template, source_identifier);
  if (expanded.empty()) {
    decision.action = ConflictAction::kAbort;
    decision.diagnostic = "manifest path template expands to an empty path";
    return decision;
  }

  fs::path target(expanded);
  if (target.is_relative() && !base_dir.empty()) {
    target = base_dir / target;
  }
  target = target.lexically_normal();
  decision.resolved_path = target;

  if (target.filename().empty()) {
    decision.action = ConflictAction::kAbort;
    decision.diagnostic = "manifest path does not name a file: " + target.string();
    return decision;
  }

  const FileProbe& exists = probe ? probe : DefaultFileProbe();
  if (!exists(target)) {
    decision.action = ConflictAction::kProceed;
    return decision;
  }

  switch (policy) {
  case config::ConflictPolicy::kOverwrite:
    decision.action = ConflictAction::kProceed;
    return decision;
  case config::ConflictPolicy::kFail:
    decision.action = ConflictAction::kAbort;
    decision.diagnostic = "manifest already exists: " + target.string() +
                          " (conflict policy is 'fail')";
    return decision;
  case config::ConflictPolicy::kRename:
    break;
  }

  for (std::size_t index = 1; index <= kMaxRenameAttempts; ++index) {
    fs::path candidate = RenamedCandidate(target, index);
    if (!exists(candidate)) {
      decision.resolved_path = std::move(candidate);
      decision.action = ConflictAction::kProceedRenamed;
      return decision;
    }
  }

  decision.action = ConflictAction::kAbort;
  decision.diagnostic = "no free manifest name after " + std::to_string(kMaxRenameAttempts) +
                        " attempts starting from " + target.string();
  return decision;
}

} // namespace binpost::conflict
