#pragma once

#include "config/run_config.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace binpost::conflict {

enum class ConflictAction {
  kProceed,
  kProceedRenamed,
  kAbort,
};

const char* ToString(ConflictAction action);

// Outcome of the manifest pre-flight check. `resolved_path` is always the
// expanded template path, or the first free renamed candidate; on abort it
// names the path that was found occupied.
struct ConflictDecision {
  std::filesystem::path resolved_path;
  ConflictAction action = ConflictAction::kProceed;
  std::string diagnostic;
};

// Existence probe injected by callers; tests substitute an in-memory set.
using FileProbe = std::function<bool(const std::filesystem::path&)>;

// Filesystem-backed probe. Errors count as "absent".
FileProbe DefaultFileProbe();

// Upper bound on `_N` candidates tried by the rename policy.
inline constexpr std::size_t kMaxRenameAttempts = 10000;

// Replaces every `{name}` in `path_template` with `source_identifier`.
std::string ExpandManifestTemplate(std::string_view path_template,
                                   std::string_view source_identifier);

// `photos.nzb` + 3 → `photos_3.nzb`; `archive.tar.nzb` + 1 →
// `archive.tar_1.nzb` (only the last extension is preserved).
std::filesystem::path RenamedCandidate(const std::filesystem::path& base_path, std::size_t index);

// Decides what to do with the manifest path before any expensive stage runs.
//
// - The template is expanded against `source_identifier`. Relative results are
//   resolved against `base_dir` when it is non-empty.
// - Free path: proceed.
// - Occupied path: overwrite → proceed; rename → first free `_N` candidate
//   (N from 1); fail → abort.
//
// Only probes; never creates, truncates or locks anything, so calling it twice
// without touching the filesystem yields the same decision.
ConflictDecision Resolve(std::string_view manifest_path_template,
                         std::string_view source_identifier, config::ConflictPolicy policy,
                         const FileProbe& probe, const std::filesystem::path& base_dir = {});

} // namespace binpost::conflict
