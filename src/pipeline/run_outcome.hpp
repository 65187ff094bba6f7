#pragma once

#include "stages/stage_result.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace binpost::pipeline {

enum class RunStatus {
  kSuccess,
  // Completed, but at least one stage was skipped.
  kPartial,
  kFailure,
};

// Which error class ended a failed run. kNone for success and partial.
enum class ErrorKind {
  kNone,
  kValidation,
  kConflict,
  kStage,
  kInterrupted,
};

const char* ToString(RunStatus status);
const char* ToString(ErrorKind kind);

struct RunOutcome {
  RunStatus status = RunStatus::kFailure;
  ErrorKind error_kind = ErrorKind::kNone;
  // Set for kStage failures.
  std::optional<stages::StageId> failed_stage;
  std::vector<stages::StageResult> stages;
  // Run-created files still on disk at return, in creation order. Empty for
  // intermediates after cleanup unless they were kept on purpose.
  std::vector<std::filesystem::path> existing_files;
  std::filesystem::path manifest_path;
  std::optional<std::filesystem::path> descriptor_path;
  std::string final_state;
  std::string diagnostic;
  bool dry_run = false;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
};

// Stable machine-readable form used by `--report`.
std::string ToJson(const stages::StageResult& result);
std::string ToJson(const RunOutcome& outcome);

} // namespace binpost::pipeline
