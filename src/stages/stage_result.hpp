#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace binpost::stages {

enum class StageId {
  kArchive,
  kParity,
  kTransmit,
};

enum class StageStatus {
  kSucceeded,
  kSkipped,
  kFailed,
};

const char* ToString(StageId stage);
const char* ToString(StageStatus status);

// Outcome of one stage runner invocation. Built by the runner, then treated as
// a value by the controller; nothing mutates it after it is appended to the
// run's result list.
struct StageResult {
  StageId stage = StageId::kArchive;
  StageStatus status = StageStatus::kFailed;
  // Paths handed to the next stage, in order. For skipped stages this is the
  // pass-through set, for simulated ones the predicted set.
  std::vector<std::filesystem::path> outputs;
  // Files that did not exist before this invocation and do now, including
  // partial leftovers of a failing tool. The controller owns their cleanup.
  std::vector<std::filesystem::path> created;
  std::chrono::milliseconds elapsed{0};
  // Combined size of `outputs` on disk when the stage returned.
  std::uintmax_t output_bytes = 0;
  std::optional<std::string> diagnostic;
  // Dry-run result: no process ran and nothing touched the disk.
  bool simulated = false;
  // Failed because a target output already existed and force was off.
  bool output_conflict = false;
};

} // namespace binpost::stages
