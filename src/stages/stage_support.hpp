#pragma once

#include "core/fs_utils.hpp"
#include "stages/stage_result.hpp"
#include "tools/tool_run.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace binpost::stages {

// Measures one runner invocation and stamps the result on every return path.
class StageClock {
public:
  StageClock() : started_(std::chrono::steady_clock::now()) {}

  StageResult Finish(StageResult result) const {
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    result.output_bytes = 0;
    for (const auto& output : result.outputs) {
      result.output_bytes += core::FileSizeOrZero(output);
    }
    return result;
  }

private:
  std::chrono::steady_clock::time_point started_;
};

// Applies the force-overwrite rule to `targets`. Without force any existing
// target is a conflict; with force existing targets are removed, except in
// dry-run where nothing is deleted.
bool PrepareTargets(const std::vector<std::filesystem::path>& targets, bool force, bool dry_run,
                    std::string& error);

// Subset of `candidates` present on disk that is not listed in `before`.
std::vector<std::filesystem::path>
NewFilesSince(const std::vector<std::filesystem::path>& before,
              const std::vector<std::filesystem::path>& candidates);

// "rar exited with code 3: <tail>"
std::string DescribeToolFailure(const std::string& tool_name, const tools::ToolRun& run);

} // namespace binpost::stages
