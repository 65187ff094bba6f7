#include "stages/stage_support.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace binpost::stages {

bool PrepareTargets(const std::vector<fs::path>& targets, bool force, bool dry_run,
                    std::string& error) {
  error.clear();
  for (const auto& target : targets) {
    std::error_code ec;
    if (!fs::exists(target, ec)) {
      continue;
    }
    if (!force) {
      error = "output already exists: " + target.string() + " (use --force to replace it)";
      return false;
    }
    if (dry_run) {
      continue;
    }
    fs::remove(target, ec);
    if (ec) {
      error = "failed to remove existing output " + target.string() + ": " + ec.message();
      return false;
    }
  }
  return true;
}

std::vector<fs::path> NewFilesSince(const std::vector<fs::path>& before,
                                    const std::vector<fs::path>& candidates) {
  std::vector<fs::path> created;
  for (const auto& candidate : candidates) {
    std::error_code ec;
    if (!fs::exists(candidate, ec)) {
      continue;
    }
    if (std::find(before.begin(), before.end(), candidate) != before.end()) {
      continue;
    }
    if (std::find(created.begin(), created.end(), candidate) == created.end()) {
      created.push_back(candidate);
    }
  }
  return created;
}

std::string DescribeToolFailure(const std::string& tool_name, const tools::ToolRun& run) {
  std::string message = tool_name + " exited with code " + std::to_string(run.exit_code);
  if (!run.diagnostic.empty()) {
    message += ": " + run.diagnostic;
  }
  return message;
}

} // namespace binpost::stages
