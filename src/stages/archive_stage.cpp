#include "stages/archive_stage.hpp"

#include "stages/stage_support.hpp"

#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace binpost::stages {

namespace {

// Counts regular files below `folder`. Iteration errors count as empty.
std::size_t CountFiles(const fs::path& folder) {
  std::size_t count = 0;
  std::error_code ec;
  fs::recursive_directory_iterator it(folder, ec);
  if (ec) {
    return 0;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code type_ec;
    if (it->is_regular_file(type_ec)) {
      ++count;
    }
  }
  return count;
}

} // namespace

fs::path ArchivePathFor(const fs::path& source_folder) {
  return source_folder.parent_path() / (source_folder.filename().string() + ".rar");
}

StageResult ArchiveStage::Run(const std::vector<fs::path>& inputs,
                              const ArchiveStageConfig& config, bool dry_run) {
  const StageClock clock;
  StageResult result;
  result.stage = StageId::kArchive;
  result.status = StageStatus::kFailed;

  if (inputs.size() != 1U) {
    result.diagnostic = "archive stage expects exactly one input path";
    return clock.Finish(result);
  }
  const fs::path& source = inputs.front();

  std::error_code ec;
  if (fs::is_regular_file(source, ec)) {
    result.status = StageStatus::kSkipped;
    result.outputs = {source};
    result.diagnostic = "single-file input passed through";
    return clock.Finish(result);
  }
  if (!fs::is_directory(source, ec)) {
    result.diagnostic = "source is neither a file nor a folder: " + source.string();
    return clock.Finish(result);
  }

  const fs::path destination = ArchivePathFor(source);
  if (config.skip) {
    if (!fs::is_regular_file(destination, ec)) {
      result.diagnostic = "archive stage skipped but no archive exists at " + destination.string();
      return clock.Finish(result);
    }
    result.status = StageStatus::kSkipped;
    result.outputs = {destination};
    result.diagnostic = "using existing archive";
    return clock.Finish(result);
  }

  if (CountFiles(source) == 0U) {
    result.diagnostic = "source folder contains no files: " + source.string();
    return clock.Finish(result);
  }

  std::string error;
  if (!PrepareTargets({destination}, config.force_overwrite, dry_run, error)) {
    result.diagnostic = error;
    result.output_conflict = true;
    return clock.Finish(result);
  }

  if (dry_run) {
    result.status = StageStatus::kSucceeded;
    result.outputs = {destination};
    result.simulated = true;
    return clock.Finish(result);
  }

  tools::ToolRun run;
  tools::ArchiveOptions options;
  options.store_only = true;
  const bool launched = tool_.CreateArchive(source, destination, options, run, error);
  result.created = NewFilesSince({}, {destination});
  if (!launched) {
    result.diagnostic = error;
    return clock.Finish(result);
  }
  if (run.exit_code != 0) {
    result.diagnostic = DescribeToolFailure(tool_.Name(), run);
    return clock.Finish(result);
  }
  if (!fs::is_regular_file(destination, ec)) {
    result.diagnostic = tool_.Name() + " reported success but did not create " +
                        destination.string();
    return clock.Finish(result);
  }

  result.status = StageStatus::kSucceeded;
  result.outputs = {destination};
  return clock.Finish(result);
}

} // namespace binpost::stages
