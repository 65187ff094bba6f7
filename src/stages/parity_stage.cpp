#include "stages/parity_stage.hpp"

#include "stages/stage_support.hpp"

#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace binpost::stages {

StageResult ParityStage::Run(const std::vector<fs::path>& inputs, const ParityStageConfig& config,
                             bool dry_run) {
  const StageClock clock;
  StageResult result;
  result.stage = StageId::kParity;
  result.status = StageStatus::kFailed;

  if (inputs.size() != 1U) {
    result.diagnostic = "parity stage expects exactly one input file";
    return clock.Finish(result);
  }
  const fs::path& input = inputs.front();
  const fs::path index_path = tools::ParityIndexPathFor(input);

  const bool input_is_index = input.lexically_normal() == index_path.lexically_normal();

  if (config.skip) {
    result.status = StageStatus::kSkipped;
    for (const auto& path : tools::FindParitySet(index_path)) {
      if (path.lexically_normal() != input.lexically_normal()) {
        result.outputs.push_back(path);
      }
    }
    return clock.Finish(result);
  }

  // A .par2 input would be its own index file and get replaced or removed.
  if (input_is_index) {
    result.diagnostic = "parity index would replace the parity input: " + input.string();
    result.output_conflict = true;
    return clock.Finish(result);
  }

  // In dry-run the archive is only predicted; check what is actually there.
  std::error_code ec;
  const bool input_present = fs::is_regular_file(input, ec);
  if (!input_present && !dry_run) {
    result.diagnostic = "parity input does not exist: " + input.string();
    return clock.Finish(result);
  }
  if (input_present && fs::file_size(input, ec) == 0U && !ec) {
    result.diagnostic = "parity input is empty: " + input.string();
    return clock.Finish(result);
  }

  std::string error;
  if (!PrepareTargets(tools::FindParitySet(index_path), config.force_overwrite, dry_run, error)) {
    result.diagnostic = error;
    result.output_conflict = true;
    return clock.Finish(result);
  }

  if (dry_run) {
    result.status = StageStatus::kSucceeded;
    result.outputs = {index_path};
    result.simulated = true;
    return clock.Finish(result);
  }

  tools::ParityRequest request;
  request.redundancy_percent = config.redundancy_percent;
  request.slice_size_bytes = config.post_size_bytes;
  request.index_path = index_path;

  std::vector<fs::path> parity_files;
  tools::ToolRun run;
  const bool launched = tool_.GenerateParity(input, request, parity_files, run, error);
  // Any parity file present now was created by this run; prior ones were
  // either absent or removed above.
  result.created = NewFilesSince({}, tools::FindParitySet(index_path));
  if (!launched) {
    result.diagnostic = error;
    return clock.Finish(result);
  }
  if (run.exit_code != 0) {
    result.diagnostic = DescribeToolFailure(tool_.Name(), run);
    return clock.Finish(result);
  }
  if (parity_files.empty()) {
    result.diagnostic = tool_.Name() + " produced no parity files for " + input.string();
    return clock.Finish(result);
  }

  result.status = StageStatus::kSucceeded;
  result.outputs = parity_files;
  return clock.Finish(result);
}

} // namespace binpost::stages
