#include "stages/transmit_stage.hpp"

#include "stages/stage_support.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace binpost::stages {

StageResult TransmitStage::Run(const std::vector<fs::path>& inputs,
                               const TransmitStageConfig& config, bool dry_run) {
  const StageClock clock;
  StageResult result;
  result.stage = StageId::kTransmit;
  result.status = StageStatus::kFailed;

  if (config.skip) {
    result.status = StageStatus::kSkipped;
    return clock.Finish(result);
  }
  if (inputs.empty()) {
    result.diagnostic = "no files to transmit";
    return clock.Finish(result);
  }
  if (config.manifest_path.empty()) {
    result.diagnostic = "manifest path is not resolved";
    return clock.Finish(result);
  }

  if (!dry_run) {
    for (const auto& input : inputs) {
      std::error_code ec;
      if (!fs::is_regular_file(input, ec)) {
        result.diagnostic = "transmit input does not exist: " + input.string();
        return clock.Finish(result);
      }
    }
  }

  // The conflict policy already decided on the manifest path; "overwrite"
  // lets the tool replace it in place, force removes it up front.
  std::error_code ec;
  const bool manifest_exists = fs::exists(config.manifest_path, ec);
  if (manifest_exists && !config.overwrite_manifest) {
    std::string error;
    if (!PrepareTargets({config.manifest_path}, config.force_overwrite, dry_run, error)) {
      result.diagnostic = error;
      result.output_conflict = true;
      return clock.Finish(result);
    }
  }

  if (dry_run) {
    result.status = StageStatus::kSucceeded;
    result.outputs = {config.manifest_path};
    result.simulated = true;
    return clock.Finish(result);
  }

  std::vector<fs::path> before;
  if (fs::exists(config.manifest_path, ec)) {
    before.push_back(config.manifest_path);
  }

  tools::TransmitRequest request;
  request.files = inputs;
  request.group = config.group;
  request.subject = config.subject;
  request.article_size = config.article_size;
  request.credentials = config.credentials;
  request.manifest_path = config.manifest_path;
  request.overwrite_manifest = config.overwrite_manifest || config.force_overwrite;
  request.on_output = config.on_output;

  tools::TransmitReceipt receipt;
  std::string error;
  const bool launched = tool_.Transmit(request, receipt, error);
  result.created = NewFilesSince(before, {config.manifest_path});
  if (!launched) {
    result.diagnostic = error;
    return clock.Finish(result);
  }
  if (receipt.run.exit_code != 0) {
    result.diagnostic = DescribeToolFailure(tool_.Name(), receipt.run);
    return clock.Finish(result);
  }
  if (!receipt.accepted) {
    result.diagnostic = tool_.Name() + " did not confirm every article or did not write " +
                        config.manifest_path.string();
    return clock.Finish(result);
  }

  result.status = StageStatus::kSucceeded;
  result.outputs = {receipt.manifest_path.empty() ? config.manifest_path : receipt.manifest_path};
  return clock.Finish(result);
}

} // namespace binpost::stages
