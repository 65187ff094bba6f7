#pragma once

#include "config/run_config.hpp"
#include "core/process/shell_command.hpp"
#include "stages/stage_result.hpp"
#include "tools/transmit_tool.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace binpost::stages {

struct TransmitStageConfig {
  config::TransmitCredentials credentials;
  std::string group;
  std::string subject;
  std::string article_size;
  // Resolved by the conflict check before any stage ran.
  std::filesystem::path manifest_path;
  // Conflict policy "overwrite": the tool may replace an existing manifest.
  bool overwrite_manifest = false;
  bool skip = false;
  bool force_overwrite = false;
  core::process::LineCallback on_output;
};

// Wraps the transmit tool. Inputs are the ordered archive and parity files;
// the single output is the manifest.
class TransmitStage {
public:
  explicit TransmitStage(tools::ITransmitTool& tool) : tool_(tool) {}

  StageResult Run(const std::vector<std::filesystem::path>& inputs,
                  const TransmitStageConfig& config, bool dry_run);

private:
  tools::ITransmitTool& tool_;
};

} // namespace binpost::stages
