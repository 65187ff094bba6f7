#pragma once

#include "stages/stage_result.hpp"
#include "tools/parity_tool.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace binpost::stages {

struct ParityStageConfig {
  int redundancy_percent = 15;
  std::uint64_t post_size_bytes = 0;
  bool skip = false;
  bool force_overwrite = false;
};

// Wraps the parity tool selected at configuration time. Input is the archive
// (or pass-through file); outputs are the parity files only, the controller
// carries the input forward itself.
class ParityStage {
public:
  explicit ParityStage(tools::IParityTool& tool) : tool_(tool) {}

  StageResult Run(const std::vector<std::filesystem::path>& inputs,
                  const ParityStageConfig& config, bool dry_run);

private:
  tools::IParityTool& tool_;
};

} // namespace binpost::stages
