#pragma once

#include "stages/stage_result.hpp"
#include "tools/archive_tool.hpp"

#include <filesystem>
#include <vector>

namespace binpost::stages {

struct ArchiveStageConfig {
  bool skip = false;
  bool force_overwrite = false;
};

// `<parent>/<name>.rar` for a source folder.
std::filesystem::path ArchivePathFor(const std::filesystem::path& source_folder);

// Wraps the archive tool. Input is the single source path; output is either a
// store-only archive of a folder or the untouched source file.
class ArchiveStage {
public:
  explicit ArchiveStage(tools::IArchiveTool& tool) : tool_(tool) {}

  StageResult Run(const std::vector<std::filesystem::path>& inputs,
                  const ArchiveStageConfig& config, bool dry_run);

private:
  tools::IArchiveTool& tool_;
};

} // namespace binpost::stages
