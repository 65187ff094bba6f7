#pragma once

#include "tools/archive_tool.hpp"

namespace binpost::tools {

// Store-only RAR archives through the `rar` command line tool.
class RarArchiveTool final : public IArchiveTool {
public:
  explicit RarArchiveTool(std::string executable = "rar");

  std::string Name() const override { return executable_; }
  bool Available() const override;
  bool CreateArchive(const std::filesystem::path& source, const std::filesystem::path& destination,
                     const ArchiveOptions& options, ToolRun& run, std::string& error) override;

  // Command line without running it. Exposed for logs and tests.
  std::string BuildCommand(const std::filesystem::path& source,
                           const std::filesystem::path& destination,
                           const ArchiveOptions& options) const;

private:
  std::string executable_;
};

} // namespace binpost::tools
