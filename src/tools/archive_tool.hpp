#pragma once

#include "tools/tool_run.hpp"

#include <filesystem>
#include <string>

namespace binpost::tools {

struct ArchiveOptions {
  // Store entries without compression. The pipeline always asks for this;
  // payloads are usually already-compressed media.
  bool store_only = true;
};

// Archive capability used by the archive stage.
class IArchiveTool {
public:
  virtual ~IArchiveTool() = default;

  // Executable name for logs and dependency checks.
  virtual std::string Name() const = 0;

  virtual bool Available() const = 0;

  // Archives `source` (folder or file) into `destination`. Returns false only
  // when the tool could not be launched; the tool's own exit status is
  // reported through `run`.
  virtual bool CreateArchive(const std::filesystem::path& source,
                             const std::filesystem::path& destination,
                             const ArchiveOptions& options, ToolRun& run, std::string& error) = 0;
};

} // namespace binpost::tools
