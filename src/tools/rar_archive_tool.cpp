#include "tools/rar_archive_tool.hpp"

#include "core/process/shell_command.hpp"

#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace binpost::tools {

RarArchiveTool::RarArchiveTool(std::string executable) : executable_(std::move(executable)) {}

bool RarArchiveTool::Available() const {
  return core::process::IsCommandAvailable(executable_);
}

std::string RarArchiveTool::BuildCommand(const fs::path& source, const fs::path& destination,
                                         const ArchiveOptions& options) const {
  // Run from the parent so the archive stores `<name>/...` relative paths
  // instead of the operator's absolute directory layout.
  std::vector<std::string> argv = {executable_, "a", "-r", "-y"};
  if (options.store_only) {
    argv.push_back("-m0");
  }
  argv.push_back(destination.string());
  argv.push_back(source.filename().string());

  fs::path parent = source.parent_path();
  if (parent.empty()) {
    parent = ".";
  }
  return "cd " + core::process::ShellQuote(parent.string()) + " && " +
         core::process::JoinShellCommand(argv);
}

bool RarArchiveTool::CreateArchive(const fs::path& source, const fs::path& destination,
                                   const ArchiveOptions& options, ToolRun& run,
                                   std::string& error) {
  run = ToolRun{};
  error.clear();
  if (source.empty() || destination.empty()) {
    error = "archive source and destination cannot be empty";
    return false;
  }

  const std::string command = BuildCommand(source, destination, options);
  core::process::CommandResult result;
  if (!core::process::RunShellCommand(command, nullptr, result, error)) {
    return false;
  }
  run = MakeToolRun(command, result);
  return true;
}

} // namespace binpost::tools
