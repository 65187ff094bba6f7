#include "tools/parpar_parity_tool.hpp"

#include "core/process/shell_command.hpp"

#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace binpost::tools {

ParparParityTool::ParparParityTool(std::string executable) : executable_(std::move(executable)) {}

bool ParparParityTool::Available() const {
  return core::process::IsCommandAvailable(executable_);
}

std::string ParparParityTool::BuildCommand(const fs::path& input,
                                           const ParityRequest& request) const {
  // parpar reads a trailing "B" as a byte count rather than a slice count.
  return core::process::JoinShellCommand({
      executable_,
      "-s",
      std::to_string(SliceSizeForPostSize(request.slice_size_bytes)) + "B",
      "-r",
      std::to_string(request.redundancy_percent) + "%",
      "-o",
      request.index_path.string(),
      input.string(),
  });
}

bool ParparParityTool::GenerateParity(const fs::path& input, const ParityRequest& request,
                                      std::vector<fs::path>& parity_files, ToolRun& run,
                                      std::string& error) {
  if (request.index_path.empty()) {
    error = "parity index path cannot be empty";
    return false;
  }
  return detail::RunParityCommand(BuildCommand(input, request), request, parity_files, run, error);
}

} // namespace binpost::tools
