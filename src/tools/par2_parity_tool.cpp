#include "tools/par2_parity_tool.hpp"

#include "core/process/shell_command.hpp"

#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace binpost::tools {

Par2ParityTool::Par2ParityTool(std::string executable) : executable_(std::move(executable)) {}

bool Par2ParityTool::Available() const {
  return core::process::IsCommandAvailable(executable_);
}

std::string Par2ParityTool::BuildCommand(const fs::path& input,
                                         const ParityRequest& request) const {
  return core::process::JoinShellCommand({
      executable_,
      "create",
      "-q",
      "-r" + std::to_string(request.redundancy_percent),
      "-s" + std::to_string(SliceSizeForPostSize(request.slice_size_bytes)),
      request.index_path.string(),
      input.string(),
  });
}

bool Par2ParityTool::GenerateParity(const fs::path& input, const ParityRequest& request,
                                    std::vector<fs::path>& parity_files, ToolRun& run,
                                    std::string& error) {
  if (request.index_path.empty()) {
    error = "parity index path cannot be empty";
    return false;
  }
  return detail::RunParityCommand(BuildCommand(input, request), request, parity_files, run, error);
}

} // namespace binpost::tools
