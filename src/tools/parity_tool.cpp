#include "tools/parity_tool.hpp"

#include "core/process/shell_command.hpp"
#include "tools/par2_parity_tool.hpp"
#include "tools/parpar_parity_tool.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace binpost::tools {

namespace {

bool IsRecoveryVolumeOf(const std::string& file_name, const std::string& stem) {
  const std::string prefix = stem + ".vol";
  const std::string suffix = ".par2";
  if (file_name.size() <= prefix.size() + suffix.size()) {
    return false;
  }
  return file_name.compare(0, prefix.size(), prefix) == 0 &&
         file_name.compare(file_name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

fs::path ParityIndexPathFor(const fs::path& input) {
  fs::path index = input;
  index.replace_extension(".par2");
  return index;
}

std::vector<fs::path> FindParitySet(const fs::path& index_path) {
  std::vector<fs::path> parity_set;
  const fs::path directory = index_path.has_parent_path() ? index_path.parent_path() : ".";
  const std::string stem = index_path.stem().string();

  std::error_code ec;
  if (fs::is_regular_file(index_path, ec)) {
    parity_set.push_back(index_path);
  }

  std::vector<fs::path> volumes;
  ec.clear();
  fs::directory_iterator it(directory, ec);
  if (ec) {
    return parity_set;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) {
      continue;
    }
    if (IsRecoveryVolumeOf(it->path().filename().string(), stem)) {
      volumes.push_back(it->path());
    }
  }
  std::sort(volumes.begin(), volumes.end());
  parity_set.insert(parity_set.end(), volumes.begin(), volumes.end());
  return parity_set;
}

std::uint64_t SliceSizeForPostSize(std::uint64_t post_size_bytes) {
  const std::uint64_t aligned = post_size_bytes - (post_size_bytes % 4U);
  return aligned < 4U ? 4U : aligned;
}

std::unique_ptr<IParityTool> MakeParityTool(config::ParityBackend backend) {
  switch (backend) {
  case config::ParityBackend::kPar2:
    return std::make_unique<Par2ParityTool>();
  case config::ParityBackend::kParpar:
    break;
  }
  return std::make_unique<ParparParityTool>();
}

namespace detail {

bool RunParityCommand(const std::string& command, const ParityRequest& request,
                      std::vector<fs::path>& parity_files, ToolRun& run, std::string& error) {
  parity_files.clear();
  run = ToolRun{};
  error.clear();

  core::process::CommandResult result;
  if (!core::process::RunShellCommand(command, nullptr, result, error)) {
    return false;
  }
  run = MakeToolRun(command, result);
  if (run.exit_code == 0) {
    parity_files = FindParitySet(request.index_path);
  }
  return true;
}

} // namespace detail

} // namespace binpost::tools
