#pragma once

#include "tools/parity_tool.hpp"

namespace binpost::tools {

// Multi-threaded PAR2 generation through `parpar`. Default backend.
class ParparParityTool final : public IParityTool {
public:
  explicit ParparParityTool(std::string executable = "parpar");

  config::ParityBackend Backend() const override { return config::ParityBackend::kParpar; }
  std::string Name() const override { return executable_; }
  bool Available() const override;
  bool GenerateParity(const std::filesystem::path& input, const ParityRequest& request,
                      std::vector<std::filesystem::path>& parity_files, ToolRun& run,
                      std::string& error) override;

  std::string BuildCommand(const std::filesystem::path& input, const ParityRequest& request) const;

private:
  std::string executable_;
};

} // namespace binpost::tools
