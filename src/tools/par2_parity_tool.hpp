#pragma once

#include "tools/parity_tool.hpp"

namespace binpost::tools {

// Reference par2cmdline backend.
class Par2ParityTool final : public IParityTool {
public:
  explicit Par2ParityTool(std::string executable = "par2");

  config::ParityBackend Backend() const override { return config::ParityBackend::kPar2; }
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
