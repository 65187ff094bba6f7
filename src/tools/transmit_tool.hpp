#pragma once

#include "config/run_config.hpp"
#include "core/process/shell_command.hpp"
#include "tools/tool_run.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace binpost::tools {

struct TransmitRequest {
  std::vector<std::filesystem::path> files;
  std::string group;
  std::string subject;
  std::string article_size;
  config::TransmitCredentials credentials;
  std::filesystem::path manifest_path;
  // Whether the tool may replace an existing manifest.
  bool overwrite_manifest = false;
  // Raw tool output, one line at a time. Progress only; never control flow.
  core::process::LineCallback on_output;
};

struct TransmitReceipt {
  std::filesystem::path manifest_path;
  // True when the tool reported every article accepted and wrote the manifest.
  bool accepted = false;
  ToolRun run;
};

// Network transmission capability used by the transmit stage.
class ITransmitTool {
public:
  virtual ~ITransmitTool() = default;

  virtual std::string Name() const = 0;
  virtual bool Available() const = 0;

  // Posts `request.files` and writes the manifest. Returns false only when the
  // tool could not be launched.
  virtual bool Transmit(const TransmitRequest& request, TransmitReceipt& receipt,
                        std::string& error) = 0;
};

} // namespace binpost::tools
