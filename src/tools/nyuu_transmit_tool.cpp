#include "tools/nyuu_transmit_tool.hpp"

#include "core/process/shell_command.hpp"

#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace binpost::tools {

NyuuTransmitTool::NyuuTransmitTool(std::string executable) : executable_(std::move(executable)) {}

bool NyuuTransmitTool::Available() const {
  return core::process::IsCommandAvailable(executable_);
}

std::string NyuuTransmitTool::BuildCommand(const TransmitRequest& request,
                                           bool redact_password) const {
  const config::TransmitCredentials& creds = request.credentials;
  std::vector<std::string> argv = {
      executable_,
      "-h",
      creds.host,
      "-P",
      std::to_string(creds.port),
  };
  if (creds.ssl) {
    argv.push_back("-S");
  }
  argv.insert(argv.end(), {
                              "-u",
                              creds.user,
                              "-p",
                              redact_password ? std::string("***") : creds.password,
                              "-n",
                              std::to_string(creds.connections),
                              "-a",
                              request.article_size.empty() ? creds.article_size
                                                           : request.article_size,
                              "-g",
                              request.group,
                              "-s",
                              request.subject,
                              "-o",
                              request.manifest_path.string(),
                          });
  if (request.overwrite_manifest) {
    argv.push_back("-O");
  }
  for (const auto& file : request.files) {
    argv.push_back(file.string());
  }
  return core::process::JoinShellCommand(argv);
}

bool NyuuTransmitTool::Transmit(const TransmitRequest& request, TransmitReceipt& receipt,
                                std::string& error) {
  receipt = TransmitReceipt{};
  error.clear();
  if (request.files.empty()) {
    error = "no files to transmit";
    return false;
  }
  if (request.manifest_path.empty()) {
    error = "manifest path cannot be empty";
    return false;
  }

  core::process::CommandResult result;
  std::string launch_error;
  if (!core::process::RunShellCommand(BuildCommand(request, false), request.on_output, result,
                                      launch_error)) {
    // The launch error echoes the command line, which carries the password.
    error = "failed to execute " + executable_;
    return false;
  }

  receipt.run = MakeToolRun(BuildCommand(request, true), result);
  receipt.manifest_path = request.manifest_path;
  std::error_code ec;
  receipt.accepted = receipt.run.exit_code == 0 && fs::is_regular_file(request.manifest_path, ec);
  return true;
}

} // namespace binpost::tools
