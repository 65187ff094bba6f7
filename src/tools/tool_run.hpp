#pragma once

#include "core/process/shell_command.hpp"

#include <string>
#include <utility>

namespace binpost::tools {

// Normalized result of one external tool invocation. `diagnostic` carries the
// last few output lines so a failing StageResult can explain itself without
// the operator re-running the tool by hand.
struct ToolRun {
  int exit_code = -1;
  std::string command;
  std::string diagnostic;
};

inline ToolRun MakeToolRun(std::string command, const core::process::CommandResult& result) {
  ToolRun run;
  run.command = std::move(command);
  run.exit_code = result.exit_code;
  if (result.exit_code != 0) {
    run.diagnostic = core::process::SummarizeOutputTail(result.output_tail);
  }
  return run;
}

} // namespace binpost::tools
