#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace binpost::core::process {

// Receives each line of merged stdout/stderr while the child runs. Carriage
// returns also terminate a line so progress bars that redraw in place still
// produce one callback per redraw.
using LineCallback = std::function<void(std::string_view line)>;

struct CommandResult {
  // Child exit status. Signal terminations map to 128 + signal number, the
  // same convention shells use.
  int exit_code = -1;
  // Last lines of output, kept for diagnostics when the command fails.
  std::vector<std::string> output_tail;
};

// Number of trailing output lines retained in `CommandResult::output_tail`.
inline constexpr std::size_t kOutputTailLines = 20;

// Runs `command` through `/bin/sh -c` with stderr merged into stdout and blocks
// until it exits.
//
// Returns false only when the command could not be started at all; a non-zero
// exit code is reported through `result.exit_code` with a true return.
bool RunShellCommand(const std::string& command, const LineCallback& on_line,
                     CommandResult& result, std::string& error);

// Single-quotes one argument for POSIX shells.
std::string ShellQuote(std::string_view argument);

// Quotes and joins an argument vector into one shell command line.
std::string JoinShellCommand(const std::vector<std::string>& argv);

// True when `command_name` resolves on PATH.
bool IsCommandAvailable(const std::string& command_name);

// Joins the tail lines into one diagnostic string ("a | b | c").
std::string SummarizeOutputTail(const std::vector<std::string>& tail, std::size_t max_lines = 3);

} // namespace binpost::core::process
