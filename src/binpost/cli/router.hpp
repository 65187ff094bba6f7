#pragma once

#include "config/run_config.hpp"
#include "core/logging/logger.hpp"
#include "pipeline/pipeline_controller.hpp"
#include "pipeline/run_outcome.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace binpost::cli {

// Parsed `binpost run` invocation. Credentials are filled in later from the
// credential file, just before the pipeline is built.
struct RunOptions {
  config::RunConfiguration config;
  std::optional<std::filesystem::path> report_path;
  // `--debug` is `--log-level debug`, which also echoes raw transmit output.
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error);

// Loads the credential file named by the options (or `.env`) into
// `options.config.credentials`. Skipped when nothing will be transmitted and
// no file was named explicitly.
bool LoadCredentials(RunOptions& options, std::string& error);

// Maps a RunOutcome onto the process exit-code contract.
int ExitCodeFor(const pipeline::RunOutcome& outcome);

// Runs one pipeline through the same path as `binpost run`, with the caller's
// tools. Prints the summary to stdout and writes `--report` when requested.
// `outcome_out` may be null.
int ExecuteRun(const RunOptions& options, pipeline::PipelineTools tools,
               pipeline::RunOutcome* outcome_out);

// Routes `binpost` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success (including partial runs with skipped stages)
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => invalid configuration or credentials
//   20 => manifest conflict under the "fail" policy
//   31/32/33 => archive/parity/transmit stage failed
//   40 => interrupted by SIGINT/SIGTERM
int Dispatch(int argc, char** argv);

} // namespace binpost::cli
