#include "binpost/cli/router.hpp"

#include "artifacts/run_report_writer.hpp"
#include "artifacts/run_summary_printer.hpp"
#include "config/env_file.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/process/shell_command.hpp"
#include "core/signals/interrupt.hpp"

#include <array>
#include <charconv>
#include <chrono>
#include <iostream>
#include <utility>

namespace fs = std::filesystem;

namespace binpost::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);

constexpr std::string_view kVersion = "0.1.0";

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  binpost run <folder|file> [--dry-run] [-r|--redundancy <percent>] "
         "[--backend <parpar|par2>] [--post-size <size>] [-s|--subject <text>] "
         "[-g|--group <group>] [--skip-archive] [--skip-parity] [--skip-transmit] "
         "[-f|--force] [--keep-files] [--on-conflict <rename|overwrite|fail>] "
         "[--manifest <template>] [--env-file <path>] [--banner <text>] [--no-descriptor] "
         "[--descriptor-dir <dir>] [--report <path>] "
         "[--log-level <debug|info|warn|error>] [--debug]\n"
      << "  binpost check-tools [--backend <parpar|par2>]\n"
      << "  binpost version\n"
      << "  binpost help\n";
}

bool ParseRedundancy(std::string_view raw, int& percent, std::string& error) {
  int parsed = 0;
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (raw.empty() || ec != std::errc() || ptr != end) {
    error = "invalid value for --redundancy: '" + std::string(raw) + "' (expected 1-100)";
    return false;
  }
  if (parsed < 1 || parsed > 100) {
    error = "--redundancy must be between 1 and 100 (got " + std::to_string(parsed) + ")";
    return false;
  }
  percent = parsed;
  return true;
}

// Fetches the value following an option token.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

std::string MakeRunId(std::chrono::system_clock::time_point now) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "run-" + std::to_string(millis);
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "binpost " << kVersion << '\n';
  return kExitSuccess;
}

int CommandCheckTools(const std::vector<std::string_view>& args) {
  config::ParityBackend backend = config::ParityBackend::kParpar;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view value;
    if (args[i] == "--backend") {
      if (!TakeValue(args, i, args[i], value, error) ||
          !config::ParseParityBackend(value, backend, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      continue;
    }
    std::cerr << "error: unknown option: " << args[i] << '\n';
    return kExitUsage;
  }

  const std::string parity_tool = config::ToString(backend);
  const std::array<std::string, 5> tools = {"rar", "parpar", "par2", "nyuu", "ffprobe"};
  bool required_missing = false;
  for (const auto& tool : tools) {
    const bool required = tool == "rar" || tool == "nyuu" || tool == parity_tool;
    const bool found = core::process::IsCommandAvailable(tool);
    std::cout << tool << ": " << (found ? "found" : "missing")
              << (required ? " (required)" : " (optional)") << '\n';
    if (required && !found) {
      required_missing = true;
    }
  }
  return required_missing ? kExitFailure : kExitSuccess;
}

int CommandRun(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (!LoadCredentials(options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  pipeline::PipelineTools tools = pipeline::MakeDefaultTools(options.config);
  return ExecuteRun(options, std::move(tools), nullptr);
}

} // namespace

bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  config::RunConfiguration& config = options.config;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;

    if (token == "--dry-run") {
      config.dry_run = true;
      continue;
    }
    if (token == "--skip-archive") {
      config.skip_archive = true;
      continue;
    }
    if (token == "--skip-parity") {
      config.skip_parity = true;
      continue;
    }
    if (token == "--skip-transmit") {
      config.skip_transmit = true;
      continue;
    }
    if (token == "-f" || token == "--force") {
      config.force_overwrite = true;
      continue;
    }
    if (token == "--keep-files") {
      config.keep_intermediate_files = true;
      continue;
    }
    if (token == "--no-descriptor") {
      config.descriptor.enabled = false;
      continue;
    }
    if (token == "--debug") {
      options.log_level = core::logging::LogLevel::kDebug;
      continue;
    }
    if (token == "-r" || token == "--redundancy") {
      if (!TakeValue(args, i, token, value, error) ||
          !ParseRedundancy(value, config.redundancy_percent, error)) {
        return false;
      }
      continue;
    }
    if (token == "--backend") {
      if (!TakeValue(args, i, token, value, error) ||
          !config::ParseParityBackend(value, config.parity_backend, error)) {
        return false;
      }
      continue;
    }
    if (token == "--post-size") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (!config::ParseSizeString(value, config.post_size_bytes, error)) {
        error = "invalid value for --post-size: " + error;
        return false;
      }
      config.post_size = std::string(value);
      continue;
    }
    if (token == "-s" || token == "--subject") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      config.subject = std::string(value);
      continue;
    }
    if (token == "-g" || token == "--group") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      config.group = std::string(value);
      continue;
    }
    if (token == "--on-conflict") {
      if (!TakeValue(args, i, token, value, error) ||
          !config::ParseConflictPolicy(value, config.conflict_policy, error)) {
        return false;
      }
      continue;
    }
    if (token == "--manifest") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = "--manifest template cannot be empty";
        return false;
      }
      config.manifest_path_template = std::string(value);
      continue;
    }
    if (token == "--env-file") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      config.env_file = fs::path(value);
      continue;
    }
    if (token == "--banner") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      config.descriptor.banner = std::string(value);
      continue;
    }
    if (token == "--descriptor-dir") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      config.descriptor.output_dir = fs::path(value);
      continue;
    }
    if (token == "--report") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.report_path = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, token, value, error) ||
          !core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }

    if (!config.source_path.empty()) {
      error = "run accepts exactly 1 source path";
      return false;
    }
    config.source_path = fs::path(token);
  }

  if (config.source_path.empty()) {
    error = "run requires exactly 1 argument: <folder|file>";
    return false;
  }
  return true;
}

bool LoadCredentials(RunOptions& options, std::string& error) {
  config::RunConfiguration& config = options.config;
  if (config.skip_transmit && !config.env_file.has_value()) {
    return true;
  }

  const fs::path env_path =
      config.env_file.value_or(fs::path(std::string(config::kDefaultEnvFile)));
  config::EnvMap env;
  if (!config::LoadEnvFile(env_path, env, error)) {
    return false;
  }
  if (!config::BuildTransmitCredentials(env, config.credentials, error)) {
    error = env_path.string() + ": " + error;
    return false;
  }
  return true;
}

int ExitCodeFor(const pipeline::RunOutcome& outcome) {
  using core::errors::ExitCode;
  using core::errors::ToInt;

  if (outcome.status != pipeline::RunStatus::kFailure) {
    return ToInt(ExitCode::kSuccess);
  }
  switch (outcome.error_kind) {
  case pipeline::ErrorKind::kValidation:
    return ToInt(ExitCode::kConfigInvalid);
  case pipeline::ErrorKind::kConflict:
    return ToInt(ExitCode::kManifestConflict);
  case pipeline::ErrorKind::kInterrupted:
    return ToInt(ExitCode::kInterrupted);
  case pipeline::ErrorKind::kStage:
    if (outcome.failed_stage.has_value()) {
      switch (outcome.failed_stage.value()) {
      case stages::StageId::kArchive:
        return ToInt(ExitCode::kArchiveFailed);
      case stages::StageId::kParity:
        return ToInt(ExitCode::kParityFailed);
      case stages::StageId::kTransmit:
        return ToInt(ExitCode::kTransmitFailed);
      }
    }
    return ToInt(ExitCode::kFailure);
  case pipeline::ErrorKind::kNone:
    break;
  }
  return ToInt(ExitCode::kFailure);
}

int ExecuteRun(const RunOptions& options, pipeline::PipelineTools tools,
               pipeline::RunOutcome* outcome_out) {
  core::logging::Logger logger(options.log_level);
  logger.SetRunId(MakeRunId(std::chrono::system_clock::now()));

  core::signals::ResetInterruptFlag();
  const core::signals::ScopedInterruptHandler interrupt_handler;
  if (!interrupt_handler.Installed()) {
    logger.Warn("termination signal handlers not installed; Ctrl-C will skip cleanup");
  }

  logger.Info("run started", {{"source", options.config.source_path.string()},
                              {"dry_run", options.config.dry_run ? "true" : "false"},
                              {"backend", config::ToString(options.config.parity_backend)},
                              {"redundancy", std::to_string(options.config.redundancy_percent)},
                              {"post_size", options.config.post_size}});

  pipeline::PipelineController controller(options.config, std::move(tools), logger);
  const pipeline::RunOutcome outcome = controller.Run();

  config::RunConfiguration printed = options.config;
  printed.source_path = config::NormalizeSourcePath(printed.source_path);
  artifacts::PrintRunSummary(printed, outcome, std::cout);

  int exit_code = ExitCodeFor(outcome);
  if (options.report_path.has_value()) {
    std::string error;
    if (!artifacts::WriteRunReportJson(outcome, options.report_path.value(), error)) {
      logger.Error("failed to write run report", {{"error", error}});
      if (exit_code == kExitSuccess) {
        exit_code = kExitFailure;
      }
    } else {
      logger.Info("run report written", {{"report", options.report_path->string()}});
    }
  }

  if (outcome_out != nullptr) {
    *outcome_out = outcome;
  }
  return exit_code;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "run") {
    return CommandRun(args);
  }

  if (command == "check-tools") {
    return CommandCheckTools(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace binpost::cli
