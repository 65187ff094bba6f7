#include "pipeline/pipeline_controller.hpp"

#include "core/fs_utils.hpp"
#include "core/signals/interrupt.hpp"
#include "stages/archive_stage.hpp"
#include "stages/parity_stage.hpp"
#include "stages/transmit_stage.hpp"
#include "summary/metadata_summarizer.hpp"
#include "tools/ffprobe_media_probe.hpp"
#include "tools/nyuu_transmit_tool.hpp"
#include "tools/rar_archive_tool.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace binpost::pipeline {

namespace {

std::string FormatMib(double mib) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << mib;
  return out.str();
}

} // namespace

const char* ToString(PipelineState state) {
  switch (state) {
  case PipelineState::kInit:
    return "init";
  case PipelineState::kConflictCheck:
    return "conflict_check";
  case PipelineState::kSummarize:
    return "summarize";
  case PipelineState::kArchive:
    return "archive";
  case PipelineState::kSkippedArchive:
    return "skipped_archive";
  case PipelineState::kParity:
    return "parity";
  case PipelineState::kSkippedParity:
    return "skipped_parity";
  case PipelineState::kTransmit:
    return "transmit";
  case PipelineState::kSkippedTransmit:
    return "skipped_transmit";
  case PipelineState::kCleanup:
    return "cleanup";
  case PipelineState::kDone:
    return "done";
  case PipelineState::kFailed:
    return "failed";
  }
  return "failed";
}

PipelineTools MakeDefaultTools(const config::RunConfiguration& config) {
  PipelineTools tools;
  tools.archive = std::make_unique<tools::RarArchiveTool>();
  tools.parity = tools::MakeParityTool(config.parity_backend);
  tools.transmit = std::make_unique<tools::NyuuTransmitTool>();
  tools.media_probe = std::make_unique<tools::FfprobeMediaProbe>();
  tools.file_probe = conflict::DefaultFileProbe();
  return tools;
}

PipelineController::PipelineController(config::RunConfiguration config, PipelineTools tools,
                                       core::logging::Logger& logger, InterruptCheck interrupted)
    : config_(std::move(config)), tools_(std::move(tools)), logger_(logger),
      interrupted_(std::move(interrupted)) {
  if (!interrupted_) {
    interrupted_ = [] { return core::signals::InterruptRequested(); };
  }
  if (!tools_.file_probe) {
    tools_.file_probe = conflict::DefaultFileProbe();
  }
}

RunOutcome PipelineController::Run() {
  transitions_.clear();
  outcome_ = RunOutcome{};
  outcome_.dry_run = config_.dry_run;
  outcome_.started_at = std::chrono::system_clock::now();
  cleanup_.reset();
  archive_outputs_.clear();
  parity_outputs_.clear();
  progress_ = tools::TransmitProgressParser{};
  descriptor_generated_ = false;

  try {
    return Execute();
  } catch (const std::exception& ex) {
    logger_.Error("pipeline aborted by unexpected error", {{"error", ex.what()}});
    return Fail(ErrorKind::kStage, std::string("internal error: ") + ex.what());
  }
}

RunOutcome PipelineController::Execute() {
  Enter(PipelineState::kInit);
  config_.source_path = config::NormalizeSourcePath(config_.source_path);
  std::string error;
  if (!ValidateInit(error)) {
    return Fail(ErrorKind::kValidation, error);
  }
  cleanup_ = std::make_unique<ScopedArtifactCleanup>(config_.source_path, &logger_);
  if (CheckInterrupted()) {
    return Fail(ErrorKind::kInterrupted, "run interrupted before any stage started");
  }

  // Pre-flight: an abort here must leave nothing behind, so nothing above
  // this point writes to disk.
  Enter(PipelineState::kConflictCheck);
  const std::string source_id = config::SourceIdentifier(config_.source_path);
  const conflict::ConflictDecision decision =
      conflict::Resolve(config_.manifest_path_template, source_id, config_.conflict_policy,
                        tools_.file_probe, config_.source_path.parent_path());
  if (decision.action == conflict::ConflictAction::kAbort) {
    return Fail(ErrorKind::kConflict, decision.diagnostic);
  }
  std::error_code ec;
  if (core::IsSameOrWithin(decision.resolved_path, config_.source_path)) {
    const std::string reason = fs::is_directory(config_.source_path, ec)
                                   ? "manifest path must not be inside the source folder: "
                                   : "manifest path must not replace the source file: ";
    return Fail(ErrorKind::kValidation, reason + decision.resolved_path.string());
  }
  outcome_.manifest_path = decision.resolved_path;
  logger_.Info("manifest path resolved", {{"manifest", decision.resolved_path.string()},
                                          {"action", conflict::ToString(decision.action)},
                                          {"policy", config::ToString(config_.conflict_policy)}});

  Enter(PipelineState::kSummarize);
  SummarizeOnce();
  if (CheckInterrupted()) {
    return Fail(ErrorKind::kInterrupted, "run interrupted before archiving");
  }

  const bool single_file = fs::is_regular_file(config_.source_path, ec);
  Enter(config_.skip_archive || single_file ? PipelineState::kSkippedArchive
                                            : PipelineState::kArchive);
  stages::ArchiveStageConfig archive_config;
  archive_config.skip = config_.skip_archive;
  archive_config.force_overwrite = config_.force_overwrite;
  const stages::StageResult archive_result =
      stages::ArchiveStage(*tools_.archive).Run({config_.source_path}, archive_config,
                                                config_.dry_run);
  RecordStage(archive_result, true);
  if (archive_result.status == stages::StageStatus::kFailed) {
    return Fail(ErrorKind::kStage, archive_result.diagnostic.value_or("archive stage failed"),
                stages::StageId::kArchive);
  }
  archive_outputs_ = archive_result.outputs;
  if (CheckInterrupted()) {
    return Fail(ErrorKind::kInterrupted, "run interrupted after the archive stage");
  }

  Enter(config_.skip_parity ? PipelineState::kSkippedParity : PipelineState::kParity);
  stages::ParityStageConfig parity_config;
  parity_config.redundancy_percent = config_.redundancy_percent;
  parity_config.post_size_bytes = config_.post_size_bytes;
  parity_config.skip = config_.skip_parity;
  parity_config.force_overwrite = config_.force_overwrite;
  const stages::StageResult parity_result =
      stages::ParityStage(*tools_.parity).Run(archive_outputs_, parity_config, config_.dry_run);
  RecordStage(parity_result, true);
  if (parity_result.status == stages::StageStatus::kFailed) {
    return Fail(ErrorKind::kStage, parity_result.diagnostic.value_or("parity stage failed"),
                stages::StageId::kParity);
  }
  parity_outputs_ = parity_result.outputs;
  if (CheckInterrupted()) {
    return Fail(ErrorKind::kInterrupted, "run interrupted after the parity stage");
  }

  Enter(config_.skip_transmit ? PipelineState::kSkippedTransmit : PipelineState::kTransmit);
  stages::TransmitStageConfig transmit_config;
  transmit_config.credentials = config_.credentials;
  transmit_config.group = config::EffectiveGroup(config_);
  transmit_config.subject = config::EffectiveSubject(config_);
  transmit_config.article_size = config_.credentials.article_size;
  transmit_config.manifest_path = outcome_.manifest_path;
  transmit_config.overwrite_manifest =
      config_.conflict_policy == config::ConflictPolicy::kOverwrite;
  transmit_config.skip = config_.skip_transmit;
  transmit_config.force_overwrite = config_.force_overwrite;
  transmit_config.on_output = [this](std::string_view line) { OnTransmitOutput(line); };
  const stages::StageResult transmit_result =
      stages::TransmitStage(*tools_.transmit).Run(TransmitInputs(), transmit_config,
                                                  config_.dry_run);
  // A finished manifest is the product of the run, not an intermediate; only
  // partial leftovers of a failed transmission are owned for cleanup.
  RecordStage(transmit_result, transmit_result.status == stages::StageStatus::kFailed);
  if (transmit_result.status == stages::StageStatus::kFailed) {
    return Fail(ErrorKind::kStage, transmit_result.diagnostic.value_or("transmit stage failed"),
                stages::StageId::kTransmit);
  }

  Enter(PipelineState::kCleanup);
  if (config_.skip_transmit) {
    cleanup_->Keep();
    logger_.Info("intermediate files kept: nothing was transmitted",
                 {{"files", std::to_string(cleanup_->Registered().size())}});
  } else if (config_.keep_intermediate_files) {
    cleanup_->Keep();
    logger_.Info("intermediate files kept on request",
                 {{"files", std::to_string(cleanup_->Registered().size())}});
  } else {
    const std::size_t removed = cleanup_->Release();
    logger_.Info("intermediate files removed", {{"files", std::to_string(removed)}});
  }

  return Finish();
}

void PipelineController::Enter(PipelineState state) {
  const char* previous = transitions_.empty() ? "-" : ToString(transitions_.back());
  transitions_.push_back(state);
  logger_.SetState(ToString(state));
  logger_.Debug("state transition", {{"from", previous}, {"to", ToString(state)}});
}

bool PipelineController::ValidateInit(std::string& error) const {
  if (!config::ValidateRunConfiguration(config_, error)) {
    return false;
  }
  if (!tools_.archive || !tools_.parity || !tools_.transmit) {
    error = "pipeline is missing an archive, parity or transmit tool";
    return false;
  }
  if (tools_.parity->Backend() != config_.parity_backend) {
    error = std::string("parity tool '") + tools_.parity->Name() +
            "' does not match backend '" + config::ToString(config_.parity_backend) + "'";
    return false;
  }
  if (config_.dry_run) {
    return true;
  }

  std::error_code ec;
  const bool needs_archiver =
      !config_.skip_archive && fs::is_directory(config_.source_path, ec);
  if (needs_archiver && !tools_.archive->Available()) {
    error = "required tool not found on PATH: " + tools_.archive->Name();
    return false;
  }
  if (!config_.skip_parity && !tools_.parity->Available()) {
    error = "required tool not found on PATH: " + tools_.parity->Name();
    return false;
  }
  if (!config_.skip_transmit && !tools_.transmit->Available()) {
    error = "required tool not found on PATH: " + tools_.transmit->Name();
    return false;
  }
  return true;
}

bool PipelineController::CheckInterrupted() {
  if (!interrupted_()) {
    return false;
  }
  logger_.Warn("termination signal received; stopping after current stage");
  return true;
}

void PipelineController::SummarizeOnce() {
  if (!config_.descriptor.enabled) {
    logger_.Debug("descriptor disabled");
    return;
  }
  if (descriptor_generated_) {
    logger_.Debug("descriptor already generated for this run");
    return;
  }
  descriptor_generated_ = true;

  try {
    summary::MetadataSummarizer summarizer(tools_.media_probe.get(), logger_);
    const summary::SummaryResult summary =
        summarizer.Summarize(config_.source_path, config_.descriptor, config_.dry_run);
    outcome_.descriptor_path = summary.descriptor_path;
  } catch (const std::exception& ex) {
    logger_.Warn("descriptor generation failed", {{"error", ex.what()}});
  }
}

void PipelineController::RecordStage(const stages::StageResult& result, bool owns_created) {
  if (owns_created && cleanup_) {
    for (const auto& path : result.created) {
      cleanup_->Register(path);
    }
  }
  outcome_.stages.push_back(result);

  const core::logging::LogLevel level = result.status == stages::StageStatus::kFailed
                                            ? core::logging::LogLevel::kError
                                            : core::logging::LogLevel::kInfo;
  logger_.Log(level, "stage finished",
              {{"stage", stages::ToString(result.stage)},
               {"status", stages::ToString(result.status)},
               {"elapsed_ms", std::to_string(result.elapsed.count())},
               {"outputs", std::to_string(result.outputs.size())},
               {"simulated", result.simulated ? "true" : "false"},
               {"diagnostic", result.diagnostic.value_or("")}});
}

void PipelineController::OnTransmitOutput(std::string_view line) {
  logger_.Debug("transmit output", {{"line", line}});

  const tools::ProgressUpdate update = progress_.ParseLine(line);
  switch (update.kind) {
  case tools::ProgressKind::kTotals:
    logger_.Info("transmit started", {{"articles", std::to_string(update.total_articles)},
                                      {"size_mib", FormatMib(update.size_mib)}});
    return;
  case tools::ProgressKind::kFinished:
    logger_.Info("transmit finished", {{"size_mib", FormatMib(update.size_mib)},
                                       {"speed_mib_s", FormatMib(update.speed_mib_per_sec)}});
    return;
  case tools::ProgressKind::kArticles:
  case tools::ProgressKind::kPercent:
    break;
  case tools::ProgressKind::kNone:
    return;
  }

  if (!update.fraction.has_value()) {
    return;
  }
  const std::optional<int> step = progress_.NextLogStep(update.fraction.value());
  if (step.has_value()) {
    logger_.Info("transmit progress", {{"percent", std::to_string(step.value() * 10)}});
  }
}

std::vector<fs::path> PipelineController::TransmitInputs() const {
  std::vector<fs::path> inputs = archive_outputs_;
  inputs.insert(inputs.end(), parity_outputs_.begin(), parity_outputs_.end());
  // The descriptor is never sent, even if a pass-through set happens to
  // contain it.
  if (outcome_.descriptor_path.has_value()) {
    const fs::path& descriptor = outcome_.descriptor_path.value();
    inputs.erase(std::remove(inputs.begin(), inputs.end(), descriptor), inputs.end());
  }
  return inputs;
}

RunOutcome PipelineController::Finish() {
  Enter(PipelineState::kDone);
  const bool any_skipped =
      std::any_of(outcome_.stages.begin(), outcome_.stages.end(), [](const auto& stage) {
        return stage.status == stages::StageStatus::kSkipped;
      });
  outcome_.status = any_skipped ? RunStatus::kPartial : RunStatus::kSuccess;
  outcome_.error_kind = ErrorKind::kNone;
  outcome_.final_state = ToString(PipelineState::kDone);
  outcome_.existing_files = CollectExistingFiles();
  outcome_.finished_at = std::chrono::system_clock::now();
  logger_.Info("run finished", {{"status", ToString(outcome_.status)},
                                {"manifest", outcome_.manifest_path.string()}});
  return outcome_;
}

RunOutcome PipelineController::Fail(ErrorKind kind, std::string diagnostic,
                                    std::optional<stages::StageId> stage) {
  // A tool killed by the same Ctrl-C reports a plain non-zero exit.
  if (kind == ErrorKind::kStage && interrupted_()) {
    kind = ErrorKind::kInterrupted;
  }

  Enter(PipelineState::kFailed);
  if (cleanup_) {
    if (config_.keep_intermediate_files) {
      cleanup_->Keep();
      if (!cleanup_->Registered().empty()) {
        logger_.Warn("partial artifacts kept for inspection",
                     {{"files", std::to_string(cleanup_->Registered().size())}});
      }
    } else {
      const std::size_t removed = cleanup_->Release();
      if (removed > 0U) {
        logger_.Info("artifacts of the failed run removed", {{"files", std::to_string(removed)}});
      }
    }
  }

  outcome_.status = RunStatus::kFailure;
  outcome_.error_kind = kind;
  outcome_.failed_stage = stage;
  outcome_.diagnostic = std::move(diagnostic);
  outcome_.final_state = ToString(PipelineState::kFailed);
  outcome_.existing_files = CollectExistingFiles();
  outcome_.finished_at = std::chrono::system_clock::now();
  logger_.Error("run failed", {{"error_kind", ToString(kind)},
                               {"diagnostic", outcome_.diagnostic}});
  return outcome_;
}

std::vector<fs::path> PipelineController::CollectExistingFiles() const {
  std::vector<fs::path> existing;
  if (outcome_.dry_run) {
    return existing;
  }
  if (cleanup_) {
    for (const auto& path : cleanup_->Registered()) {
      if (core::PathExists(path)) {
        existing.push_back(path);
      }
    }
  }
  const auto add_product = [&existing](const fs::path& path) {
    if (!path.empty() && core::PathExists(path) &&
        std::find(existing.begin(), existing.end(), path) == existing.end()) {
      existing.push_back(path);
    }
  };
  if (!outcome_.stages.empty() &&
      outcome_.stages.back().stage == stages::StageId::kTransmit &&
      outcome_.stages.back().status == stages::StageStatus::kSucceeded) {
    add_product(outcome_.manifest_path);
  }
  if (outcome_.descriptor_path.has_value()) {
    add_product(outcome_.descriptor_path.value());
  }
  return existing;
}

} // namespace binpost::pipeline
