#pragma once

#include "config/run_config.hpp"
#include "conflict/conflict_resolver.hpp"
#include "core/logging/logger.hpp"
#include "pipeline/run_outcome.hpp"
#include "pipeline/scoped_artifact_cleanup.hpp"
#include "stages/stage_result.hpp"
#include "tools/archive_tool.hpp"
#include "tools/media_probe.hpp"
#include "tools/parity_tool.hpp"
#include "tools/transmit_progress.hpp"
#include "tools/transmit_tool.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace binpost::pipeline {

enum class PipelineState {
  kInit,
  kConflictCheck,
  kSummarize,
  kArchive,
  kSkippedArchive,
  kParity,
  kSkippedParity,
  kTransmit,
  kSkippedTransmit,
  kCleanup,
  kDone,
  kFailed,
};

const char* ToString(PipelineState state);

// External capabilities a run needs. Production wiring comes from
// MakeDefaultTools(); tests substitute fakes.
struct PipelineTools {
  std::unique_ptr<tools::IArchiveTool> archive;
  std::unique_ptr<tools::IParityTool> parity;
  std::unique_ptr<tools::ITransmitTool> transmit;
  // Optional. Without it the descriptor omits media attributes.
  std::unique_ptr<tools::IMediaProbe> media_probe;
  // Existence probe for the manifest conflict check. Empty means the real
  // filesystem.
  conflict::FileProbe file_probe;
};

// rar, the configured parity backend, nyuu and ffprobe.
PipelineTools MakeDefaultTools(const config::RunConfiguration& config);

// Polled between stages. Defaults to the process-wide signal flag.
using InterruptCheck = std::function<bool()>;

// Sequences conflict check, descriptor, archive, parity and transmit for one
// source. Stages run strictly in order; the output paths of each stage are the
// input of the next. Every file a stage creates is owned by one
// ScopedArtifactCleanup and released exactly once on whichever path the run
// takes.
//
// Run() always returns a RunOutcome. Exceptions from collaborators are caught
// and reported as a failed run after cleanup.
class PipelineController {
public:
  PipelineController(config::RunConfiguration config, PipelineTools tools,
                     core::logging::Logger& logger, InterruptCheck interrupted = {});

  RunOutcome Run();

  // Every state entered by the last Run(), in order.
  const std::vector<PipelineState>& Transitions() const { return transitions_; }

private:
  RunOutcome Execute();

  void Enter(PipelineState state);
  bool ValidateInit(std::string& error) const;
  bool CheckInterrupted();
  void SummarizeOnce();
  void RecordStage(const stages::StageResult& result, bool owns_created);
  void OnTransmitOutput(std::string_view line);
  std::vector<std::filesystem::path> TransmitInputs() const;

  RunOutcome Finish();
  RunOutcome Fail(ErrorKind kind, std::string diagnostic,
                  std::optional<stages::StageId> stage = std::nullopt);
  std::vector<std::filesystem::path> CollectExistingFiles() const;

  config::RunConfiguration config_;
  PipelineTools tools_;
  core::logging::Logger& logger_;
  InterruptCheck interrupted_;

  std::vector<PipelineState> transitions_;
  RunOutcome outcome_;
  std::unique_ptr<ScopedArtifactCleanup> cleanup_;
  std::vector<std::filesystem::path> archive_outputs_;
  std::vector<std::filesystem::path> parity_outputs_;
  tools::TransmitProgressParser progress_;
  bool descriptor_generated_ = false;
};

} // namespace binpost::pipeline
