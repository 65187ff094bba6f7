#include "artifacts/run_summary_printer.hpp"

#include "core/size_format.hpp"
#include "core/time_utils.hpp"

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace binpost::artifacts {

std::string RenderRunSummary(const config::RunConfiguration& config,
                             const pipeline::RunOutcome& outcome) {
  std::uintmax_t payload_bytes = 0;
  std::chrono::milliseconds total_elapsed{0};
  for (const auto& stage : outcome.stages) {
    total_elapsed += stage.elapsed;
    if (stage.stage != stages::StageId::kTransmit) {
      payload_bytes += stage.output_bytes;
    }
  }

  std::ostringstream out;
  out << "status: " << pipeline::ToString(outcome.status);
  if (outcome.dry_run) {
    out << " (dry-run)";
  }
  out << '\n';
  out << "source: " << config.source_path.filename().string() << '\n';
  if (!config.skip_transmit) {
    out << "subject: " << config::EffectiveSubject(config) << '\n';
    out << "group: " << config::EffectiveGroup(config) << '\n';
  }
  if (!outcome.manifest_path.empty()) {
    out << "manifest: " << outcome.manifest_path.string() << '\n';
  }
  if (outcome.descriptor_path.has_value()) {
    out << "descriptor: " << outcome.descriptor_path->string() << '\n';
  }

  for (const auto& stage : outcome.stages) {
    out << "stage " << std::left << std::setw(8) << stages::ToString(stage.stage) << ' '
        << std::setw(9) << stages::ToString(stage.status) << ' '
        << core::FormatClockDuration(stage.elapsed);
    if (stage.simulated) {
      out << " simulated";
    }
    out << '\n';
  }
  out << "total time: " << core::FormatClockDuration(total_elapsed) << '\n';
  out << "payload size: " << core::FormatByteSize(payload_bytes) << '\n';

  if (outcome.status == pipeline::RunStatus::kFailure) {
    out << "error: " << pipeline::ToString(outcome.error_kind) << ": " << outcome.diagnostic
        << '\n';
  }
  for (const auto& path : outcome.existing_files) {
    out << "file: " << path.string() << '\n';
  }
  return out.str();
}

void PrintRunSummary(const config::RunConfiguration& config, const pipeline::RunOutcome& outcome,
                     std::ostream& out) {
  out << RenderRunSummary(config, outcome);
  out.flush();
}

} // namespace binpost::artifacts
