#include "pipeline/run_outcome.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace binpost::pipeline {

const char* ToString(RunStatus status) {
  switch (status) {
  case RunStatus::kSuccess:
    return "success";
  case RunStatus::kPartial:
    return "partial";
  case RunStatus::kFailure:
    return "failure";
  }
  return "failure";
}

const char* ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "none";
  case ErrorKind::kValidation:
    return "validation";
  case ErrorKind::kConflict:
    return "conflict";
  case ErrorKind::kStage:
    return "stage";
  case ErrorKind::kInterrupted:
    return "interrupted";
  }
  return "none";
}

std::string ToJson(const stages::StageResult& result) {
  std::ostringstream out;
  out << "{"
      << "\"stage\":" << core::QuoteJson(stages::ToString(result.stage)) << ","
      << "\"status\":" << core::QuoteJson(stages::ToString(result.status)) << ","
      << "\"outputs\":" << core::ToJsonPathArray(result.outputs) << ","
      << "\"elapsed_ms\":" << result.elapsed.count() << ","
      << "\"output_bytes\":" << result.output_bytes << ","
      << "\"simulated\":" << (result.simulated ? "true" : "false");
  if (result.diagnostic.has_value()) {
    out << ",\"diagnostic\":" << core::QuoteJson(result.diagnostic.value());
  }
  out << "}";
  return out.str();
}

std::string ToJson(const RunOutcome& outcome) {
  std::ostringstream out;
  out << "{"
      << "\"status\":" << core::QuoteJson(ToString(outcome.status)) << ","
      << "\"error_kind\":" << core::QuoteJson(ToString(outcome.error_kind)) << ","
      << "\"dry_run\":" << (outcome.dry_run ? "true" : "false") << ","
      << "\"final_state\":" << core::QuoteJson(outcome.final_state) << ","
      << "\"manifest_path\":" << core::QuoteJson(outcome.manifest_path.string());
  if (outcome.descriptor_path.has_value()) {
    out << ",\"descriptor_path\":" << core::QuoteJson(outcome.descriptor_path->string());
  }
  if (outcome.failed_stage.has_value()) {
    out << ",\"failed_stage\":" << core::QuoteJson(stages::ToString(outcome.failed_stage.value()));
  }
  if (!outcome.diagnostic.empty()) {
    out << ",\"diagnostic\":" << core::QuoteJson(outcome.diagnostic);
  }
  out << ",\"stages\":[";
  for (std::size_t i = 0; i < outcome.stages.size(); ++i) {
    if (i != 0U) {
      out << ",";
    }
    out << ToJson(outcome.stages[i]);
  }
  out << "],"
      << "\"existing_files\":" << core::ToJsonPathArray(outcome.existing_files) << ","
      << "\"timestamps\":{"
      << "\"started_at_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(outcome.started_at))
      << ","
      << "\"finished_at_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(outcome.finished_at))
      << "}}";
  return out.str();
}

} // namespace binpost::pipeline
