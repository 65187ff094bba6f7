#pragma once

#include "config/run_config.hpp"
#include "pipeline/run_outcome.hpp"

#include <ostream>
#include <string>

namespace binpost::artifacts {

// Operator-facing end-of-run summary: status, names, per-stage timings and
// payload size. Plain text, one `key: value` per line.
std::string RenderRunSummary(const config::RunConfiguration& config,
                             const pipeline::RunOutcome& outcome);

void PrintRunSummary(const config::RunConfiguration& config, const pipeline::RunOutcome& outcome,
                     std::ostream& out);

} // namespace binpost::artifacts
