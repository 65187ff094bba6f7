#pragma once

#include "pipeline/run_outcome.hpp"

#include <filesystem>
#include <string>

namespace binpost::artifacts {

// Writes the RunOutcome as JSON to `output_path` (`--report`).
//
// Contract:
// - creates the parent directory when missing.
// - replaces the file atomically; readers never observe a partial report.
// - returns false and sets `error` on failure.
bool WriteRunReportJson(const pipeline::RunOutcome& outcome,
                        const std::filesystem::path& output_path, std::string& error);

} // namespace binpost::artifacts
