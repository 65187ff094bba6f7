#include "artifacts/run_report_writer.hpp"

#include "core/fs_utils.hpp"

namespace binpost::artifacts {

bool WriteRunReportJson(const pipeline::RunOutcome& outcome,
                        const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "report path cannot be empty";
    return false;
  }
  // Trailing newline keeps the file shell-friendly (`cat`, `tail`, diffs).
  return core::WriteTextFileAtomic(output_path, pipeline::ToJson(outcome) + "\n", error);
}

} // namespace binpost::artifacts
