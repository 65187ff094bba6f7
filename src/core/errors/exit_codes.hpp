#pragma once

namespace binpost::core::errors {

// Stable process-exit contract for wrappers and cron jobs.
//
// 0/1/2 keep their conventional meanings. The remaining values let callers
// tell a pre-flight refusal (bad config, manifest conflict) apart from a stage
// that failed after work started, without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kManifestConflict = 20,
  kArchiveFailed = 31,
  kParityFailed = 32,
  kTransmitFailed = 33,
  kInterrupted = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace binpost::core::errors
