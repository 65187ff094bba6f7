#pragma once

#include "core/logging/logger.hpp"

#include <cstddef>
#include <filesystem>
#include <utility>
#include <vector>

namespace binpost::pipeline {

// Single owner of every intermediate artifact a run creates. Paths are
// registered as stages produce them and released exactly once: explicitly via
// Release(), or by the destructor when the run unwinds without reaching
// cleanup. Keep() disarms the guard so artifacts stay on disk.
//
// The protected root (the user's source) is never deleted, even if a path
// inside it is registered by mistake.
class ScopedArtifactCleanup {
public:
  ScopedArtifactCleanup(std::filesystem::path protected_root, core::logging::Logger* logger)
      : protected_root_(std::move(protected_root)), logger_(logger) {}

  ~ScopedArtifactCleanup();

  ScopedArtifactCleanup(const ScopedArtifactCleanup&) = delete;
  ScopedArtifactCleanup& operator=(const ScopedArtifactCleanup&) = delete;

  // Registers `path` for release. Duplicates and protected paths are ignored;
  // returns whether the path is now owned.
  bool Register(const std::filesystem::path& path);

  // Deletes registered files in reverse registration order and disarms.
  // Missing files count as already released. Later calls are no-ops.
  // Returns the number of files actually removed.
  std::size_t Release();

  // Leaves every registered file in place and disarms.
  void Keep();

  bool Armed() const { return armed_; }
  const std::vector<std::filesystem::path>& Registered() const { return registered_; }

private:
  std::filesystem::path protected_root_;
  core::logging::Logger* logger_ = nullptr;
  std::vector<std::filesystem::path> registered_;
  bool armed_ = true;
};

} // namespace binpost::pipeline
