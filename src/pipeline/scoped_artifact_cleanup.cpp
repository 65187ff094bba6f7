#include "pipeline/scoped_artifact_cleanup.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace binpost::pipeline {

ScopedArtifactCleanup::~ScopedArtifactCleanup() {
  if (!armed_) {
    return;
  }
  Release();
}

bool ScopedArtifactCleanup::Register(const fs::path& path) {
  if (path.empty()) {
    return false;
  }
  if (core::IsSameOrWithin(path, protected_root_)) {
    if (logger_ != nullptr) {
      logger_->Warn("refusing to own a path inside the source",
                    {{"path", path.string()}, {"source", protected_root_.string()}});
    }
    return false;
  }
  if (std::find(registered_.begin(), registered_.end(), path) == registered_.end()) {
    registered_.push_back(path);
  }
  return true;
}

std::size_t ScopedArtifactCleanup::Release() {
  if (!armed_) {
    return 0;
  }
  armed_ = false;

  std::size_t removed = 0;
  for (auto it = registered_.rbegin(); it != registered_.rend(); ++it) {
    std::error_code ec;
    const bool existed = fs::remove(*it, ec);
    if (ec) {
      if (logger_ != nullptr) {
        logger_->Warn("failed to remove intermediate artifact",
                      {{"path", it->string()}, {"error", ec.message()}});
      } else {
        std::cerr << "warning: failed to remove " << it->string() << ": " << ec.message() << '\n';
      }
      continue;
    }
    if (existed) {
      ++removed;
      if (logger_ != nullptr) {
        logger_->Debug("removed intermediate artifact", {{"path", it->string()}});
      }
    }
  }
  return removed;
}

void ScopedArtifactCleanup::Keep() {
  armed_ = false;
}

} // namespace binpost::pipeline
