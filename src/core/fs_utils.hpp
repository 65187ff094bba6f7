#ifndef BINPOST_CORE_FS_UTILS_HPP_
#define BINPOST_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace binpost::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Writes the whole text to a temporary sibling, then renames it into place so
// readers never observe a half-written descriptor or report.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    if (!out_file) {
      out_file.close();
      std::error_code cleanup_ec;
      (void)std::filesystem::remove(temp_path, cleanup_ec);
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

// Existence probe that treats filesystem errors as "absent" rather than throwing.
inline bool PathExists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

inline std::uintmax_t FileSizeOrZero(const std::filesystem::path& path) {
  std::error_code ec;
  const std::uintmax_t size = std::filesystem::file_size(path, ec);
  return ec ? 0U : size;
}

// True when `candidate` is `root` itself or lives underneath it. Both paths are
// normalized lexically, so symlinks are not resolved.
inline bool IsSameOrWithin(const std::filesystem::path& candidate,
                           const std::filesystem::path& root) {
  if (root.empty()) {
    return false;
  }
  std::error_code ec;
  const std::filesystem::path abs_candidate =
      std::filesystem::absolute(candidate, ec).lexically_normal();
  if (ec) {
    return false;
  }
  const std::filesystem::path abs_root = std::filesystem::absolute(root, ec).lexically_normal();
  if (ec) {
    return false;
  }

  auto root_it = abs_root.begin();
  auto candidate_it = abs_candidate.begin();
  for (; root_it != abs_root.end(); ++root_it, ++candidate_it) {
    if (root_it->empty() && std::next(root_it) == abs_root.end()) {
      // Trailing separator on a directory path.
      return true;
    }
    if (candidate_it == abs_candidate.end() || *candidate_it != *root_it) {
      return false;
    }
  }
  return true;
}

} // namespace binpost::core

#endif // BINPOST_CORE_FS_UTILS_HPP_
