#ifndef BINPOST_TESTS_COMMON_TEMP_DIR_HPP_
#define BINPOST_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <system_error>

namespace binpost::tests::common {

inline std::filesystem::path CreateUniqueTempDir(std::string_view prefix) {
  static std::atomic<std::uint64_t> counter{0};
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const std::filesystem::path root =
      std::filesystem::temp_directory_path() /
      (std::string(prefix) + "-" + std::to_string(now_ms) + "-" +
       std::to_string(counter.fetch_add(1U)));

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  if (ec) {
    Fail("failed to create temp root: " + root.string());
  }
  return root;
}

inline void RemovePathBestEffort(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

// Every regular file below `root`, as paths relative to it. Used to prove a
// run created or deleted nothing.
inline std::set<std::string> SnapshotTree(const std::filesystem::path& root) {
  std::set<std::string> files;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(root, ec);
  if (ec) {
    Fail("failed to list " + root.string());
  }
  for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      Fail("failed to list " + root.string());
    }
    files.insert(it->path().lexically_relative(root).generic_string());
  }
  return files;
}

} // namespace binpost::tests::common

#endif // BINPOST_TESTS_COMMON_TEMP_DIR_HPP_
