#pragma once

#include "config/run_config.hpp"
#include "tools/tool_run.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace binpost::tools {

struct ParityRequest {
  int redundancy_percent = config::kDefaultRedundancyPercent;
  std::uint64_t slice_size_bytes = 0;
  // Index file to create (`<stem>.par2`); recovery volumes land beside it.
  std::filesystem::path index_path;
};

// Parity capability used by the parity stage. One implementation per
// config::ParityBackend value.
class IParityTool {
public:
  virtual ~IParityTool() = default;

  virtual config::ParityBackend Backend() const = 0;
  virtual std::string Name() const = 0;
  virtual bool Available() const = 0;

  // Generates the parity set for `input`. On a zero exit status
  // `parity_files` lists the index file and every recovery volume found for
  // it. Returns false only when the tool could not be launched.
  virtual bool GenerateParity(const std::filesystem::path& input, const ParityRequest& request,
                              std::vector<std::filesystem::path>& parity_files, ToolRun& run,
                              std::string& error) = 0;
};

// `photos.rar` → `photos.par2`, `clip.mkv` → `clip.par2`.
std::filesystem::path ParityIndexPathFor(const std::filesystem::path& input);

// Lists `<stem>.par2` and `<stem>.vol*.par2` beside `index_path`, index first,
// volumes in name order. Missing directory yields an empty list.
std::vector<std::filesystem::path> FindParitySet(const std::filesystem::path& index_path);

// Post size aligned down to a multiple of 4 bytes (PAR2 block alignment),
// never below 4.
std::uint64_t SliceSizeForPostSize(std::uint64_t post_size_bytes);

// Resolves the backend selector to its concrete tool once, at configuration
// time.
std::unique_ptr<IParityTool> MakeParityTool(config::ParityBackend backend);

namespace detail {

// Runs a backend command line and collects the parity set on success.
bool RunParityCommand(const std::string& command, const ParityRequest& request,
                      std::vector<std::filesystem::path>& parity_files, ToolRun& run,
                      std::string& error);

} // namespace detail

} // namespace binpost::tools
