#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace binpost::tools {

// Technical attributes of one media file. Every field is optional because
// probes report whatever the container exposes.
struct MediaAttributes {
  std::optional<double> duration_seconds;
  std::optional<std::uint32_t> width;
  std::optional<std::uint32_t> height;
  std::string video_codec;
  std::string audio_codec;
  std::optional<std::uint64_t> bit_rate;
  // Path as echoed back by the probe. May be absolute; the summarizer reduces
  // it to a bare file name before it reaches the descriptor.
  std::string complete_name;
};

// Metadata probe used only to enrich the descriptor artifact.
class IMediaProbe {
public:
  virtual ~IMediaProbe() = default;

  virtual std::string Name() const = 0;
  virtual bool Available() const = 0;

  // Returns false with `error` set when the file cannot be probed.
  virtual bool Probe(const std::filesystem::path& media_path, MediaAttributes& attributes,
                     std::string& error) = 0;
};

} // namespace binpost::tools
