#pragma once

#include "tools/media_probe.hpp"

#include <string>
#include <vector>

namespace binpost::tools {

// Media attributes via `ffprobe` in its sectioned key=value output format.
class FfprobeMediaProbe final : public IMediaProbe {
public:
  explicit FfprobeMediaProbe(std::string executable = "ffprobe");

  std::string Name() const override { return executable_; }
  bool Available() const override;
  bool Probe(const std::filesystem::path& media_path, MediaAttributes& attributes,
             std::string& error) override;

  std::string BuildCommand(const std::filesystem::path& media_path) const;

private:
  std::string executable_;
};

// Parses `[STREAM]`/`[FORMAT]` sections of `ffprobe -of default` output. The
// first video stream supplies codec and resolution; the first audio stream
// supplies the audio codec. "N/A" values are treated as absent. Fails when
// neither a stream nor a format section was found.
bool ParseFfprobeOutput(const std::vector<std::string>& lines, MediaAttributes& attributes,
                        std::string& error);

} // namespace binpost::tools
