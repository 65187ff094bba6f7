#include "../common/assertions.hpp"
#include "../common/fake_tools.hpp"
#include "../common/temp_dir.hpp"
#include "summary/metadata_summarizer.hpp"

#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using namespace binpost;
using tests::common::AssertContains;
using tests::common::AssertMissing;
using tests::common::AssertNotContains;
using tests::common::AssertTrue;
using tests::common::WriteFile;

int main() {
  const fs::path root = tests::common::CreateUniqueTempDir("binpost-summarizer");
  const fs::path source = root / "holiday";
  WriteFile(source / "clip.mp4", "0123456789");
  WriteFile(source / "notes.txt", "hello");
  WriteFile(source / "extras" / "song.FLAC", "abc");

  std::ostringstream log_stream;
  core::logging::Logger logger(core::logging::LogLevel::kDebug, log_stream);

  tests::common::FakeMediaProbe probe;
  probe.attributes.duration_seconds = 61.0;
  probe.attributes.audio_codec = "aac";
  probe.attributes.bit_rate = 128000U;

  config::DescriptorSettings settings;
  settings.banner = "** holiday upload **";

  summary::MetadataSummarizer summarizer(&probe, logger);
  const summary::SummaryResult result = summarizer.Summarize(source, settings, false);
  AssertTrue(result.descriptor_path.has_value(), "descriptor should be written");
  AssertTrue(result.descriptor_path.value() == root / "holiday.nfo", "descriptor location");
  AssertTrue(probe.invocations == 2, "only media files are probed");

  const std::string text = tests::common::ReadFileToString(root / "holiday.nfo");
  AssertContains(text, "** holiday upload **");
  AssertContains(text, "Name: holiday");
  AssertContains(text, "Type: folder");
  AssertContains(text, "Files: 3");
  AssertContains(text, "Total size: 18 B (18 bytes)");
  AssertContains(text, "  extras/song.FLAC  3 B");
  AssertContains(text, "Complete name: clip.mp4");
  AssertContains(text, "Audio codec: aac");
  AssertContains(text, "Bit rate: 128 kb/s");
  AssertNotContains(text, root.string());

  AssertNotContains(log_stream.str(), "descriptor replaces an existing file");

  // Regenerating yields the same bytes, and replacing the earlier file is
  // reported.
  summary::MetadataSummarizer again(&probe, logger);
  again.Summarize(source, settings, false);
  AssertTrue(tests::common::ReadFileToString(root / "holiday.nfo") == text,
             "descriptor must be deterministic");
  AssertContains(log_stream.str(), "level=WARN");
  AssertContains(log_stream.str(), "msg=\"descriptor replaces an existing file\"");

  // Probe failures degrade to a descriptor without media attributes.
  {
    tests::common::FakeMediaProbe failing;
    failing.fail = true;
    summary::MetadataSummarizer degraded(&failing, logger);
    config::DescriptorSettings other = settings;
    other.output_dir = root / "out";
    const summary::SummaryResult degraded_result = degraded.Summarize(source, other, false);
    AssertTrue(degraded_result.descriptor_path == root / "out" / "holiday.nfo",
               "descriptor honors the output directory");
    const std::string degraded_text = tests::common::ReadFileToString(root / "out" / "holiday.nfo");
    AssertNotContains(degraded_text, "Media:");
    AssertContains(log_stream.str(), "media probe failed");
  }

  // An unavailable probe is checked once and never invoked.
  {
    tests::common::FakeMediaProbe missing;
    missing.available = false;
    summary::MetadataSummarizer degraded(&missing, logger);
    config::DescriptorSettings other = settings;
    other.output_dir = root / "out2";
    degraded.Summarize(source, other, false);
    AssertTrue(missing.invocations == 0, "unavailable probe must not be called");
    AssertContains(log_stream.str(), "media probe unavailable");
  }

  // Dry-run predicts the path and writes nothing.
  {
    config::DescriptorSettings other = settings;
    other.output_dir = root / "dry";
    summary::MetadataSummarizer dry(&probe, logger);
    const summary::SummaryResult dry_result = dry.Summarize(source, other, true);
    AssertTrue(dry_result.simulated, "dry-run result is simulated");
    AssertMissing(root / "dry" / "holiday.nfo");
  }

  // Never writes into the folder being described.
  {
    config::DescriptorSettings inside = settings;
    inside.output_dir = source;
    summary::MetadataSummarizer guard(&probe, logger);
    const summary::SummaryResult inside_result = guard.Summarize(source, inside, false);
    AssertTrue(!inside_result.descriptor_path.has_value(), "descriptor inside source refused");
    AssertMissing(source / "holiday.nfo");
  }

  tests::common::RemovePathBestEffort(root);
  std::cout << "metadata_summarizer_smoke: ok\n";
  return 0;
}
