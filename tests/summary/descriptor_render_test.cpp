#include "summary/metadata_summarizer.hpp"

#include <catch2/catch.hpp>

#include <limits>
#include <string>

using namespace binpost;

TEST_CASE("Probe paths are reduced to bare file names", "[summary][descriptor]") {
  REQUIRE(summary::BareFileName("/srv/media/clip.mkv") == "clip.mkv");
  REQUIRE(summary::BareFileName("C:\\Users\\someone\\clip.mkv") == "clip.mkv");
  REQUIRE(summary::BareFileName("clip.mkv") == "clip.mkv");
  REQUIRE(summary::BareFileName("/srv/media/").empty());
}

TEST_CASE("Media detection is extension based and case-insensitive", "[summary][descriptor]") {
  REQUIRE(summary::IsMediaFile("clip.MKV"));
  REQUIRE(summary::IsMediaFile("/a/b/song.flac"));
  REQUIRE_FALSE(summary::IsMediaFile("notes.txt"));
  REQUIRE_FALSE(summary::IsMediaFile("mkv"));
}

TEST_CASE("Descriptor path defaults to the source parent", "[summary][descriptor]") {
  config::DescriptorSettings settings;
  REQUIRE(summary::DescriptorPathFor("/data/photos", settings) ==
          std::filesystem::path("/data/photos.nfo"));
  settings.output_dir = "/descriptors";
  REQUIRE(summary::DescriptorPathFor("/data/photos", settings) ==
          std::filesystem::path("/descriptors/photos.nfo"));
}

TEST_CASE("Folder descriptors list contents and media", "[summary][descriptor]") {
  summary::DescriptorContent content;
  content.name = "holiday";
  content.is_folder = true;

  summary::DescriptorEntry clip;
  clip.relative_path = "day1/clip.mkv";
  clip.size_bytes = 1536;
  tools::MediaAttributes media;
  media.complete_name = "clip.mkv";
  media.duration_seconds = 3725.4;
  media.width = 1280U;
  media.height = 720U;
  media.video_codec = "hevc";
  media.bit_rate = 4500000U;
  clip.media = media;

  summary::DescriptorEntry notes;
  notes.relative_path = "notes.txt";
  notes.size_bytes = 10;
  content.entries = {clip, notes};

  const std::string text = summary::RenderDescriptor(content);
  REQUIRE(text.rfind(std::string(summary::kDefaultBanner) + "\n\n", 0) == 0U);
  REQUIRE(text.find("Name: holiday\n") != std::string::npos);
  REQUIRE(text.find("Type: folder\n") != std::string::npos);
  REQUIRE(text.find("Files: 2\n") != std::string::npos);
  REQUIRE(text.find("Total size: 1.51 KiB (1546 bytes)\n") != std::string::npos);
  REQUIRE(text.find("\nContents:\n  day1/clip.mkv  1.50 KiB\n  notes.txt  10 B\n") !=
          std::string::npos);
  REQUIRE(text.find("\nMedia:\n  day1/clip.mkv\n") != std::string::npos);
  REQUIRE(text.find("    Duration: 01:02:05\n") != std::string::npos);
  REQUIRE(text.find("    Resolution: 1280x720\n") != std::string::npos);
  REQUIRE(text.find("    Video codec: hevc\n") != std::string::npos);
  REQUIRE(text.find("Audio codec") == std::string::npos);
  REQUIRE(text.find("    Bit rate: 4500 kb/s\n") != std::string::npos);
}

TEST_CASE("Single-file descriptors skip the content listing", "[summary][descriptor]") {
  summary::DescriptorContent content;
  content.banner = "custom banner";
  content.name = "readme";
  summary::DescriptorEntry entry;
  entry.relative_path = "readme.txt";
  entry.size_bytes = 0;
  content.entries = {entry};

  const std::string text = summary::RenderDescriptor(content);
  REQUIRE(text.rfind("custom banner\n\n", 0) == 0U);
  REQUIRE(text.find("Type: file\n") != std::string::npos);
  REQUIRE(text.find("Contents:") == std::string::npos);
  REQUIRE(text.find("Media:") == std::string::npos);
  REQUIRE(text.find("Total size: 0 B (0 bytes)\n") != std::string::npos);
}

TEST_CASE("Out-of-range durations never reach the clock format", "[summary][descriptor]") {
  summary::DescriptorContent content;
  content.name = "clip";
  summary::DescriptorEntry entry;
  entry.relative_path = "clip.mkv";
  tools::MediaAttributes media;
  media.video_codec = "h264";

  media.duration_seconds = std::numeric_limits<double>::quiet_NaN();
  entry.media = media;
  content.entries = {entry};
  std::string text = summary::RenderDescriptor(content);
  REQUIRE(text.find("Duration:") == std::string::npos);
  REQUIRE(text.find("    Video codec: h264\n") != std::string::npos);

  media.duration_seconds = 1.0e300;
  entry.media = media;
  content.entries = {entry};
  text = summary::RenderDescriptor(content);
  REQUIRE(text.find("    Duration: 277777:46:40\n") != std::string::npos);
}
