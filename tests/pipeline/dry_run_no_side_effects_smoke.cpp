#include "../common/assertions.hpp"
#include "../common/fake_tools.hpp"
#include "../common/temp_dir.hpp"
#include "pipeline/pipeline_controller.hpp"

#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using namespace binpost;
using tests::common::AssertMissing;
using tests::common::AssertTrue;

int main() {
  const fs::path root = tests::common::CreateUniqueTempDir("binpost-dry-run");
  const fs::path source = tests::common::CreatePhotosFolder(root);
  const auto tree_before = tests::common::SnapshotTree(root);

  tests::common::FakeToolset fakes = tests::common::MakeFakeToolset();
  // Availability is not checked in dry-run.
  fakes.archive->available = false;
  fakes.parity->available = false;
  fakes.transmit->available = false;

  config::RunConfiguration config = tests::common::MakeRunConfig(source);
  config.dry_run = true;

  std::ostringstream log_stream;
  core::logging::Logger logger(core::logging::LogLevel::kDebug, log_stream);
  pipeline::PipelineController controller(config, std::move(fakes.tools), logger, [] {
    return false;
  });
  const pipeline::RunOutcome outcome = controller.Run();

  AssertTrue(outcome.status == pipeline::RunStatus::kSuccess, "dry-run should succeed");
  AssertTrue(outcome.dry_run, "outcome must be flagged as dry-run");
  AssertTrue(outcome.stages.size() == 3U, "expected three simulated stages");
  for (const auto& stage : outcome.stages) {
    AssertTrue(stage.status == stages::StageStatus::kSucceeded && stage.simulated,
               std::string("stage not simulated: ") + stages::ToString(stage.stage));
    AssertTrue(stage.created.empty(), "simulated stage reported created files");
  }
  AssertTrue(outcome.stages[0].outputs.size() == 1U &&
                 outcome.stages[0].outputs[0].filename() == "photos.rar",
             "archive prediction");
  AssertTrue(outcome.stages[1].outputs.size() == 1U &&
                 outcome.stages[1].outputs[0].filename() == "photos.par2",
             "parity prediction");
  AssertTrue(outcome.manifest_path.filename() == "photos.nzb", "default manifest template");

  AssertTrue(fakes.archive->invocations == 0, "archive tool invoked in dry-run");
  AssertTrue(fakes.parity->invocations == 0, "parity tool invoked in dry-run");
  AssertTrue(fakes.transmit->invocations == 0, "transmit tool invoked in dry-run");
  AssertTrue(fakes.probe->invocations == 0, "media probe invoked in dry-run");

  AssertTrue(outcome.descriptor_path.has_value(), "descriptor path should be predicted");
  AssertMissing(outcome.descriptor_path.value());
  AssertTrue(outcome.existing_files.empty(), "dry-run must report no files");
  AssertTrue(tests::common::SnapshotTree(root) == tree_before, "dry-run touched the disk");

  tests::common::RemovePathBestEffort(root);
  std::cout << "dry_run_no_side_effects_smoke: ok\n";
  return 0;
}
