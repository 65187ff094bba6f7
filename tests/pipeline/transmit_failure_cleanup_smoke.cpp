#include "../common/assertions.hpp"
#include "../common/fake_tools.hpp"
#include "../common/temp_dir.hpp"
#include "pipeline/pipeline_controller.hpp"

#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using namespace binpost;
using tests::common::AssertContains;
using tests::common::AssertExists;
using tests::common::AssertMissing;
using tests::common::AssertTrue;

int main() {
  const fs::path root = tests::common::CreateUniqueTempDir("binpost-transmit-fail");
  const fs::path source = tests::common::CreatePhotosFolder(root);
  const auto source_before = tests::common::SnapshotTree(source);

  tests::common::FakeToolset fakes = tests::common::MakeFakeToolset();
  fakes.transmit->exit_code = 1;
  fakes.transmit->write_partial_manifest = true;

  std::ostringstream log_stream;
  core::logging::Logger logger(core::logging::LogLevel::kInfo, log_stream);
  pipeline::PipelineController controller(tests::common::MakeRunConfig(source),
                                          std::move(fakes.tools), logger, [] { return false; });
  const pipeline::RunOutcome outcome = controller.Run();

  AssertTrue(outcome.status == pipeline::RunStatus::kFailure, "expected failure");
  AssertTrue(outcome.error_kind == pipeline::ErrorKind::kStage, "expected stage error");
  AssertTrue(outcome.failed_stage == stages::StageId::kTransmit, "transmit should fail");
  AssertContains(outcome.diagnostic, "fake-nyuu exited with code 1");
  AssertTrue(fakes.transmit->invocations == 1, "transmit should be attempted once");

  AssertMissing(root / "photos.rar");
  AssertMissing(root / "photos.par2");
  AssertMissing(root / "photos.vol00+01.par2");
  AssertMissing(root / "photos.vol01+02.par2");
  // The partial manifest was created by this run and goes too.
  AssertMissing(root / "photos.nzb");
  AssertExists(root / "photos.nfo");
  AssertTrue(tests::common::SnapshotTree(source) == source_before, "source folder changed");
  AssertTrue(controller.Transitions().back() == pipeline::PipelineState::kFailed,
             "run must end in failed");

  tests::common::RemovePathBestEffort(root);
  std::cout << "transmit_failure_cleanup_smoke: ok\n";
  return 0;
}
