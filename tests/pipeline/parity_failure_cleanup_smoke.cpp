#include "../common/assertions.hpp"
#include "../common/fake_tools.hpp"
#include "../common/temp_dir.hpp"
#include "pipeline/pipeline_controller.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using namespace binpost;
using tests::common::AssertContains;
using tests::common::AssertExists;
using tests::common::AssertMissing;
using tests::common::AssertTrue;

namespace {

pipeline::RunOutcome RunWithFailingParity(const fs::path& source, bool keep_files,
                                          tests::common::FakeToolset& fakes) {
  fakes.parity->exit_code = 2;
  config::RunConfiguration config = tests::common::MakeRunConfig(source);
  config.keep_intermediate_files = keep_files;

  std::ostringstream log_stream;
  core::logging::Logger logger(core::logging::LogLevel::kInfo, log_stream);
  pipeline::PipelineController controller(config, std::move(fakes.tools), logger, [] {
    return false;
  });
  return controller.Run();
}

void ExpectParityFailure(const pipeline::RunOutcome& outcome,
                         const tests::common::FakeToolset& fakes) {
  AssertTrue(outcome.status == pipeline::RunStatus::kFailure, "expected failure");
  AssertTrue(outcome.error_kind == pipeline::ErrorKind::kStage, "expected stage error");
  AssertTrue(outcome.failed_stage == stages::StageId::kParity, "parity should be the failed stage");
  AssertContains(outcome.diagnostic, "fake-parpar exited with code 2");
  AssertTrue(outcome.stages.size() == 2U, "archive and parity results expected");
  AssertTrue(fakes.transmit->invocations == 0, "transmit must never run after parity failure");
}

} // namespace

int main() {
  // Default: every artifact of the failed run is removed.
  {
    const fs::path root = tests::common::CreateUniqueTempDir("binpost-parity-fail");
    const fs::path source = tests::common::CreatePhotosFolder(root);
    const auto source_before = tests::common::SnapshotTree(source);
    tests::common::FakeToolset fakes = tests::common::MakeFakeToolset();

    const pipeline::RunOutcome outcome = RunWithFailingParity(source, false, fakes);
    ExpectParityFailure(outcome, fakes);
    AssertMissing(root / "photos.rar");
    AssertMissing(root / "photos.par2");
    AssertMissing(root / "photos.vol00+01.par2");
    AssertExists(root / "photos.nfo");
    AssertTrue(tests::common::SnapshotTree(source) == source_before, "source folder changed");
    AssertTrue(outcome.existing_files.size() == 1U &&
                   outcome.existing_files.front().filename() == "photos.nfo",
               "only the descriptor should remain");
    tests::common::RemovePathBestEffort(root);
  }

  // keep-files: partial artifacts stay for inspection and are reported.
  {
    const fs::path root = tests::common::CreateUniqueTempDir("binpost-parity-keep");
    const fs::path source = tests::common::CreatePhotosFolder(root);
    tests::common::FakeToolset fakes = tests::common::MakeFakeToolset();

    const pipeline::RunOutcome outcome = RunWithFailingParity(source, true, fakes);
    ExpectParityFailure(outcome, fakes);
    AssertExists(root / "photos.rar");
    AssertExists(root / "photos.par2");
    AssertExists(root / "photos.vol00+01.par2");
    const auto reported = [&outcome](const std::string& name) {
      return std::any_of(outcome.existing_files.begin(), outcome.existing_files.end(),
                         [&name](const fs::path& p) { return p.filename() == name; });
    };
    AssertTrue(reported("photos.rar"), "kept archive must be reported");
    AssertTrue(reported("photos.par2"), "kept parity index must be reported");
    tests::common::RemovePathBestEffort(root);
  }

  std::cout << "parity_failure_cleanup_smoke: ok\n";
  return 0;
}
