#include "../common/assertions.hpp"
#include "../common/fake_tools.hpp"
#include "../common/temp_dir.hpp"
#include "pipeline/pipeline_controller.hpp"

#include <iostream>

namespace fs = std::filesystem;
using namespace binpost;
using tests::common::AssertContains;
using tests::common::AssertTrue;
using tests::common::RunWithFakes;

namespace {

void ExpectValidationFailure(const pipeline::RunOutcome& outcome, std::string_view needle,
                             const tests::common::FakeToolset& fakes) {
  AssertTrue(outcome.status == pipeline::RunStatus::kFailure, "expected failure");
  AssertTrue(outcome.error_kind == pipeline::ErrorKind::kValidation,
             "expected validation error kind");
  AssertContains(outcome.diagnostic, needle);
  AssertTrue(outcome.stages.empty(), "no stage may run after a validation failure");
  AssertTrue(fakes.archive->invocations == 0 && fakes.transmit->invocations == 0,
             "no tool may run after a validation failure");
}

} // namespace

int main() {
  const fs::path root = tests::common::CreateUniqueTempDir("binpost-init-validation");
  const fs::path source = tests::common::CreatePhotosFolder(root);
  const auto tree_before = tests::common::SnapshotTree(root);

  {
    tests::common::FakeToolset fakes = tests::common::MakeFakeToolset();
    const pipeline::RunOutcome outcome =
        RunWithFakes(tests::common::MakeRunConfig(root / "missing"), fakes);
    ExpectValidationFailure(outcome, "source path does not exist", fakes);
  }
  {
    tests::common::FakeToolset fakes = tests::common::MakeFakeToolset();
    config::RunConfiguration config = tests::common::MakeRunConfig(source);
    config.redundancy_percent = 0;
    ExpectValidationFailure(RunWithFakes(config, fakes), "redundancy", fakes);
  }
  {
    tests::common::FakeToolset fakes = tests::common::MakeFakeToolset();
    config::RunConfiguration config = tests::common::MakeRunConfig(source);
    config.credentials.password.clear();
    ExpectValidationFailure(RunWithFakes(config, fakes), "credentials are incomplete", fakes);
  }
  {
    tests::common::FakeToolset fakes = tests::common::MakeFakeToolset();
    fakes.transmit->available = false;
    ExpectValidationFailure(RunWithFakes(tests::common::MakeRunConfig(source), fakes),
                            "required tool not found on PATH: fake-nyuu", fakes);
  }
  {
    // Skipping transmission needs neither nyuu nor credentials.
    tests::common::FakeToolset fakes = tests::common::MakeFakeToolset();
    fakes.transmit->available = false;
    config::RunConfiguration config = tests::common::MakeRunConfig(source);
    config.skip_transmit = true;
    config.credentials = config::TransmitCredentials{};
    config.keep_intermediate_files = false;
    const pipeline::RunOutcome outcome = RunWithFakes(config, fakes);
    AssertTrue(outcome.status == pipeline::RunStatus::kPartial,
               "skip-transmit run should be partial");
    // Nothing was sent, so the archive and parity set stay.
    tests::common::AssertExists(root / "photos.rar");
    tests::common::AssertExists(root / "photos.par2");
    AssertTrue(outcome.existing_files.size() >= 2U, "kept intermediates must be reported");
    tests::common::RemovePathBestEffort(root / "photos.rar");
    tests::common::RemovePathBestEffort(root / "photos.par2");
    tests::common::RemovePathBestEffort(root / "photos.vol00+01.par2");
    tests::common::RemovePathBestEffort(root / "photos.vol01+02.par2");
    tests::common::RemovePathBestEffort(root / "photos.nfo");
  }
  {
    tests::common::FakeToolset fakes = tests::common::MakeFakeToolset();
    fakes.parity->backend = config::ParityBackend::kPar2;
    ExpectValidationFailure(RunWithFakes(tests::common::MakeRunConfig(source), fakes),
                            "does not match backend 'parpar'", fakes);
  }
  {
    tests::common::FakeToolset fakes = tests::common::MakeFakeToolset();
    config::RunConfiguration config = tests::common::MakeRunConfig(source);
    config.manifest_path_template = "photos/{name}.nzb";
    ExpectValidationFailure(RunWithFakes(config, fakes), "inside the source folder", fakes);
  }

  AssertTrue(tests::common::SnapshotTree(root) == tree_before,
             "validation failures must not touch the disk");
  tests::common::RemovePathBestEffort(root);
  std::cout << "init_validation_smoke: ok\n";
  return 0;
}
