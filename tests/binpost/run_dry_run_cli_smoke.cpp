#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <iostream>
#include <string>

namespace fs = std::filesystem;
using binpost::tests::common::AssertContains;
using binpost::tests::common::AssertNotContains;
using binpost::tests::common::AssertTrue;
using binpost::tests::common::DispatchCaptured;
using binpost::tests::common::WriteFile;

int main() {
  const fs::path root = binpost::tests::common::CreateUniqueTempDir("binpost-cli-dry-run");
  const fs::path source = root / "photos";
  WriteFile(source / "a.jpg", "a");
  WriteFile(source / "b.jpg", "b");
  const auto tree_before = binpost::tests::common::SnapshotTree(root);

  // Nothing is transmitted, so no credential file is needed.
  {
    std::string out;
    std::string err;
    const int exit_code = DispatchCaptured(
        {"binpost", "run", source.string(), "--dry-run", "--skip-transmit"}, out, err);
    AssertTrue(exit_code == 0, "dry-run with skip-transmit should exit 0, stderr: " + err);
    AssertContains(out, "status: partial (dry-run)");
    AssertContains(out, "source: photos");
    AssertContains(out, "stage archive");
    AssertContains(out, "simulated");
    AssertNotContains(out, "group:");
    AssertContains(err, "msg=\"run started\"");
  }

  // A named credential file that does not exist is a configuration error.
  {
    std::string out;
    std::string err;
    const int exit_code =
        DispatchCaptured({"binpost", "run", source.string(), "--dry-run", "--env-file",
                          (root / "missing.env").string()},
                         out, err);
    AssertTrue(exit_code == 10, "missing credential file should exit 10");
    AssertContains(err, "unable to open credential file");
  }

  // Placeholder credentials copied from the example file are rejected.
  {
    const fs::path env = root / "config" / "example.env";
    WriteFile(env, "NNTP_HOST=news.example.com\nNNTP_PORT=563\nNNTP_USER=your_username\n"
                   "NNTP_PASS=secret\n");
    std::string out;
    std::string err;
    const int exit_code = DispatchCaptured(
        {"binpost", "run", source.string(), "--dry-run", "--env-file", env.string()}, out, err);
    AssertTrue(exit_code == 10, "placeholder credentials should exit 10");
    AssertContains(err, "example value for NNTP_HOST");
    fs::remove_all(root / "config");
  }

  AssertTrue(binpost::tests::common::SnapshotTree(root) == tree_before,
             "dry-run must not change the tree");

  // Full dry-run with credentials and a JSON report.
  {
    const fs::path env = root / "settings" / "server.env";
    WriteFile(env, "# test server\nNNTP_HOST=news.test.invalid\nNNTP_PORT=563\n"
                   "NNTP_USER=tester\nNNTP_PASS='p@ss word'\nUSENET_GROUP=alt.binaries.test\n");
    const fs::path report = root / "reports" / "run.json";
    std::string out;
    std::string err;
    const int exit_code = DispatchCaptured({"binpost", "run", source.string(), "--dry-run",
                                            "--env-file", env.string(), "--report",
                                            report.string(), "-s", "Holiday Photos"},
                                           out, err);
    AssertTrue(exit_code == 0, "full dry-run should exit 0, stderr: " + err);
    AssertContains(out, "status: success (dry-run)");
    AssertContains(out, "subject: Holiday Photos");
    AssertContains(out, "group: alt.binaries.test");
    AssertNotContains(out + err, "p@ss word");

    const std::string json = binpost::tests::common::ReadFileToString(report);
    AssertContains(json, "\"status\":\"success\"");
    AssertContains(json, "\"dry_run\":true");
    AssertContains(json, "\"final_state\":\"done\"");
    AssertContains(json, "\"existing_files\":[]");
    AssertTrue(!json.empty() && json.back() == '\n', "report ends with a newline");
    binpost::tests::common::AssertMissing(root / "photos.nfo");
    binpost::tests::common::AssertMissing(root / "photos.rar");
  }

  binpost::tests::common::RemovePathBestEffort(root);
  std::cout << "run_dry_run_cli_smoke: ok\n";
  return 0;
}
