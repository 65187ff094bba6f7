#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"

#include <iostream>
#include <string>
#include <vector>

using binpost::tests::common::AssertContains;
using binpost::tests::common::AssertTrue;
using binpost::tests::common::DispatchCaptured;

namespace {

void ExpectExit(const std::vector<std::string>& argv, int expected, std::string_view needle) {
  std::string out;
  std::string err;
  const int exit_code = DispatchCaptured(argv, out, err);
  if (exit_code != expected) {
    std::string joined;
    for (const auto& arg : argv) {
      joined += arg + " ";
    }
    binpost::tests::common::Fail("unexpected exit code " + std::to_string(exit_code) + " for: " +
                                 joined + "\nstderr: " + err);
  }
  if (!needle.empty()) {
    AssertContains(out + err, needle);
  }
}

} // namespace

int main() {
  ExpectExit({"binpost"}, 2, "usage:");
  ExpectExit({"binpost", "frobnicate"}, 2, "unknown subcommand: frobnicate");
  ExpectExit({"binpost", "help"}, 0, "usage:");
  ExpectExit({"binpost", "--help"}, 0, "check-tools");

  ExpectExit({"binpost", "version"}, 0, "binpost 0.1.0");
  ExpectExit({"binpost", "version", "extra"}, 2, "does not accept arguments");

  ExpectExit({"binpost", "run"}, 2, "requires exactly 1 argument");
  ExpectExit({"binpost", "run", "a", "b"}, 2, "exactly 1 source path");
  ExpectExit({"binpost", "run", "a", "--bogus"}, 2, "unknown option: --bogus");
  ExpectExit({"binpost", "run", "a", "--redundancy", "0"}, 2, "between 1 and 100");
  ExpectExit({"binpost", "run", "a", "-r", "x"}, 2, "invalid value for --redundancy");
  ExpectExit({"binpost", "run", "a", "--backend", "zip"}, 2, "");
  ExpectExit({"binpost", "run", "a", "--post-size", "12Q"}, 2, "invalid value for --post-size");
  ExpectExit({"binpost", "run", "a", "--on-conflict", "merge"}, 2, "");
  ExpectExit({"binpost", "run", "a", "--manifest", ""}, 2, "template cannot be empty");
  ExpectExit({"binpost", "run", "a", "--log-level", "loud"}, 2, "invalid --log-level");
  ExpectExit({"binpost", "run", "a", "--report"}, 2, "missing value for --report");

  ExpectExit({"binpost", "check-tools", "--bogus"}, 2, "unknown option: --bogus");
  ExpectExit({"binpost", "check-tools", "--backend", "zip"}, 2, "");

  std::cout << "cli_usage_contract_smoke: ok\n";
  return 0;
}
