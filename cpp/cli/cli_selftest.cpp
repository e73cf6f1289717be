/*
  Fragment 7.0t — CLI Exit Code Selftest

  Objective
  ---------
  Framework-free checks that fusion_cli maps outcomes to its exit codes:
    0  help, converged solve
    1  bad arguments (unknown flag, out-of-range integers), unreadable
       input, configuration errors, missing required options
    2  infeasible point, clamped point solve

  Expected use
  ------------
    ./cli_selftest     (non-zero exit on failure)
*/

#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "cli/cli_app.hpp"
#include "engine/core/config.hpp"
#include "engine/core/point_inputs.hpp"
#include "engine/physics/point_evaluator.hpp"

namespace fusion::cli {
namespace {

static int g_fail_count = 0;

void expect_true(bool v, std::string_view msg) {
  if (!v) {
    ++g_fail_count;
    std::cerr << "[FAIL] " << msg << "\n";
  } else {
    std::cerr << "[ OK ] " << msg << "\n";
  }
}

int run_args(std::vector<std::string> args) {
  args.insert(args.begin(), "fusion_cli");
  std::vector<char*> argv;
  for (auto& s : args) argv.push_back(s.data());
  argv.push_back(nullptr);
  return run(static_cast<int>(args.size()), argv.data());
}

std::string exact(double v) {
  std::ostringstream os;
  os << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
  return os.str();
}

void test_ok() {
  expect_true(run_args({}) == 0, "no command prints help, exit 0");
  expect_true(run_args({"help"}) == 0, "help -> 0");

  const double P0 = physics::evaluate(PointInputs::reference(), EvalConfig::defaults()).Pfus_MW;
  expect_true(run_args({"solve", "--target", "Pfus_MW=" + exact(0.7 * P0), "--var", "fG=0.85:0.3:1.2"}) == 0,
              "converged solve -> 0");
}

void test_argument_errors() {
  expect_true(run_args({"launch"}) == 1, "unknown command -> 1");
  expect_true(run_args({"evaluate", "--bogus", "1"}) == 1, "unknown flag -> 1");
  expect_true(run_args({"evaluate", "--in"}) == 1, "flag without value -> 1");
  expect_true(run_args({"frontier", "--lever", "fG=0.3:1.0", "--n", "-1"}) == 1, "negative --n -> 1");
  expect_true(run_args({"frontier", "--lever", "fG=0.3:1.0", "--n", "4294967297"}) == 1,
              "--n above int range -> 1, not wrapped");
  expect_true(run_args({"frontier", "--lever", "fG=0.3:1.0", "--threads", "99999999999999999999"}) == 1,
              "--threads beyond long long -> 1");
  expect_true(run_args({"evaluate", "--pretty", "2"}) == 1, "--pretty outside 0|1 -> 1");
  expect_true(run_args({"solve-q"}) == 1, "solve-q without --q -> 1");
  expect_true(run_args({"frontier"}) == 1, "frontier without levers -> 1");
}

void test_runtime_errors() {
  expect_true(run_args({"evaluate", "--set", "not_a_field=1"}) == 1, "unknown input field -> 1");
  expect_true(run_args({"evaluate", "--scaling", "ipb2000"}) == 1, "unknown scaling -> 1");
  expect_true(run_args({"evaluate", "--in", "/nonexistent/fusion_inputs.json"}) == 1, "unreadable --in -> 1");
  expect_true(run_args({"solve", "--target", "Pfus_MW=1000", "--var", "fG=0.8:1.0:0.5"}) == 1,
              "inverted variable bounds -> 1");
}

void test_not_ok() {
  // The reference point fails the default limits (radial build, TBR).
  expect_true(run_args({"evaluate"}) == 2, "infeasible reference point -> 2");
  expect_true(run_args({"solve-q", "--q", "10000"}) == 2, "clamped Q solve -> 2");
}

}  // namespace
}  // namespace fusion::cli

int main() {
  using namespace fusion::cli;

  test_ok();
  test_argument_errors();
  test_runtime_errors();
  test_not_ok();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
