/*
  Fragment 4.1t — Bracketed Bisection Selftest

  Objective
  ---------
  Framework-free checks for bisect():
    1) Monotonic f with a bracket converges to |f(x) - target| < tol.
    2) No bracket returns ok = false, x = lo, without throwing.
    3) Iteration exhaustion follows treat_exhaustion_as_success, both ways.
    4) A non-finite midpoint aborts with NonFiniteMidpoint.
    5) Non-monotonic f terminates inside the bracket.
    6) Residuals near the underflow limit keep their signs.

  Expected use
  ------------
    ./bisect_selftest     (non-zero exit on failure)
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string_view>

#include "engine/core/config.hpp"
#include "engine/core/numeric.hpp"
#include "engine/solvers/bisect.hpp"

namespace fusion::solvers {
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

void test_converges_on_monotonic() {
  const auto f = [](double x) { return x * x; };
  const BisectResult r = bisect(f, 0.0, 3.0, 4.0);
  expect_true(r.ok, "x^2 = 4 on [0,3] converges");
  expect_true(r.status == BisectStatus::Converged, "status is Converged");
  expect_true(std::fabs(f(r.x) - 4.0) < 1e-4, "|f(x) - target| < tol");
  expect_true(std::fabs(r.residual) < 1e-4, "reported residual is below tol");

  // Decreasing function, same contract.
  const auto g = [](double x) { return 10.0 - 2.0 * x; };
  const BisectResult rg = bisect(g, 0.0, 5.0, 3.0);
  expect_true(rg.ok && std::fabs(rg.x - 3.5) < 1e-4, "decreasing f converges to 3.5");
}

void test_endpoint_root() {
  const auto f = [](double x) { return x - 1.0; };
  const BisectResult r = bisect(f, 1.0, 2.0, 0.0);
  expect_true(r.ok && r.x == 1.0 && r.iterations == 0, "exact root at lo returns lo");
  const BisectResult r2 = bisect(f, 0.0, 1.0, 0.0);
  expect_true(r2.ok && r2.x == 1.0, "exact root at hi returns hi");
}

void test_no_bracket() {
  const auto f = [](double x) { return x * x; };
  const BisectResult r = bisect(f, 3.0, 5.0, 4.0);
  expect_true(!r.ok, "no bracket -> ok = false");
  expect_true(r.status == BisectStatus::NoBracket, "no bracket -> NoBracket");
  expect_true(r.x == 3.0, "no bracket -> x = lo");

  const auto nan_end = [](double x) { return x > 1.0 ? std::numeric_limits<double>::quiet_NaN() : x; };
  const BisectResult rn = bisect(nan_end, 0.0, 2.0, 0.5);
  expect_true(!rn.ok && rn.status == BisectStatus::NoBracket, "non-finite endpoint -> NoBracket");
}

void test_exhaustion_policy() {
  const auto f = [](double x) { return x * x * x; };

  BisectOptions lenient;
  lenient.tol = 1e-300;
  lenient.max_iter = 5;
  lenient.treat_exhaustion_as_success = true;
  const BisectResult a = bisect(f, 0.0, 3.0, 2.0, lenient);
  expect_true(a.status == BisectStatus::Exhausted, "5 iterations at tol 1e-300 exhausts");
  expect_true(a.iterations == 5, "exhausted run used max_iter iterations");
  expect_true(a.ok, "exhaustion counts as success when the policy says so");

  BisectOptions strict = lenient;
  strict.treat_exhaustion_as_success = false;
  const BisectResult b = bisect(f, 0.0, 3.0, 2.0, strict);
  expect_true(b.status == BisectStatus::Exhausted, "strict policy still reports Exhausted");
  expect_true(!b.ok, "exhaustion is a failure under the strict policy");
  expect_true(a.x == b.x, "policy does not change the returned midpoint");

  RootFindSettings rs;
  rs.treat_exhaustion_as_success = false;
  rs.max_iter = 7;
  const BisectOptions from = BisectOptions::from(rs);
  expect_true(!from.treat_exhaustion_as_success && from.max_iter == 7 && from.tol == rs.tol,
              "BisectOptions::from copies RootFindSettings");
}

void test_nonfinite_midpoint() {
  // First midpoint of [0, 3] is 1.5.
  const auto f = [](double x) { return x == 1.5 ? std::numeric_limits<double>::quiet_NaN() : x - 2.0; };
  const BisectResult r = bisect(f, 0.0, 3.0, 0.0);
  expect_true(!r.ok, "NaN midpoint -> ok = false");
  expect_true(r.status == BisectStatus::NonFiniteMidpoint, "NaN midpoint -> NonFiniteMidpoint");
  expect_true(r.x == 1.5 && r.iterations == 1, "aborts at the offending midpoint");
}

void test_non_monotonic_terminates() {
  const auto f = [](double x) { return std::sin(x); };
  const double lo = 0.5;
  const double hi = 3.0 * kPi + 0.5;   // roots at pi, 2 pi, 3 pi

  const BisectResult r = bisect(f, lo, hi, 0.0);
  expect_true(r.status == BisectStatus::Converged || r.status == BisectStatus::Exhausted,
              "sin over three roots returns Converged or Exhausted");
  expect_true(r.x >= lo && r.x <= hi, "sin: x stays inside [lo, hi]");
  const double k = std::round(r.x / kPi);
  expect_true(r.status != BisectStatus::Converged || std::fabs(r.x - k * kPi) < 1e-3,
              "sin: a converged x sits on one of the roots");

  BisectOptions never;
  never.tol = 1e-300;
  never.max_iter = 200;
  const BisectResult e = bisect(f, lo, hi, 0.0, never);
  expect_true(e.status == BisectStatus::Exhausted || e.status == BisectStatus::Converged,
              "unreachable tol on sin still terminates");
  expect_true(e.iterations <= 200 && e.x >= lo && e.x <= hi, "unreachable tol: bounded iterations, x in bracket");
  expect_true(std::isfinite(e.residual), "unreachable tol: residual is finite");

  const auto bowl = [](double x) { return x * x - 1.0; };
  const BisectResult b = bisect(bowl, -2.0, 2.0, 0.0);
  expect_true(!b.ok && b.status == BisectStatus::NoBracket && b.x == -2.0,
              "even number of roots: same-sign ends -> NoBracket");
}

void test_tiny_residual_signs() {
  // Products of these residuals underflow to zero.
  const auto pos = [](double x) { return 1e-170 * (x + 1.0); };
  const BisectResult r = bisect(pos, 0.0, 1.0, 0.0);
  expect_true(!r.ok && r.status == BisectStatus::NoBracket, "tiny same-sign residuals are not a bracket");

  const auto lin = [](double x) { return 1e-170 * (x - 0.3); };
  BisectOptions opt;
  opt.tol = 1e-300;
  const BisectResult t = bisect(lin, 0.0, 1.0, 0.0, opt);
  expect_true(std::fabs(t.x - 0.3) < 1e-12, "tiny residuals still steer toward the root");
}

}  // namespace
}  // namespace fusion::solvers

int main() {
  using namespace fusion::solvers;

  test_converges_on_monotonic();
  test_endpoint_root();
  test_no_bracket();
  test_exhaustion_policy();
  test_nonfinite_midpoint();
  test_non_monotonic_terminates();
  test_tiny_residual_signs();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
