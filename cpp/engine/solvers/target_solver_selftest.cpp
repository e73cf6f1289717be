/*
  Fragment 4.2t — Target Solver + Point Solver Selftest

  Objective
  ---------
  Framework-free checks for solve_for_targets() and the canned point solves.
  Targets are taken from evaluations of known points, so every expected
  answer is exact up to solver tolerance:
    1) 1-D: Pfus target reached by moving fG (Pfus scales as fG^2).
    2) 2-D: (Pfus, Q) targets recover (fG, Paux).
    3) Targets equal to the start values return immediately.
    4) Unreachable target pinned at a bound reports bound_stall.
    5) solve_fG_for_Q brackets or clamps with aux flags.
    6) solve_Ip_for_H98_with_Q recovers (Ip, fG).
    7) Multistart falls through a failing start to one that converges.
    8) Continuation ladder tightens tolerance stage by stage.

  Expected use
  ------------
    ./target_solver_selftest     (non-zero exit on failure)
*/

#include <cmath>
#include <iostream>
#include <string_view>
#include <vector>

#include "engine/core/config.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/point_inputs.hpp"
#include "engine/physics/point_evaluator.hpp"
#include "engine/solvers/point_solver.hpp"
#include "engine/solvers/target_solver.hpp"

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

void test_single_target() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs base = PointInputs::reference();
  const double P0 = physics::evaluate(base, cfg).Pfus_MW;

  const std::vector<TargetSpec> t{{"Pfus_MW", 0.7 * P0}};
  const std::vector<VariableSpec> v{{"fG", 0.85, 0.3, 1.2}};
  const SolveResult r = solve_for_targets(base, t, v, cfg);

  expect_true(r.ok && r.message == "converged", "Pfus target converges");
  expect_true(std::fabs(r.inputs.fG - 0.85 * std::sqrt(0.7)) < 2e-3, "fG = 0.85 * sqrt(0.7)");
  expect_true(std::fabs(r.outputs.Pfus_MW - 0.7 * P0) <= 1e-3 * 0.7 * P0 * 1.0001,
              "achieved Pfus within tolerance");
  expect_true(r.residuals.size() == 1 && r.report.best_achieved.count("Pfus_MW") == 1,
              "report carries achieved value per target");
  expect_true(!r.trace.empty() && r.trace.size() == static_cast<size_t>(r.iterations),
              "one trace entry per iteration");
  expect_true(r.report.active_bounds.at("fG").empty(), "interior solution has no active bound");
  expect_true(r.inputs.Ip_MA == base.Ip_MA && r.inputs.Paux_MW == base.Paux_MW,
              "non-variable inputs untouched");
}

void test_two_targets() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs base = PointInputs::reference();
  const PointInputs truth = base.with({{"fG", 0.7}, {"Paux_MW", 30.0}});
  const OutputMap want = physics::evaluate(truth, cfg);

  const std::vector<TargetSpec> t{{"Pfus_MW", want.Pfus_MW}, {"Q_DT_eqv", want.Q_DT_eqv}};
  const std::vector<VariableSpec> v{{"fG", 0.85, 0.3, 1.2}, {"Paux_MW", 20.0, 5.0, 100.0}};
  const SolveResult r = solve_for_targets(base, t, v, cfg);

  expect_true(r.ok, "(Pfus, Q) solve converges");
  expect_true(std::fabs(r.inputs.fG - 0.7) < 5e-3, "recovers fG = 0.7");
  expect_true(std::fabs(r.inputs.Paux_MW - 30.0) < 0.2, "recovers Paux = 30");
  expect_true(r.inputs.fG >= 0.3 && r.inputs.fG <= 1.2 && r.inputs.Paux_MW >= 5.0 && r.inputs.Paux_MW <= 100.0,
              "result stays inside the box");
}

void test_idempotent_start() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs base = PointInputs::reference();
  const OutputMap out = physics::evaluate(base, cfg);

  const std::vector<TargetSpec> t{{"Pfus_MW", out.Pfus_MW}, {"Q_DT_eqv", out.Q_DT_eqv}};
  const std::vector<VariableSpec> v{{"fG", base.fG, 0.3, 1.2}, {"Paux_MW", base.Paux_MW, 5.0, 100.0}};
  const SolveResult r = solve_for_targets(base, t, v, cfg);

  expect_true(r.ok && r.iterations == 0, "matching start returns with zero iterations");
  expect_true(r.inputs.fG == base.fG && r.inputs.Paux_MW == base.Paux_MW, "matching start returns the start inputs");
  expect_true(r.trace.empty(), "no trace entries when nothing was iterated");
}

void test_dimension_mismatch() {
  const EvalConfig cfg = EvalConfig::defaults();
  const std::vector<TargetSpec> t{{"Pfus_MW", 1000.0}, {"Q_DT_eqv", 40.0}};
  const std::vector<VariableSpec> v{{"fG", 0.85, 0.3, 1.2}};
  const SolveResult r = solve_for_targets(PointInputs::reference(), t, v, cfg);
  expect_true(!r.ok, "2 targets / 1 variable -> ok = false");
  expect_true(r.message == "targets and variables must have same dimension", "mismatch message");
  expect_true(r.iterations == 0, "mismatch evaluates nothing");
}

void test_bad_problem() {
  const EvalConfig cfg = EvalConfig::defaults();
  bool unknown = false;
  try {
    (void)solve_for_targets(PointInputs::reference(), {{"Pfus_MW", 1000.0}}, {{"not_a_field", 1.0, 0.5, 2.0}}, cfg);
  } catch (const ConfigurationError&) {
    unknown = true;
  }
  expect_true(unknown, "unknown variable -> ConfigurationError");

  bool inverted = false;
  try {
    (void)solve_for_targets(PointInputs::reference(), {{"Pfus_MW", 1000.0}}, {{"fG", 0.8, 1.0, 0.5}}, cfg);
  } catch (const ConfigurationError&) {
    inverted = true;
  }
  expect_true(inverted, "lo > hi -> ConfigurationError");
}

void test_bound_stall() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs base = PointInputs::reference();
  const double P0 = physics::evaluate(base, cfg).Pfus_MW;

  // Needs fG ~ 1.47; the box stops at 0.9.
  const std::vector<TargetSpec> t{{"Pfus_MW", 3.0 * P0}};
  const std::vector<VariableSpec> v{{"fG", 0.85, 0.3, 0.9}};
  const SolveResult r = solve_for_targets(base, t, v, cfg);

  expect_true(!r.ok, "unreachable target -> ok = false");
  expect_true(r.message == "bound_stall", "pinned at a bound -> bound_stall");
  expect_true(r.inputs.fG == 0.9, "best point sits on the upper bound");
  expect_true(r.report.active_bounds.at("fG") == "hi", "active bound reported as hi");
  expect_true(r.residuals.size() == 1 && r.residuals[0] > 0.0, "residual sign: target above achieved");
}

void test_fG_for_Q() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs base = PointInputs::reference();
  const double Qt = physics::evaluate(base.with("fG", 0.7), cfg).Q_DT_eqv;

  const PointSolveResult r = solve_fG_for_Q(base, Qt, 0.3, 1.2, cfg);
  expect_true(r.ok && !r.clamped && r.method == "bisect", "bracketed Q target solves by bisection");
  expect_true(std::fabs(r.inputs.fG - 0.7) < 1e-3, "recovers fG = 0.7");
  expect_true(r.outputs.aux.count("solver_clamped_Q") == 1 && r.outputs.aux.at("solver_clamped_Q") == 0.0,
              "solver_clamped_Q = 0 on success");

  const PointSolveResult c = solve_fG_for_Q(base, 1.0e4, 0.3, 1.2, cfg);
  expect_true(c.ok && c.clamped, "unbracketed Q target clamps with ok = true");
  expect_true(c.clamped_on == "fG_hi" && c.inputs.fG == 1.2, "clamps to the upper fG bound");
  expect_true(c.outputs.aux.at("solver_clamped_Q") == 1.0 && c.outputs.aux.at("solver_clamped_Q_on") == 1.0,
              "clamp flags written to aux");
  expect_true(c.outputs.aux.at("Q_target") == 1.0e4, "aux carries Q_target");
  expect_true(std::fabs(c.outputs.aux.at("Q_residual") - (c.outputs.Q_DT_eqv - 1.0e4)) < 1e-6,
              "Q_residual = Q_at_bound - Q_target");

  bool bad = false;
  try {
    (void)solve_fG_for_Q(base, Qt, 0.0, 1.2, cfg);
  } catch (const ConfigurationError&) {
    bad = true;
  }
  expect_true(bad, "fG_lo = 0 -> ConfigurationError");
}

void test_Ip_for_H98_with_Q() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs base = PointInputs::reference();
  const OutputMap want = physics::evaluate(base.with({{"Ip_MA", 9.0}, {"fG", 0.8}}), cfg);

  const PointSolveResult r =
      solve_Ip_for_H98_with_Q(base, want.H98, want.Q_DT_eqv, 6.0, 12.0, 0.5, 1.1, cfg);
  expect_true(r.ok && !r.clamped, "(H98, Q) pair solves");
  expect_true(r.method == "coupled" || r.method == "nested_bisect", "method is reported");
  expect_true(std::fabs(r.inputs.Ip_MA - 9.0) < 0.05, "recovers Ip = 9");
  expect_true(std::fabs(r.inputs.fG - 0.8) < 0.01, "recovers fG = 0.8");
}

void test_multistart() {
  const PointInputs base = PointInputs::reference();
  EvalConfig cfg = EvalConfig::defaults();
  const double lo = 0.3;
  const double hi = 0.9;
  const double mid = 0.5 * (lo + hi);

  // One iteration cannot take fG from 0.3 to the target; the midpoint start
  // already matches it.
  cfg.solver.max_iter = 1;
  const std::vector<TargetSpec> t{{"Pfus_MW", physics::evaluate(base.with("fG", mid), cfg).Pfus_MW}};
  const std::vector<VariableSpec> v{{"fG", lo, lo, hi}};
  expect_true(!solve_for_targets(base, t, v, cfg).ok, "single start from the lower bound fails in 1 iteration");

  const MultistartResult ms = solve_for_targets_multistart(base, t, v, cfg);
  expect_true(ms.result.ok, "multistart converges");
  expect_true(ms.start_index == 1 && ms.starts_tried == 2, "second candidate (midpoint) wins");
  expect_true(ms.result.inputs.fG == mid && ms.result.iterations == 0, "midpoint start returned unchanged");

  const EvalConfig dflt = EvalConfig::defaults();
  const double P0 = physics::evaluate(base, dflt).Pfus_MW;
  const MultistartResult first =
      solve_for_targets_multistart(base, {{"Pfus_MW", 0.7 * P0}}, {{"fG", 0.85, 0.3, 1.2}}, dflt);
  expect_true(first.result.ok && first.start_index == 0 && first.starts_tried == 1,
              "converging x0 stops after the first start");

  // x0, midpoint and four diagonal points at k/5.
  const MultistartResult none =
      solve_for_targets_multistart(base, {{"Pfus_MW", 3.0 * P0}}, {{"fG", 0.85, 0.3, 0.9}}, dflt);
  expect_true(!none.result.ok && none.starts_tried == 6, "unreachable target tries every candidate");
  expect_true(std::fabs(none.result.inputs.fG - 0.9) < 1e-9, "best failed start sits on the upper bound");

  const MultistartResult capped =
      solve_for_targets_multistart(base, {{"Pfus_MW", 3.0 * P0}}, {{"fG", 0.85, 0.3, 0.9}}, dflt, 1);
  expect_true(capped.starts_tried == 2, "restarts below 2 still try x0 and the midpoint");

  const MultistartResult two = solve_for_targets_multistart(
      base, {{"Pfus_MW", 3.0 * P0}, {"Q_DT_eqv", 1e6}}, {{"fG", 0.85, 0.3, 0.9}, {"Paux_MW", 20.0, 5.0, 100.0}},
      dflt);
  expect_true(!two.result.ok && two.starts_tried == 8, "two variables: x0, midpoint, 4 corners, 2 interior");

  bool threw = false;
  try {
    (void)solve_for_targets_multistart(base, {{"Pfus_MW", 1.0}}, {{"no_such_field", 1.0, 0.0, 2.0}}, dflt);
  } catch (const ConfigurationError&) {
    threw = true;
  }
  expect_true(threw, "multistart validates the problem first");
}

void test_continuation() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs base = PointInputs::reference();
  const double P0 = physics::evaluate(base, cfg).Pfus_MW;

  const ContinuationResult c =
      solve_for_targets_continuation(base, {{"Pfus_MW", 0.7 * P0}}, {{"fG", 0.85, 0.3, 1.2}}, cfg);
  expect_true(c.result.ok, "continuation converges");
  expect_true(c.stages.size() == 3, "default ladder has three stages");
  expect_true(c.stages.size() == 3 && c.stages[0].tol == 1e-1 && c.stages[1].tol == 1e-2 &&
                  c.stages[2].tol == cfg.solver.tol,
              "ladder ends at the configured tolerance");
  expect_true(std::fabs(c.result.inputs.fG - 0.85 * std::sqrt(0.7)) < 2e-3, "final stage reaches the target");
  expect_true(!c.stages.empty() && c.stages.back().residual_norm <= c.stages.front().residual_norm,
              "later stages never lose accuracy");

  const ContinuationResult stop =
      solve_for_targets_continuation(base, {{"Pfus_MW", 3.0 * P0}}, {{"fG", 0.85, 0.3, 0.9}}, cfg);
  expect_true(!stop.result.ok && stop.stages.size() == 1, "first failed stage ends the ladder");

  bool threw = false;
  try {
    (void)solve_for_targets_continuation(base, {{"Pfus_MW", P0}}, {{"fG", 0.85, 0.3, 1.2}}, cfg, {{-1.0, 0}});
  } catch (const ConfigurationError&) {
    threw = true;
  }
  expect_true(threw, "non-positive stage tol -> ConfigurationError");
}

}  // namespace
}  // namespace fusion::solvers

int main() {
  using namespace fusion::solvers;

  test_single_target();
  test_two_targets();
  test_idempotent_start();
  test_dimension_mismatch();
  test_bad_problem();
  test_bound_stall();
  test_fG_for_Q();
  test_Ip_for_H98_with_Q();
  test_multistart();
  test_continuation();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
