/*
  Fragment 5.1t — Nearest-Feasible Search Selftest

  Objective
  ---------
  Framework-free checks for find_nearest_feasible() against a one-limit table
  (Pfus_MW <= cap). Pfus scales as fG^2 at fixed Ip, so the feasible set along
  an fG lever is known exactly:
    1) A feasible base returns already_feasible with distance 0.
    2) The best sample is feasible and no feasible sample is closer.
    3) Same seed -> same report, for any thread count.
    4) No feasible sample -> base returned plus the least violating sample.
    5) Probe ordering and bad levers.

  Expected use
  ------------
    ./nearest_feasible_selftest     (non-zero exit on failure)
*/

#include <cmath>
#include <iostream>
#include <string_view>
#include <vector>

#include "engine/constraints/limits.hpp"
#include "engine/core/config.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/point_inputs.hpp"
#include "engine/frontier/nearest_feasible.hpp"
#include "engine/physics/eval_cache.hpp"
#include "engine/physics/point_evaluator.hpp"

namespace fusion::frontier {
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

FrontierOptions pfus_cap(double cap) {
  FrontierOptions o;
  o.limits = constraints::LimitTable{constraints::LimitSpec{
      "pfus_cap", "test", "Pfus_MW", constraints::LimitSense::LessEq, cap, constraints::Severity::Hard, "MW", ""}};
  return o;
}

double base_pfus(const EvalConfig& cfg) {
  return physics::evaluate(PointInputs::reference(), cfg).Pfus_MW;
}

EvalConfig sampling_config(int n_random, int n_threads) {
  EvalConfig cfg = EvalConfig::defaults();
  cfg.frontier.n_random = n_random;
  cfg.frontier.n_threads = n_threads;
  cfg.frontier.seed = 42;
  return cfg;
}

void test_already_feasible() {
  const EvalConfig cfg = sampling_config(50, 1);
  const double P0 = base_pfus(cfg);
  const FrontierReport r =
      find_nearest_feasible(PointInputs::reference(), {{"fG", 0.3, 1.0}}, {}, cfg, pfus_cap(2.0 * P0));
  expect_true(r.ok && r.base_feasible, "feasible base -> ok");
  expect_true(r.status == "already_feasible", "status already_feasible");
  expect_true(r.best_distance == 0.0 && r.n_evaluated == 1 && r.n_feasible == 1, "base only, distance 0");
  expect_true(r.best_inputs.fG == 0.85, "best inputs are the base inputs");
}

void test_nearest_sample() {
  const EvalConfig cfg = sampling_config(200, 1);
  const double P0 = base_pfus(cfg);
  const FrontierReport r = find_nearest_feasible(PointInputs::reference(), {{"fG", 0.3, 1.0}},
                                                 {{"Pfus_MW", 0.8 * P0}}, cfg, pfus_cap(0.8 * P0));

  const double fG_edge = 0.85 * std::sqrt(0.8);
  expect_true(!r.base_feasible, "base violates the cap");
  expect_true(r.ok && r.status == "found_feasible", "a feasible sample is found");
  expect_true(r.best_inputs.fG <= fG_edge + 1e-9, "best sample is on the feasible side");
  expect_true(r.best_inputs.fG > fG_edge - 0.05, "best sample lies near the feasibility edge");
  expect_true(r.best_outputs.Pfus_MW <= 0.8 * P0, "best outputs satisfy the cap");
  expect_true(r.best_distance >= (0.85 - fG_edge) / 0.7 - 1e-9, "distance is at least the edge distance");
  expect_true(std::fabs(r.best_distance - std::fabs(r.best_inputs.fG - 0.85) / 0.7) < 1e-12,
              "1-lever distance = |dx| / range");
  expect_true(r.best_levers.count("fG") == 1 && r.best_achieved.count("Pfus_MW") == 1,
              "best levers and achieved targets reported");

  bool none_closer = true;
  int feasible = 0;
  for (const auto& s : r.trace) {
    if (!s.feasible) continue;
    ++feasible;
    if (s.distance < r.best_distance) none_closer = false;
  }
  expect_true(none_closer, "no feasible sample is closer than the reported best");
  expect_true(feasible == r.n_feasible, "n_feasible matches the trace");
  expect_true(r.n_evaluated == 201 && r.trace.size() == 201, "base + 200 samples evaluated");
  expect_true(r.trace.front().kind == SampleKind::Base && r.trace.front().index == 0, "trace starts at base");
  expect_true(r.trace.front().dominant == "pfus_cap", "base sample names its dominant limit");
}

void test_determinism() {
  const double P0 = base_pfus(EvalConfig::defaults());
  const std::vector<Lever> levers{{"fG", 0.3, 1.0}, {"Paux_MW", 10.0, 40.0}};

  const FrontierReport a = find_nearest_feasible(PointInputs::reference(), levers, {}, sampling_config(120, 1),
                                                 pfus_cap(0.8 * P0));
  const FrontierReport b = find_nearest_feasible(PointInputs::reference(), levers, {}, sampling_config(120, 1),
                                                 pfus_cap(0.8 * P0));
  physics::EvalCache cache(64);
  const FrontierReport c = find_nearest_feasible(PointInputs::reference(), levers, {}, sampling_config(120, 4),
                                                 pfus_cap(0.8 * P0), &cache);

  expect_true(a.best_levers == b.best_levers && a.best_distance == b.best_distance, "same seed -> same best");
  expect_true(a.best_levers == c.best_levers && a.best_distance == c.best_distance,
              "4 threads with a shared cache -> same best");
  bool same_trace = a.trace.size() == c.trace.size();
  for (size_t i = 0; same_trace && i < a.trace.size(); ++i) {
    same_trace = a.trace[i].levers == c.trace[i].levers && a.trace[i].feasible == c.trace[i].feasible &&
                 a.trace[i].score == c.trace[i].score;
  }
  expect_true(same_trace, "trace is identical across thread counts");
  expect_true(cache.size() <= 64, "shared cache stays within capacity");

  EvalConfig other = sampling_config(120, 1);
  other.frontier.seed = 7;
  const FrontierReport d =
      find_nearest_feasible(PointInputs::reference(), levers, {}, other, pfus_cap(0.8 * P0));
  expect_true(d.trace.size() > 1 && d.trace[1].levers != a.trace[1].levers, "different seed -> different samples");
}

void test_no_feasible_sample() {
  const EvalConfig cfg = sampling_config(40, 2);
  const double P0 = base_pfus(cfg);
  const FrontierReport r =
      find_nearest_feasible(PointInputs::reference(), {{"fG", 0.8, 1.0}}, {}, cfg, pfus_cap(0.01 * P0));
  expect_true(!r.ok && r.status == "no_feasible_sample", "unreachable cap -> no_feasible_sample");
  expect_true(r.n_feasible == 0, "no feasible samples counted");
  expect_true(r.best_inputs.fG == 0.85 && r.best_distance == 0.0, "best falls back to the base point");
  expect_true(r.least_violating.has_value(), "least violating sample is reported");
  expect_true(r.least_violating && r.least_violating->dominant == "pfus_cap", "least violating names its blocker");
  expect_true(r.least_violating && r.least_violating->levers.at("fG") < 0.85,
              "least violating sample has the lowest Pfus side of the box");
}

void test_probes() {
  EvalConfig cfg = sampling_config(10, 1);
  cfg.frontier.corner_probes = true;
  const double P0 = base_pfus(cfg);
  const FrontierReport r =
      find_nearest_feasible(PointInputs::reference(), {{"fG", 0.3, 1.0}}, {}, cfg, pfus_cap(0.8 * P0));
  expect_true(r.n_evaluated == 1 + 1 + 2 + 10, "base + midpoint + 2 corners + random");
  expect_true(r.trace.size() == 14 && r.trace[1].kind == SampleKind::Midpoint, "midpoint probe comes first");
  expect_true(std::fabs(r.trace[1].levers.at("fG") - 0.65) < 1e-12, "midpoint of [0.3, 1.0]");
  expect_true(r.trace[2].kind == SampleKind::Corner && r.trace[2].levers.at("fG") == 0.3, "lower corner next");
  expect_true(r.trace[3].kind == SampleKind::Corner && r.trace[3].levers.at("fG") == 1.0, "then upper corner");
  expect_true(r.trace[4].kind == SampleKind::Random && r.trace[4].index == 4, "random samples follow");
  expect_true(std::string_view(to_string(SampleKind::Corner)) == "corner", "kind names");
}

void test_bad_levers() {
  const EvalConfig cfg = sampling_config(10, 1);
  bool unknown = false;
  try {
    (void)find_nearest_feasible(PointInputs::reference(), {{"not_a_field", 0.0, 1.0}}, {}, cfg);
  } catch (const ConfigurationError&) {
    unknown = true;
  }
  expect_true(unknown, "unknown lever -> ConfigurationError");

  bool dup = false;
  try {
    (void)find_nearest_feasible(PointInputs::reference(), {{"fG", 0.3, 1.0}, {"fG", 0.4, 0.9}}, {}, cfg);
  } catch (const ConfigurationError&) {
    dup = true;
  }
  expect_true(dup, "duplicate lever -> ConfigurationError");
}

}  // namespace
}  // namespace fusion::frontier

int main() {
  using namespace fusion::frontier;

  test_already_feasible();
  test_nearest_sample();
  test_determinism();
  test_no_feasible_sample();
  test_probes();
  test_bad_levers();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
