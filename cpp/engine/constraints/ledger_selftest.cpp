/*
  Fragment 3.2t — Constraint Ledger Selftest

  Objective
  ---------
  Framework-free checks for build_ledger():
    1) passed == (margin_frac >= 0) for every numeric record.
    2) The dominant record is a failing HARD record, chosen deterministically.
    3) NaN / absent values are "unknown" and never pass.
    4) Malformed tables raise ConfigurationError.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string_view>

#include "engine/constraints/ledger.hpp"
#include "engine/constraints/limits.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/point_inputs.hpp"

namespace fusion::constraints {
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

LimitSpec hard_le(const char* name, const char* key, double bound) {
  return LimitSpec{name, "test", key, LimitSense::LessEq, bound, Severity::Hard, "-", ""};
}

LimitSpec hard_ge(const char* name, const char* key, double bound) {
  return LimitSpec{name, "test", key, LimitSense::GreaterEq, bound, Severity::Hard, "-", ""};
}

LimitSpec soft_le(const char* name, const char* key, double bound) {
  return LimitSpec{name, "test", key, LimitSense::LessEq, bound, Severity::Soft, "-", ""};
}

OutputMap sample_outputs() {
  OutputMap m;
  m.set("betaN", 4.5);     // vs 3.0  -> margin_frac -0.5
  m.set("q95", 2.4);       // vs 3.0  -> margin_frac -0.2
  m.set("TBR", 1.2);       // vs 1.05 -> pass
  m.set("P_net_MW", 0.0);  // vs 0    -> pass, bound 0
  m.set("COE_USD_MWh", 300.0);  // soft vs 100 -> -2.0
  return m;
}

LimitTable sample_table() {
  return LimitTable{
      soft_le("coe", "COE_USD_MWh", 100.0),
      hard_ge("q95_min", "q95", 3.0),
      hard_le("betaN_max", "betaN", 3.0),
      hard_ge("tbr", "TBR", 1.05),
      hard_ge("p_net", "P_net_MW", 0.0),
  };
}

void test_sign_consistency() {
  const Ledger L = build_ledger(sample_outputs(), sample_table());
  bool all = true;
  for (const auto& r : L.records) {
    if (r.status == ConstraintStatus::Unknown) continue;
    if (r.passed != (r.margin_frac >= 0.0)) all = false;
  }
  expect_true(all, "passed == (margin_frac >= 0) for every record");
  expect_true(L.records.size() == 5, "one record per limit");

  const auto* beta = L.find("betaN_max");
  expect_true(beta && std::fabs(beta->margin - (-1.5)) < 1e-12, "LessEq margin = bound - value");
  expect_true(beta && std::fabs(beta->margin_frac - (-0.5)) < 1e-12, "margin_frac = margin / |bound|");
  expect_true(beta && std::fabs(beta->violation_score - 5.0) < 1e-12, "hard violation score weight 10");

  const auto* q = L.find("q95_min");
  expect_true(q && std::fabs(q->margin - (-0.6)) < 1e-12, "GreaterEq margin = value - bound");

  const auto* pn = L.find("p_net");
  expect_true(pn && pn->margin_frac == pn->margin && pn->passed, "bound 0 -> margin_frac == margin");

  const auto* coe = L.find("coe");
  expect_true(coe && std::fabs(coe->violation_score - 2.0) < 1e-12, "soft violation score weight 1");
}

void test_dominance() {
  const Ledger L = build_ledger(sample_outputs(), sample_table());
  expect_true(!L.overall_ok, "hard failures -> not ok");
  expect_true(L.verdict == Verdict::Fail, "hard failures -> FAIL");
  expect_true(L.dominant.has_value() && L.dominant->name == "betaN_max",
              "dominant = most negative hard margin_frac (soft ignored)");
  expect_true(L.dominant && L.dominant->severity == Severity::Hard && !L.dominant->passed,
              "dominant is a failing hard record");
  expect_true(L.dominant && L.dominant->dominance_rank == 1, "dominant carries rank 1");
  expect_true(L.summary.n_hard_failed == 2 && L.summary.n_soft_failed == 1, "summary counts failures");
  expect_true(std::fabs(L.summary.worst_hard_margin_frac - (-0.5)) < 1e-12, "worst hard margin_frac");
  expect_true(!L.summary.top_blockers.empty() && L.summary.top_blockers.front() == "betaN_max",
              "top blocker is the largest violation");

  const Ledger L2 = build_ledger(sample_outputs(), sample_table());
  expect_true(L2.dominant && L2.dominant->name == L.dominant->name, "dominant is stable across calls");
  expect_true(L.fingerprint == L2.fingerprint && L.fingerprint.size() == 16, "fingerprint is stable");

  // Equal violations: first in table order wins.
  OutputMap m;
  m.set("betaN", 4.5);   // -0.5
  m.set("q95", 1.5);     // -0.5
  const Ledger tie = build_ledger(m, LimitTable{hard_ge("q_first", "q95", 3.0), hard_le("b_second", "betaN", 3.0)});
  expect_true(tie.dominant && tie.dominant->name == "q_first", "ties go to the first record");
}

void test_unknown_status() {
  OutputMap m;
  m.set("TBR", std::numeric_limits<double>::quiet_NaN());
  m.set("q95", 4.0);
  const Ledger L = build_ledger(m, LimitTable{hard_ge("tbr", "TBR", 1.05), hard_ge("q95_min", "q95", 3.0),
                                              soft_le("absent", "no_such_output", 1.0)});
  const auto* tbr = L.find("tbr");
  expect_true(tbr && tbr->status == ConstraintStatus::Unknown, "NaN value -> unknown");
  expect_true(tbr && !tbr->passed && std::isnan(tbr->margin_frac), "unknown: passed false, NaN margin");
  const auto* absent = L.find("absent");
  expect_true(absent && absent->status == ConstraintStatus::Unknown, "absent key -> unknown");
  expect_true(!L.overall_ok, "unknown hard record -> not ok");
  expect_true(L.dominant && L.dominant->name == "tbr", "only unknown hard failures -> first unknown is dominant");
  expect_true(L.summary.n_unknown == 2, "n_unknown counts both");
  expect_true(std::fabs(L.summary.worst_hard_margin_frac - (1.0 / 3.0)) < 1e-12,
              "worst hard margin skips unknown records");
}

void test_soft_only_warns() {
  OutputMap m;
  m.set("COE_USD_MWh", 150.0);
  m.set("q95", 4.0);
  const Ledger L = build_ledger(m, LimitTable{soft_le("coe", "COE_USD_MWh", 100.0), hard_ge("q", "q95", 3.0)});
  expect_true(L.overall_ok, "soft failure alone keeps overall_ok");
  expect_true(L.verdict == Verdict::Warn, "soft failure alone -> WARN");
  expect_true(!L.dominant.has_value(), "no hard failure -> no dominant");
}

void test_table_validation() {
  bool dup = false;
  try {
    (void)build_ledger(OutputMap{}, LimitTable{hard_le("x", "q95", 1.0), hard_le("x", "betaN", 1.0)});
  } catch (const ConfigurationError&) {
    dup = true;
  }
  expect_true(dup, "duplicate limit names -> ConfigurationError");

  bool nan_bound = false;
  try {
    (void)build_ledger(OutputMap{}, LimitTable{hard_le("x", "q95", std::numeric_limits<double>::quiet_NaN())});
  } catch (const ConfigurationError&) {
    nan_bound = true;
  }
  expect_true(nan_bound, "non-finite bound -> ConfigurationError");
}

void test_default_table() {
  const PointInputs in = PointInputs::reference();
  const LimitTable t = default_limit_table(in);
  auto has = [&t](const char* name) {
    for (const auto& l : t) {
      if (l.name == name) return true;
    }
    return false;
  };
  expect_true(has("q95_floor") && has("greenwald") && has("TBR_min"), "default table has core limits");
  expect_true(!has("q95_max") && !has("COE_max"), "NaN allowables are skipped");

  const LimitTable t2 = default_limit_table(in.with("COE_max_USD_MWh", 150.0));
  bool found = false;
  for (const auto& l : t2) {
    if (l.name == "COE_max") found = (l.severity == Severity::Soft && l.bound == 150.0);
  }
  expect_true(found, "setting an allowable adds its limit");
}

}  // namespace
}  // namespace fusion::constraints

int main() {
  using namespace fusion::constraints;

  test_sign_consistency();
  test_dominance();
  test_unknown_status();
  test_soft_only_warns();
  test_table_validation();
  test_default_table();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
