/*
  Fragment 2.4t — Point Evaluator Selftest

  Objective
  ---------
  Framework-free checks that the evaluator is a pure function and degrades
  to NaN instead of throwing:
    1) Reference point evaluated twice serializes byte-for-byte identically.
    2) Pfus(Bt = 11 T) >= Pfus(Bt = 9 T); Greenwald density rises with Ip.
    3) a = 0 gives NaN geometry and "unknown" constraints, no crash.
       Negative fG, Ip or Paux are out of domain the same way.
    4) Structural input errors raise ConfigurationError; bad config raises
       ValidationError.
    5) Model switches are honored through EvalConfig only.

  Expected use
  ------------
    ./point_evaluator_selftest     (non-zero exit on failure)
*/

#include <cmath>
#include <iostream>
#include <map>
#include <string>
#include <string_view>

#include "engine/constraints/ledger.hpp"
#include "engine/constraints/limits.hpp"
#include "engine/core/config.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/point_inputs.hpp"
#include "engine/io/run_artifact.hpp"
#include "engine/physics/point_evaluator.hpp"

namespace fusion::physics {
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

std::string artifact_json(const PointInputs& in, const EvalConfig& cfg) {
  const OutputMap out = evaluate(in, cfg);
  const auto led = constraints::build_ledger(out, constraints::default_limit_table(in));
  io::JsonWriteOptions opt;
  opt.pretty = false;
  return io::run_artifact_to_json(io::make_run_artifact(in, out, led, cfg), opt);
}

void test_reference_point_is_deterministic() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs in = PointInputs::reference();
  expect_true(in.R0_m == 1.81 && in.a_m == 0.57 && in.Bt_T == 12.2 && in.Paux_MW == 20.0,
              "reference() carries the demo point");

  const std::string j1 = artifact_json(in, cfg);
  const std::string j2 = artifact_json(in, cfg);
  expect_true(!j1.empty() && j1 == j2, "two evaluations serialize byte-for-byte identically");

  const OutputMap out = evaluate(in, cfg);
  expect_true(out.Pfus_MW > 0.0 && std::isfinite(out.Pfus_MW), "reference Pfus is positive and finite");
  expect_true(std::isfinite(out.Q_DT_eqv) && out.Q_DT_eqv > 0.0, "reference Q is positive and finite");
  expect_true(std::fabs(out.Q_DT_eqv - out.Pfus_MW / in.Paux_MW) < 1e-9 * out.Q_DT_eqv,
              "Q = Pfus / Paux");
  expect_true(std::fabs(out.aspect - 1.81 / 0.57) < 1e-12, "aspect = R0 / a");
  expect_true(std::fabs(out.fG_eff - in.fG) < 1e-12, "fG_eff reproduces the input Greenwald fraction");
  expect_true(std::isfinite(out.H98) && out.H98 > 0.0, "H98 is defined at the reference point");
}

void test_monotonicity() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs base = PointInputs::reference();

  const double p9 = evaluate(base.with("Bt_T", 9.0), cfg).Pfus_MW;
  const double p11 = evaluate(base.with("Bt_T", 11.0), cfg).Pfus_MW;
  expect_true(p11 >= p9, "Pfus(Bt = 11) >= Pfus(Bt = 9)");

  const OutputMap lo = evaluate(base.with("Ip_MA", 6.0), cfg);
  const OutputMap hi = evaluate(base.with("Ip_MA", 10.0), cfg);
  expect_true(hi.n_GW_20 > lo.n_GW_20, "Greenwald density increases with Ip");
  expect_true(hi.q95 < lo.q95, "q95 falls as Ip rises");

  const double t12 = evaluate(base.with("Ti_keV", 12.0), cfg).Pfus_MW;
  const double t15 = evaluate(base.with("Ti_keV", 15.0), cfg).Pfus_MW;
  expect_true(t15 > t12, "Pfus rises with Ti below the reactivity peak");
}

void test_nan_propagation() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs bad = PointInputs::reference().with("a_m", 0.0);

  bool threw = false;
  OutputMap out;
  try {
    out = evaluate(bad, cfg);
  } catch (const std::exception& e) {
    threw = true;
    std::cerr << "  unexpected: " << e.what() << "\n";
  }
  expect_true(!threw, "a = 0 does not throw");
  expect_true(std::isnan(out.aspect), "a = 0 -> aspect NaN");
  expect_true(std::isnan(out.V_m3) && std::isnan(out.S_m2), "a = 0 -> volume and surface NaN");
  expect_true(std::isnan(out.Pfus_MW), "NaN volume propagates to Pfus");
  expect_true(std::isnan(out.q95), "NaN geometry propagates to q95");

  const auto led = constraints::build_ledger(out, constraints::default_limit_table(bad));
  const auto* q95 = led.find("q95_floor");
  const auto* gw = led.find("greenwald");
  expect_true(q95 && q95->status == constraints::ConstraintStatus::Unknown, "q95_floor reports unknown");
  expect_true(gw && gw->status == constraints::ConstraintStatus::Unknown, "greenwald reports unknown");
  expect_true(q95 && !q95->passed, "unknown is never passing");
  expect_true(!led.overall_ok, "unknown hard constraints make the point infeasible");
  expect_true(led.summary.n_unknown > 0, "summary counts unknown records");
}

void test_out_of_domain_inputs() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs ref = PointInputs::reference();
  const OutputMap good = evaluate(ref, cfg);

  auto status_of = [](const constraints::Ledger& led, const char* name) {
    const auto* r = led.find(name);
    return r ? r->status : constraints::ConstraintStatus::Pass;
  };

  const PointInputs neg_fG = ref.with("fG", -0.85);
  const OutputMap o1 = evaluate(neg_fG, cfg);
  expect_true(std::isnan(o1.ne20) && std::isnan(o1.fG_eff), "fG < 0 -> density NaN");
  expect_true(std::isnan(o1.Pfus_MW) && o1.Pfus_MW != good.Pfus_MW, "fG < 0 does not mirror the valid Pfus");
  expect_true(std::isnan(o1.betaN) && std::isnan(o1.Q_DT_eqv), "fG < 0 -> betaN and Q NaN");
  const auto l1 = constraints::build_ledger(o1, constraints::default_limit_table(neg_fG));
  expect_true(status_of(l1, "greenwald") == constraints::ConstraintStatus::Unknown, "fG < 0 -> greenwald unknown");
  expect_true(status_of(l1, "betaN_max") == constraints::ConstraintStatus::Unknown, "fG < 0 -> betaN_max unknown");
  expect_true(!l1.overall_ok, "fG < 0 is never feasible");

  const PointInputs neg_Ip = ref.with("Ip_MA", -8.0);
  const OutputMap o2 = evaluate(neg_Ip, cfg);
  expect_true(std::isnan(o2.n_GW_20) && std::isnan(o2.fG_eff), "Ip < 0 -> Greenwald density NaN");
  expect_true(std::isnan(o2.Pfus_MW) && std::isnan(o2.betaN), "Ip < 0 -> Pfus and betaN NaN");
  expect_true(std::isnan(o2.q95), "Ip < 0 -> q95 NaN, not infinite");
  const auto l2 = constraints::build_ledger(o2, constraints::default_limit_table(neg_Ip));
  expect_true(status_of(l2, "greenwald") == constraints::ConstraintStatus::Unknown, "Ip < 0 -> greenwald unknown");
  expect_true(status_of(l2, "q95_floor") == constraints::ConstraintStatus::Unknown, "Ip < 0 -> q95_floor unknown");

  const PointInputs neg_Paux = ref.with("Paux_MW", -20.0);
  const OutputMap o3 = evaluate(neg_Paux, cfg);
  expect_true(std::isnan(o3.Q_DT_eqv), "Paux < 0 -> Q NaN, not a floored huge value");
  expect_true(std::isnan(o3.Pin_MW) && std::isnan(o3.P_SOL_MW), "Paux < 0 -> heating power NaN");
  expect_true(o3.Pfus_MW == good.Pfus_MW, "Paux does not enter fusion power");
  const auto l3 = constraints::build_ledger(o3, constraints::default_limit_table(neg_Paux));
  expect_true(status_of(l3, "LH_access") == constraints::ConstraintStatus::Unknown, "Paux < 0 -> LH_access unknown");

  const OutputMap o4 = evaluate(ref.with("fG", 0.0), cfg);
  expect_true(o4.ne20 == 0.0 && o4.fG_eff == 0.0, "fG = 0 stays in domain");
}

void test_structural_errors() {
  const auto names = PointInputs::field_names();
  expect_true(!names.empty() && names.front() == "R0_m" && names.size() == PointInputs{}.to_fields().size(),
              "field_names() lists every field in declaration order");

  std::map<std::string, double> fields = PointInputs::reference().to_fields();
  fields.erase("Ip_MA");
  bool missing = false;
  try {
    (void)PointInputs::from_fields(fields);
  } catch (const ConfigurationError&) {
    missing = true;
  }
  expect_true(missing, "missing required field -> ConfigurationError");

  fields = PointInputs::reference().to_fields();
  fields["not_a_field"] = 1.0;
  bool unknown = false;
  try {
    (void)PointInputs::from_fields(fields);
  } catch (const ConfigurationError&) {
    unknown = true;
  }
  expect_true(unknown, "unknown field -> ConfigurationError");

  bool bad_with = false;
  try {
    (void)PointInputs::reference().with("Bt", 5.0);
  } catch (const ConfigurationError&) {
    bad_with = true;
  }
  expect_true(bad_with, "with() on an unknown key -> ConfigurationError");

  EvalConfig cfg = EvalConfig::defaults();
  cfg.calibration.confinement = 0.0;
  bool invalid = false;
  try {
    (void)evaluate(PointInputs::reference(), cfg);
  } catch (const ValidationError&) {
    invalid = true;
  }
  expect_true(invalid, "out-of-range calibration -> ValidationError");

  bool bad_scaling = false;
  try {
    (void)parse_confinement_scaling("ipb2000");
  } catch (const ConfigurationError&) {
    bad_scaling = true;
  }
  expect_true(bad_scaling, "unknown scaling name -> ConfigurationError");
}

void test_model_switches() {
  const PointInputs in = PointInputs::reference();
  EvalConfig a = EvalConfig::defaults();
  EvalConfig b = EvalConfig::defaults();
  b.model.comparator_scaling = ConfinementScaling::ITER89P;

  const OutputMap oa = evaluate(in, a);
  const OutputMap ob = evaluate(in, b);
  expect_true(oa.H98 == ob.H98, "H98 does not depend on the comparator scaling");
  expect_true(oa.tau_scaling_s != ob.tau_scaling_s, "comparator scaling changes tau_scaling_s");
  expect_true(std::fabs(oa.H_scaling - oa.H98) < 1e-12, "IPB98 comparator: H_scaling == H98");

  EvalConfig c = EvalConfig::defaults();
  c.model.radiation_enabled = false;
  const OutputMap oc = evaluate(in, c);
  expect_true(oc.Prad_core_MW == 0.0, "radiation disabled -> Prad_core = 0");
  expect_true(oc.P_SOL_MW > oa.P_SOL_MW, "radiation disabled raises P_SOL");

  EvalConfig d = EvalConfig::defaults();
  d.model.bootstrap = BootstrapModel::Improved;
  const OutputMap od = evaluate(in, d);
  expect_true(od.f_bs >= 0.0 && od.f_bs <= 0.95, "improved bootstrap stays within [0, 0.95]");
}

void test_output_map_schema() {
  OutputMap m;
  expect_true(std::isnan(m.get("Pfus_MW")), "fresh schema field is NaN");
  expect_true(std::isnan(m.get("no_such_key")), "absent key reads NaN");
  m.set("Pfus_MW", 5.0);
  m.set("diag_extra", 2.0);
  expect_true(m.Pfus_MW == 5.0, "set() on a schema key writes the field");
  expect_true(m.aux.count("diag_extra") == 1 && m.aux.count("Pfus_MW") == 0, "non-schema keys go to aux");
  expect_true(OutputMap::is_schema_key("H98") && !OutputMap::is_schema_key("diag_extra"),
              "schema membership is fixed");
}

}  // namespace
}  // namespace fusion::physics

int main() {
  using namespace fusion::physics;

  test_reference_point_is_deterministic();
  test_monotonicity();
  test_nan_propagation();
  test_out_of_domain_inputs();
  test_structural_errors();
  test_model_switches();
  test_output_map_schema();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
