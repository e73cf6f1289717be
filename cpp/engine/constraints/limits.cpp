#include "engine/constraints/limits.hpp"

#include <cmath>
#include <set>

#include "engine/core/errors.hpp"

namespace fusion::constraints {

namespace {

// H98 allowances at or above this are treated as "no limit".
constexpr double kH98NoLimitSentinel = 9.99e9;

// Hard lower bound on q95 regardless of user allowables (kink limit).
constexpr double kQ95Floor = 2.0;

void add(LimitTable& t, const char* name, const char* group, const char* key, LimitSense sense,
         double bound, Severity sev, const char* units, const char* note) {
  t.push_back(LimitSpec{name, group, key, sense, bound, sev, units, note});
}

bool requested(double v) { return std::isfinite(v); }

}  // namespace

const char* to_string(LimitSense s) noexcept {
  switch (s) {
    case LimitSense::LessEq:    return "<=";
    case LimitSense::GreaterEq: return ">=";
  }
  return "?";
}

const char* to_string(Severity s) noexcept {
  switch (s) {
    case Severity::Soft: return "soft";
    case Severity::Hard: return "hard";
  }
  return "?";
}

void LimitSpec::validate() const {
  FUSION_REQUIRE(!name.empty(), ConfigurationError, "LimitSpec.name empty");
  FUSION_REQUIRE(!key.empty(), ConfigurationError, "LimitSpec.key empty (" + name + ")");
  FUSION_REQUIRE(std::isfinite(bound), ConfigurationError, "LimitSpec.bound not finite (" + name + ")");
}

void validate_table(const LimitTable& table) {
  std::set<std::string> seen;
  for (const auto& l : table) {
    l.validate();
    FUSION_REQUIRE(seen.insert(l.name).second, ConfigurationError, "duplicate limit name: " + l.name);
  }
}

LimitTable default_limit_table(const PointInputs& in) {
  LimitTable t;

  // ---- plasma ----
  add(t, "q95_floor", "plasma", "q95", LimitSense::GreaterEq, kQ95Floor, Severity::Hard, "-",
      "kink safety floor");
  if (requested(in.q95_min)) {
    add(t, "q95_min", "plasma", "q95", LimitSense::GreaterEq, in.q95_min, Severity::Hard, "-", "");
  }
  if (requested(in.q95_max)) {
    add(t, "q95_max", "plasma", "q95", LimitSense::LessEq, in.q95_max, Severity::Soft, "-", "");
  }
  if (requested(in.q0_min)) {
    add(t, "q0_min", "plasma", "q0", LimitSense::GreaterEq, in.q0_min, Severity::Soft, "-",
        "sawtooth proxy");
  }
  if (requested(in.betaN_max)) {
    add(t, "betaN_max", "plasma", "betaN", LimitSense::LessEq, in.betaN_max, Severity::Hard, "-",
        "Troyon-type limit");
  }
  if (requested(in.fG_max)) {
    add(t, "greenwald", "plasma", "fG_eff", LimitSense::LessEq, in.fG_max, Severity::Hard, "-",
        "ne / n_GW");
  }
  if (requested(in.H98_allow) && in.H98_allow < kH98NoLimitSentinel) {
    add(t, "H_required", "plasma", "H_required", LimitSense::LessEq, in.H98_allow, Severity::Hard,
        "-", "confinement needed vs allowance");
  }
  if (in.require_Hmode > 0.5) {
    add(t, "LH_access", "plasma", "LH_margin", LimitSense::GreaterEq, 1.0, Severity::Hard, "-",
        "P_SOL / P_LH");
  } else {
    add(t, "LH_access", "plasma", "LH_margin", LimitSense::GreaterEq, 1.0, Severity::Soft, "-",
        "P_SOL / P_LH");
  }

  // ---- exhaust ----
  if (requested(in.q_div_max_MW_m2)) {
    add(t, "q_div_max", "exhaust", "q_div_MW_m2", LimitSense::LessEq, in.q_div_max_MW_m2,
        Severity::Hard, "MW/m^2", "");
  }
  if (requested(in.P_SOL_over_R_max_MW_m)) {
    add(t, "P_SOL_over_R_max", "exhaust", "P_SOL_over_R_MW_m", LimitSense::LessEq,
        in.P_SOL_over_R_max_MW_m, Severity::Hard, "MW/m", "");
  }
  if (requested(in.q_midplane_max_MW_m2)) {
    add(t, "q_midplane_max", "exhaust", "q_midplane_MW_m2", LimitSense::LessEq,
        in.q_midplane_max_MW_m2, Severity::Hard, "MW/m^2", "");
  }

  // ---- magnets ----
  add(t, "radial_build_closes", "magnets", "R_coil_inner_m", LimitSense::GreaterEq, 0.0,
      Severity::Hard, "m", "inboard stack fits inside R0 - a");
  if (requested(in.Bpeak_allow_T)) {
    add(t, "B_peak_max", "magnets", "B_peak_T", LimitSense::LessEq, in.Bpeak_allow_T, Severity::Hard,
        "T", "");
  }
  if (requested(in.sigma_allow_MPa)) {
    add(t, "sigma_vm_max", "magnets", "sigma_vm_MPa", LimitSense::LessEq, in.sigma_allow_MPa,
        Severity::Hard, "MPa", "");
  }
  if (requested(in.hts_margin_min)) {
    add(t, "hts_margin_min", "magnets", "hts_margin", LimitSense::GreaterEq, in.hts_margin_min,
        Severity::Hard, "-", "");
  }
  if (requested(in.Vdump_max_kV)) {
    add(t, "V_dump_max", "magnets", "V_dump_kV", LimitSense::LessEq, in.Vdump_max_kV, Severity::Hard,
        "kV", "quench dump voltage");
  }
  if (requested(in.hts_lifetime_min_yr)) {
    add(t, "hts_lifetime_min", "magnets", "hts_lifetime_yr", LimitSense::GreaterEq,
        in.hts_lifetime_min_yr, Severity::Soft, "yr", "fluence-limited");
  }

  // ---- neutronics ----
  if (requested(in.TBR_min)) {
    add(t, "TBR_min", "neutronics", "TBR", LimitSense::GreaterEq, in.TBR_min, Severity::Hard, "-", "");
  }
  if (requested(in.neutron_wall_load_max_MW_m2)) {
    add(t, "NWL_max", "neutronics", "neutron_wall_load_MW_m2", LimitSense::LessEq,
        in.neutron_wall_load_max_MW_m2, Severity::Hard, "MW/m^2", "");
  }

  // ---- plant / economics ----
  if (requested(in.P_net_min_MW)) {
    add(t, "P_net_min", "plant", "P_net_MW", LimitSense::GreaterEq, in.P_net_min_MW,
        in.P_net_min_MW > 0.0 ? Severity::Hard : Severity::Soft, "MW", "");
  }
  if (requested(in.COE_max_USD_MWh)) {
    add(t, "COE_max", "economics", "COE_USD_MWh", LimitSense::LessEq, in.COE_max_USD_MWh,
        Severity::Soft, "USD/MWh", "");
  }

  return t;
}

}  // namespace fusion::constraints
