/*
================================================================================
Fragment 2.3b — Physics: Engineering Blocks
FILE: cpp/engine/physics/engineering_blocks.cpp

Blocks 6-8: inboard radial build + TF magnet, divertor, neutronics.

Radial build (inboard midplane, outward from the plasma edge):
  R0 - a  |  first wall | blanket | shield | vacuum vessel | gap  |  TF leg
If the stack does not fit, R_coil_inner_m < 0 and every magnet field stays
NaN; the radial-build limit reports the closure failure.
================================================================================
*/

#include "engine/physics/relation_blocks.hpp"

#include <cmath>

#include "engine/core/numeric.hpp"

namespace fusion::physics {

namespace {

constexpr double kRebcoTc_K = 92.0;
constexpr double kRebcoB0_T = 30.0;
constexpr double kHtsRefField_T = 20.0;
constexpr double kHtsStrainScale = 0.004;
constexpr double kNeutronEnergy_MeV = 14.1;

}  // namespace

double rebco_jc_norm(double B_T, double T_K) noexcept {
  if (std::isnan(B_T) || std::isnan(T_K)) return kNaN;
  if (T_K >= kRebcoTc_K) return 0.0;
  const double t = 1.0 - (T_K < 0.0 ? 0.0 : T_K) / kRebcoTc_K;
  const double b = (B_T < 0.0 ? 0.0 : B_T) / kRebcoB0_T;
  return std::pow(t, 1.5) / (1.0 + std::pow(b, 1.7));
}

// ---------------------------------------------------------------------------
// 6. Radial build + TF magnet
// ---------------------------------------------------------------------------
void eval_radial_build_magnet(const PointInputs& in, const EvalConfig& cfg, OutputMap& out) {
  if (!is_finite(out.eps)) return;

  const double stack = in.t_fw_m + in.t_blanket_m + in.t_shield_m + in.t_vv_m + in.t_gap_m;
  out.R_coil_inner_m = (in.R0_m - in.a_m) - stack;
  if (!(out.R_coil_inner_m > 0.0)) return;

  const double R_coil = out.R_coil_inner_m;
  out.B_peak_T = in.Bpeak_factor * in.Bt_T * in.R0_m / R_coil;

  const double p_mag = out.B_peak_T * out.B_peak_T / (2.0 * kMu0);
  const double t_struct = floor_eps(in.t_tf_struct_m, cfg.numerics.eps);
  out.sigma_hoop_MPa = p_mag * (R_coil / t_struct) / 1e6;
  // Thin-shell: von Mises reduces to the hoop term.
  out.sigma_vm_MPa = out.sigma_hoop_MPa;

  out.hts_Jc_norm = rebco_jc_norm(out.B_peak_T, in.Tcoil_K) * cfg.calibration.hts_jc;
  const double f_strain = std::exp(-sq(in.hts_strain / kHtsStrainScale));
  out.hts_margin = out.hts_Jc_norm * in.hts_Jc_mult * f_strain /
                   floor_eps(out.B_peak_T / kHtsRefField_T, cfg.numerics.eps);

  const double N = floor_eps(in.tf_turns_total, 1.0);
  const double I_turn_A = in.Bt_T * 2.0 * kPi * in.R0_m / (kMu0 * N);
  out.I_tf_MA = I_turn_A / 1e6;

  const double V_tf = in.tf_volume_factor * 2.0 * kPi * in.R0_m * 2.0 * in.kappa * in.a_m *
                      (in.t_tf_wind_m + in.t_tf_struct_m);
  const double E_J = p_mag * V_tf;
  out.E_tf_GJ = E_J / 1e9;

  if (I_turn_A > 0.0 && in.tau_dump_s > 0.0) {
    out.V_dump_kV = (2.0 * E_J / I_turn_A) / in.tau_dump_s / 1e3;
  }
}

// ---------------------------------------------------------------------------
// 7. Divertor / exhaust
// ---------------------------------------------------------------------------
void eval_divertor(const PointInputs& in, const EvalConfig& cfg, OutputMap& out) {
  const double lq_m = out.lambda_q_mm / 1000.0;
  if (!(lq_m > 0.0)) return;

  const double circ = 2.0 * kPi * in.R0_m;
  out.A_wet_m2 = in.n_strike_points * circ * lq_m * in.flux_expansion;
  out.q_div_MW_m2 = out.P_SOL_MW * (1.0 - clamp(in.f_rad_div, 0.0, 0.99)) /
                    floor_eps(out.A_wet_m2, cfg.numerics.eps);
  out.q_midplane_MW_m2 = out.P_SOL_MW / (circ * lq_m);
  out.L_par_m = in.f_Lpar * kPi * out.q95 * in.R0_m;
}

// ---------------------------------------------------------------------------
// 8. Neutronics
// ---------------------------------------------------------------------------
void eval_neutronics(const PointInputs& in, const EvalConfig& cfg, OutputMap& out) {
  const double lam_b = floor_eps(in.lambda_blanket_m, cfg.numerics.eps);
  const double lam_s = floor_eps(in.lambda_shield_m, cfg.numerics.eps);

  out.TBR = clamp(in.blanket_coverage, 0.0, 1.0) * in.TBR_mult *
            (1.0 - std::exp(-in.t_blanket_m / lam_b));

  out.neutron_wall_load_MW_m2 = out.P_neutron_MW / floor_eps(out.A_fw_m2, cfg.numerics.eps);
  out.shield_capture_frac = 1.0 - std::exp(-in.t_shield_m / lam_s);

  // Neutron flux at the wall attenuated through blanket + shield to the TF leg.
  const double En_J = kNeutronEnergy_MeV * kMeV_J;
  const double wall_flux = out.P_neutron_MW * 1e6 / En_J / floor_eps(out.A_fw_m2, cfg.numerics.eps);
  out.hts_fluence_per_fpy = wall_flux * in.f_geom_hts *
                            std::exp(-(in.t_shield_m + in.t_blanket_m) / lam_s) * kSecondsPerYear;
  if (out.hts_fluence_per_fpy > 0.0) {
    out.hts_lifetime_yr = in.hts_fluence_limit_n_m2 / out.hts_fluence_per_fpy;
  } else if (out.hts_fluence_per_fpy == 0.0) {
    out.hts_lifetime_yr = kInf;
  }
}

}  // namespace fusion::physics
