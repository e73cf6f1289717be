/*
================================================================================
Fragment 2.3a — Physics: Plasma Core Blocks
FILE: cpp/engine/physics/plasma_blocks.cpp

Blocks 1-5: geometry, density, fusion power, power balance, limits.
================================================================================
*/

#include "engine/physics/relation_blocks.hpp"

#include <cmath>

#include "engine/core/numeric.hpp"
#include "engine/physics/confinement.hpp"
#include "engine/physics/reactivity.hpp"

namespace fusion::physics {

namespace {

constexpr double kAlphaFraction = 0.2;     // 3.5 / 17.6 MeV, rounded
constexpr double kNeutronFraction = 0.8;
constexpr double kPradCoreMaxFrac = 0.95;

}  // namespace

// ---------------------------------------------------------------------------
// 1. Geometry
// ---------------------------------------------------------------------------
void eval_geometry(const PointInputs& in, const EvalConfig& /*cfg*/, OutputMap& out) {
  const double R = in.R0_m;
  const double a = in.a_m;
  const double k = in.kappa;

  const bool ok = is_finite(R) && is_finite(a) && is_finite(k) &&
                  R > 0.0 && a > 0.0 && k > 0.0 && a < R;
  if (!ok) return;

  out.V_m3 = 2.0 * kPi * kPi * R * a * a * k;
  out.S_m2 = 4.0 * kPi * kPi * R * a * k;
  out.A_fw_m2 = out.S_m2;
  out.aspect = R / a;
  out.eps = a / R;
}

// ---------------------------------------------------------------------------
// 2. Density / temperature
// ---------------------------------------------------------------------------
void eval_density(const PointInputs& in, const EvalConfig& /*cfg*/, OutputMap& out) {
  out.Ti_keV = in.Ti_keV;
  out.Te_keV = nan_unless(in.Ti_over_Te > 0.0, in.Ti_keV / in.Ti_over_Te);

  // Greenwald density needs a valid minor radius and a positive current.
  if (!is_finite(out.eps)) return;
  if (!(in.Ip_MA > 0.0 && is_finite(in.Ip_MA))) return;

  out.n_GW_20 = in.Ip_MA / (kPi * in.a_m * in.a_m);
  out.ne20 = nan_unless(in.fG >= 0.0, in.fG * out.n_GW_20);
  out.ne_m3 = out.ne20 * 1e20;
  out.fG_eff = out.ne20 / out.n_GW_20;
}

// ---------------------------------------------------------------------------
// 3. Fusion power
// ---------------------------------------------------------------------------
void eval_fusion_power(const PointInputs& in, const EvalConfig& cfg, OutputMap& out) {
  out.sigmav_DT_m3_s = bosch_hale_sigmav_DT(out.Ti_keV);

  const double nD = 0.5 * out.ne_m3;
  const double nT = 0.5 * out.ne_m3;
  const double E_J = kE_DT_MeV * kMeV_J;

  out.Pfus_DT_MW = nD * nT * out.sigmav_DT_m3_s * E_J * out.V_m3 / 1e6 *
                   cfg.calibration.fusion_power;

  const double ash = clamp(in.f_He_ash, 0.0, 1.0);
  out.Pfus_MW = out.Pfus_DT_MW * in.dilution_fuel * (1.0 - ash) * (1.0 - ash);

  out.P_neutron_MW = kNeutronFraction * out.Pfus_MW;
  out.P_alpha_MW = kAlphaFraction * out.Pfus_MW * (1.0 - clamp(in.alpha_loss_frac, 0.0, 1.0));
}

// ---------------------------------------------------------------------------
// 4. Power balance / confinement
// ---------------------------------------------------------------------------
void eval_power_balance(const PointInputs& in, const EvalConfig& cfg, OutputMap& out) {
  const double eps = cfg.numerics.eps;

  // Negative auxiliary power is out of domain; floors below must not hide it.
  out.Pin_MW = nan_unless(in.Paux_MW >= 0.0, in.Paux_MW + out.P_alpha_MW);
  out.Prad_core_MW = cfg.model.radiation_enabled
                         ? clamp(in.f_rad_core, 0.0, kPradCoreMaxFrac) * out.Pin_MW
                         : 0.0;
  out.P_SOL_MW = floor_eps(out.Pin_MW - out.Prad_core_MW, cfg.numerics.psol_floor_MW);

  // Loss power for the scalings is the power not radiated in the core.
  out.Ploss_MW = out.P_SOL_MW;
  out.P_SOL_over_R_MW_m = nan_unless(is_finite(out.eps), out.P_SOL_MW / in.R0_m);

  out.W_MJ = 3.0 * out.ne_m3 * (out.Te_keV + out.Ti_keV) * kKeV_J * out.V_m3 / 1e6;

  const double tau_required = out.W_MJ / floor_eps(out.Ploss_MW, eps);
  out.tauE_s = tau_required * (in.confinement_mult < 0.0 ? 0.0 : in.confinement_mult) *
               cfg.calibration.confinement;

  ScalingParams sp;
  sp.Ip_MA = in.Ip_MA;
  sp.Bt_T = in.Bt_T;
  sp.ne20 = out.ne20;
  sp.Ploss_MW = out.Ploss_MW;
  sp.R_m = in.R0_m;
  sp.a_m = in.a_m;
  sp.kappa = in.kappa;
  sp.M_amu = in.A_eff;
  // Cylindrical q* for Neo-Alcator, same proxy as q95 below.
  sp.q_star = (2.0 * kPi * in.R0_m * in.Bt_T / (kMu0 * in.Ip_MA * 1e6)) * out.eps / in.kappa;

  out.tauIPB98_s = tau_ipb98y2(sp);
  out.tau_scaling_s = tau_scaling(cfg.model.comparator_scaling, sp);

  out.H98 = out.tauE_s / floor_eps(out.tauIPB98_s, 1e-12);
  out.H_scaling = out.tauE_s / floor_eps(out.tau_scaling_s, 1e-12);
  out.H_required = tau_required / floor_eps(out.tauIPB98_s, 1e-12);

  const double tau_model = out.tau_scaling_s * in.confinement_mult * cfg.calibration.confinement;
  out.power_balance_residual_MW = out.Ploss_MW - out.W_MJ / floor_eps(tau_model, eps);

  out.Q_DT_eqv = nan_unless(in.Paux_MW >= 0.0, out.Pfus_MW / floor_eps(in.Paux_MW, eps));
}

// ---------------------------------------------------------------------------
// 5. Operational limits
// ---------------------------------------------------------------------------
double bootstrap_fraction(BootstrapModel model, double betaN, double beta_p,
                          double q95, double eps, double C_bs) noexcept {
  switch (model) {
    case BootstrapModel::Proxy: {
      if (q95 <= 0.0) return 0.95;
      return clamp(C_bs * betaN / q95, 0.0, 0.95);
    }
    case BootstrapModel::Improved: {
      if (beta_p <= 0.0 || q95 <= 0.0) return 0.0;
      const double e = eps > 0.0 ? eps : 0.0;
      const double f = 0.55 * (beta_p / (1.0 + beta_p)) * (1.0 / (0.5 + q95 / 5.0)) * (0.6 + 0.8 * e);
      return clamp(f, 0.0, 0.95);
    }
  }
  return kNaN;
}

void eval_operational_limits(const PointInputs& in, const EvalConfig& cfg, OutputMap& out) {
  const double Ip_A = in.Ip_MA * 1e6;
  const double p_Pa = out.ne_m3 * (out.Te_keV + out.Ti_keV) * kKeV_J;
  const double p_mag = in.Bt_T * in.Bt_T / (2.0 * kMu0);

  out.beta = p_Pa / floor_eps(p_mag, cfg.numerics.eps);
  out.betaN = nan_unless(in.Ip_MA > 0.0 && in.Bt_T > 0.0,
                         100.0 * out.beta * in.a_m * in.Bt_T / in.Ip_MA);
  out.beta_p = out.beta / floor_eps(out.eps, cfg.numerics.eps);

  // Cylindrical q95 proxy: trends only, not an equilibrium.
  if (in.Ip_MA > 0.0) {
    out.q95 = (2.0 * kPi * in.R0_m * in.Bt_T / (kMu0 * Ip_A)) * out.eps /
              floor_eps(in.kappa, 1e-6);
  } else if (in.Ip_MA == 0.0 && is_finite(out.eps)) {
    out.q95 = kInf;
  }
  out.q0 = std::isnan(out.q95) ? kNaN : (0.5 * out.q95 < 0.2 ? 0.2 : 0.5 * out.q95);

  out.f_bs = bootstrap_fraction(cfg.model.bootstrap, out.betaN, out.beta_p, out.q95, out.eps, in.C_bs);
  if (std::isnan(out.betaN) || std::isnan(out.q95)) out.f_bs = kNaN;

  // Martin-08 L-H threshold (line-average density approximated by ne20).
  if (out.ne20 > 0.0 && in.Bt_T > 0.0 && out.S_m2 > 0.0) {
    out.P_LH_MW = 0.0488 * std::pow(out.ne20, 0.717) * std::pow(in.Bt_T, 0.803) *
                  std::pow(out.S_m2, 0.941) * (2.0 / in.A_eff);
    out.LH_margin = out.P_SOL_MW / floor_eps(out.P_LH_MW, cfg.numerics.eps);
  }

  // Outboard midplane poloidal field and Eich-14 lambda_q.
  if (is_finite(out.eps)) {
    out.Bpol_T = kMu0 * Ip_A / (2.0 * kPi * in.a_m);
    if (out.Bpol_T > 0.0) {
      out.lambda_q_mm = in.lambda_q_mult * cfg.calibration.lambda_q * 0.63 * std::pow(out.Bpol_T, -1.19);
    }
  }
}

}  // namespace fusion::physics
