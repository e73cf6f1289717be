/*
================================================================================
Fragment 2.3c — Physics: Plant Closure, Availability, Cost
FILE: cpp/engine/physics/plant_blocks.cpp

Blocks 9-10. Cost figures are relative proxies (MUSD-like units) meant for
comparing points, not for absolute costing.
================================================================================
*/

#include "engine/physics/relation_blocks.hpp"

#include <cmath>

#include "engine/core/numeric.hpp"

namespace fusion::physics {

namespace {

// Cost proxy coefficients.
constexpr double kMagnetCostPerT2m2 = 0.12;
constexpr double kMagnetAreaShare = 0.5;
constexpr double kBlanketCostPerM3 = 0.08;
constexpr double kBopCostPerMWth = 0.35;
constexpr double kCryoCostPerMWe = 6.0;
constexpr double kOpexPerMWhRecirc_USD = 60.0;
constexpr double kOpexPerNWL = 15.0;
constexpr double kMaxOutageFrac = 0.5;

}  // namespace

// ---------------------------------------------------------------------------
// 9. Plant power closure
// ---------------------------------------------------------------------------
void eval_plant(const PointInputs& in, const EvalConfig& cfg, OutputMap& out) {
  const double eps = cfg.numerics.eps;

  out.I_cd_MA = (1.0 - out.f_bs) * in.Ip_MA;
  out.P_cd_MW = cfg.model.include_current_drive
                    ? out.I_cd_MA / floor_eps(in.eta_cd_MA_per_MW, eps)
                    : 0.0;

  out.P_th_MW = in.blanket_energy_mult * out.Pfus_MW;
  out.P_e_gross_MW = in.eta_elec * out.P_th_MW;

  const double P_cryo_e = in.P_cryo_cold_MW / floor_eps(in.cryo_COP, eps);
  out.P_recirc_MW = in.Paux_MW / floor_eps(in.eta_aux, eps) +
                    out.P_cd_MW / floor_eps(in.eta_cd_wallplug, eps) +
                    in.P_BOP_MW + in.P_pumps_MW + P_cryo_e;

  out.P_net_MW = out.P_e_gross_MW - out.P_recirc_MW;
  out.Qe = out.P_e_gross_MW / floor_eps(out.P_recirc_MW, eps);
}

// ---------------------------------------------------------------------------
// 10. Availability + cost
// ---------------------------------------------------------------------------
void eval_availability_cost(const PointInputs& in, const EvalConfig& cfg, OutputMap& out) {
  out.availability = clamp(1.0 - clamp(in.planned_outage_frac, 0.0, kMaxOutageFrac) -
                               clamp(in.forced_outage_frac, 0.0, kMaxOutageFrac),
                           0.0, 1.0);

  const double area = out.S_m2;
  const double magnet = kMagnetCostPerT2m2 * sq(out.B_peak_T) * area * kMagnetAreaShare;
  const double blanket = kBlanketCostPerM3 * area * in.t_shield_m;
  const double bop = kBopCostPerMWth * out.P_th_MW;
  const double cryo = kCryoCostPerMWe * in.P_cryo_cold_MW / floor_eps(in.cryo_COP, cfg.numerics.eps);
  out.CAPEX_MUSD = magnet + blanket + bop + cryo;

  const double hours = kHoursPerYear * out.availability;
  out.OPEX_MUSD_yr = kOpexPerMWhRecirc_USD * out.P_recirc_MW * hours / 1e6 +
                     kOpexPerNWL * out.neutron_wall_load_MW_m2;

  const double annual = in.fixed_charge_rate * out.CAPEX_MUSD + out.OPEX_MUSD_yr;
  if (std::isnan(annual) || std::isnan(out.P_net_MW)) return;
  if (out.P_net_MW > 0.0 && hours > 0.0) {
    out.COE_USD_MWh = annual * 1e6 / (out.P_net_MW * hours);
  } else {
    // No net export: cost of electricity is unbounded.
    out.COE_USD_MWh = kInf;
  }
}

}  // namespace fusion::physics
