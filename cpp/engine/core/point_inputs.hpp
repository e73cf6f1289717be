#pragma once
/*
================================================================================
Fragment 1.11 — Core: Point-Design Inputs
FILE: cpp/engine/core/point_inputs.hpp

Purpose:
  - The single canonical parameter vector consumed by the point evaluator,
    the constraint table builder, the solvers and the frontier search.
  - Name <-> member mapping is a static table so solvers and the JSON layer
    can address fields by key without reflection.

Hardening:
  - Explicit units in every field name.
  - The eight structural fields default to NaN; from_fields() rejects a map
    that does not supply them. Out-of-domain VALUES are accepted and show up
    as NaN outputs downstream.
  - Limit fields set to NaN mean "limit not requested".
================================================================================
*/

#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"

namespace fusion {

struct PointInputs {
  static constexpr double kUnset = std::numeric_limits<double>::quiet_NaN();

  // ---- Required geometry / plasma ----
  double R0_m = kUnset;
  double a_m = kUnset;
  double kappa = kUnset;
  double Bt_T = kUnset;
  double Ip_MA = kUnset;
  double Ti_keV = kUnset;
  double fG = kUnset;
  double Paux_MW = kUnset;

  // ---- Plasma composition / transport ----
  double Ti_over_Te = 2.0;
  double A_eff = 2.5;             // mean ion mass (amu)
  double dilution_fuel = 0.85;
  double f_He_ash = 0.0;          // helium ash fraction of ne
  double alpha_loss_frac = 0.05;
  double f_rad_core = 0.20;
  double confinement_mult = 1.0;
  double C_bs = 0.15;

  // ---- Exhaust ----
  double lambda_q_mult = 1.0;
  double flux_expansion = 5.0;
  double n_strike_points = 2.0;
  double f_rad_div = 0.30;
  double f_Lpar = 1.0;

  // ---- Inboard radial build (m) ----
  double t_fw_m = 0.02;
  double t_blanket_m = 0.50;
  double t_shield_m = 0.70;
  double t_vv_m = 0.05;
  double t_gap_m = 0.03;
  double t_tf_wind_m = 0.20;
  double t_tf_struct_m = 0.15;

  // ---- TF magnet ----
  double Bpeak_factor = 1.05;
  double Tcoil_K = 20.0;
  double hts_Jc_mult = 1.0;
  double hts_strain = 0.0;
  double tf_turns_total = 3600.0;
  double tf_volume_factor = 1.0;
  double tau_dump_s = 10.0;

  // ---- Neutronics ----
  double blanket_coverage = 0.80;
  double TBR_mult = 1.10;
  double lambda_blanket_m = 0.30;
  double lambda_shield_m = 0.25;
  double f_geom_hts = 0.05;
  double hts_fluence_limit_n_m2 = 3.0e22;

  // ---- Plant ----
  double blanket_energy_mult = 1.10;
  double eta_elec = 0.40;
  double eta_aux = 0.40;
  double eta_cd_wallplug = 0.33;
  double eta_cd_MA_per_MW = 0.05;
  double P_BOP_MW = 20.0;
  double P_pumps_MW = 5.0;
  double P_cryo_cold_MW = 0.10;
  double cryo_COP = 0.02;

  // ---- Availability / cost ----
  double planned_outage_frac = 0.05;
  double forced_outage_frac = 0.10;
  double fixed_charge_rate = 0.10;

  // ---- Allowables (NaN = not requested) ----
  double q95_min = kUnset;
  double q95_max = kUnset;
  double q0_min = 1.0;
  double betaN_max = 3.0;
  double fG_max = 1.0;
  double H98_allow = 1.5;
  double q_div_max_MW_m2 = 10.0;
  double P_SOL_over_R_max_MW_m = 25.0;
  double q_midplane_max_MW_m2 = kUnset;
  double Bpeak_allow_T = 25.0;
  double sigma_allow_MPa = 800.0;
  double hts_margin_min = 1.2;
  double hts_lifetime_min_yr = 5.0;
  double TBR_min = 1.05;
  double neutron_wall_load_max_MW_m2 = 2.5;
  double Vdump_max_kV = 20.0;
  double P_net_min_MW = 0.0;
  double COE_max_USD_MWh = kUnset;
  double require_Hmode = 0.0;     // 1 = L-H access is a hard limit

  // Build from a name -> value map. Missing required field or unknown key
  // throws ConfigurationError.
  static PointInputs from_fields(const std::map<std::string, double>& fields);

  // Reference point used by the CLI when no input file is given.
  static PointInputs reference();

  // Field lookup / copy-with-override. Unknown key throws ConfigurationError.
  double get(std::string_view key) const;
  PointInputs with(std::string_view key, double value) const;
  PointInputs with(const std::map<std::string, double>& overrides) const;

  std::map<std::string, double> to_fields() const;

  // Declaration order, required fields first.
  static std::vector<std::string> field_names();

  static bool has_field(std::string_view key) noexcept;
  static bool is_required(std::string_view key) noexcept;
};

struct InputField {
  const char* name;
  double PointInputs::*member;
  bool required;
};

// Declaration-ordered field table.
const std::vector<InputField>& input_fields();

}  // namespace fusion
