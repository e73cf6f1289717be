#pragma once
/*
================================================================================
Fragment 2.0 — Physics: Output Schema
FILE: cpp/engine/physics/output_map.hpp

Purpose:
  - Fixed, versioned output record of one point evaluation.
  - The constraint ledger addresses outputs by key; get() resolves the key
    against the schema table first and the aux extension map second.

Rules:
  - Every schema field starts as NaN. A block that cannot compute a value
    leaves it NaN.
  - aux holds diagnostics that are not part of the schema (solver flags,
    residuals). Keys there must not shadow schema keys.
================================================================================
*/

#include <functional>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fusion {

inline constexpr const char* kOutputSchemaVersion = "fusion.outputs.v1";

struct OutputMap {
  static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

  // ---- Geometry ----
  double V_m3 = kNaN;
  double S_m2 = kNaN;
  double A_fw_m2 = kNaN;
  double aspect = kNaN;
  double eps = kNaN;

  // ---- Density / temperature ----
  double n_GW_20 = kNaN;
  double ne20 = kNaN;
  double ne_m3 = kNaN;
  double fG_eff = kNaN;          // ne / n_GW
  double Ti_keV = kNaN;
  double Te_keV = kNaN;

  // ---- Fusion power ----
  double sigmav_DT_m3_s = kNaN;
  double Pfus_DT_MW = kNaN;     // before fuel dilution
  double Pfus_MW = kNaN;
  double P_neutron_MW = kNaN;
  double P_alpha_MW = kNaN;

  // ---- Power balance / confinement ----
  double Pin_MW = kNaN;
  double Prad_core_MW = kNaN;
  double P_SOL_MW = kNaN;
  double Ploss_MW = kNaN;
  double P_SOL_over_R_MW_m = kNaN;
  double W_MJ = kNaN;
  double tauE_s = kNaN;
  double tauIPB98_s = kNaN;
  double tau_scaling_s = kNaN;
  double H98 = kNaN;
  double H_scaling = kNaN;
  double H_required = kNaN;     // W/Ploss over tau_IPB98
  double power_balance_residual_MW = kNaN;
  double Q_DT_eqv = kNaN;

  // ---- Operational limits ----
  double beta = kNaN;
  double betaN = kNaN;
  double beta_p = kNaN;
  double q95 = kNaN;
  double q0 = kNaN;
  double f_bs = kNaN;
  double Bpol_T = kNaN;
  double lambda_q_mm = kNaN;
  double P_LH_MW = kNaN;
  double LH_margin = kNaN;       // P_SOL / P_LH

  // ---- Radial build / TF magnet ----
  double R_coil_inner_m = kNaN;
  double B_peak_T = kNaN;
  double sigma_hoop_MPa = kNaN;
  double sigma_vm_MPa = kNaN;
  double hts_Jc_norm = kNaN;
  double hts_margin = kNaN;
  double I_tf_MA = kNaN;
  double E_tf_GJ = kNaN;
  double V_dump_kV = kNaN;

  // ---- Divertor / exhaust ----
  double A_wet_m2 = kNaN;
  double q_div_MW_m2 = kNaN;
  double q_midplane_MW_m2 = kNaN;
  double L_par_m = kNaN;

  // ---- Neutronics ----
  double TBR = kNaN;
  double neutron_wall_load_MW_m2 = kNaN;
  double shield_capture_frac = kNaN;
  double hts_fluence_per_fpy = kNaN;
  double hts_lifetime_yr = kNaN;

  // ---- Plant ----
  double I_cd_MA = kNaN;
  double P_cd_MW = kNaN;
  double P_th_MW = kNaN;
  double P_e_gross_MW = kNaN;
  double P_recirc_MW = kNaN;
  double P_net_MW = kNaN;
  double Qe = kNaN;

  // ---- Availability / cost ----
  double availability = kNaN;
  double CAPEX_MUSD = kNaN;
  double OPEX_MUSD_yr = kNaN;
  double COE_USD_MWh = kNaN;

  // Auxiliary diagnostics (ordered for stable serialization).
  std::map<std::string, double> aux;

  // Schema field or aux entry; NaN when absent.
  double get(std::string_view key) const;

  // True for schema keys and present aux keys.
  bool has(std::string_view key) const;

  // Schema key: assigns the field. Otherwise writes aux.
  void set(std::string_view key, double value);

  // Schema fields in declaration order, then aux entries.
  void for_each(const std::function<void(const std::string&, double)>& fn) const;

  std::vector<std::string> keys() const;

  static bool is_schema_key(std::string_view key) noexcept;
};

struct OutputField {
  const char* name;
  double OutputMap::*member;
};

const std::vector<OutputField>& output_fields();

}  // namespace fusion
