#include "engine/core/point_inputs.hpp"

namespace fusion {

#define FUSION_FIELD(name, req) InputField{#name, &PointInputs::name, req}

const std::vector<InputField>& input_fields() {
  static const std::vector<InputField> kFields = {
      FUSION_FIELD(R0_m, true),
      FUSION_FIELD(a_m, true),
      FUSION_FIELD(kappa, true),
      FUSION_FIELD(Bt_T, true),
      FUSION_FIELD(Ip_MA, true),
      FUSION_FIELD(Ti_keV, true),
      FUSION_FIELD(fG, true),
      FUSION_FIELD(Paux_MW, true),

      FUSION_FIELD(Ti_over_Te, false),
      FUSION_FIELD(A_eff, false),
      FUSION_FIELD(dilution_fuel, false),
      FUSION_FIELD(f_He_ash, false),
      FUSION_FIELD(alpha_loss_frac, false),
      FUSION_FIELD(f_rad_core, false),
      FUSION_FIELD(confinement_mult, false),
      FUSION_FIELD(C_bs, false),

      FUSION_FIELD(lambda_q_mult, false),
      FUSION_FIELD(flux_expansion, false),
      FUSION_FIELD(n_strike_points, false),
      FUSION_FIELD(f_rad_div, false),
      FUSION_FIELD(f_Lpar, false),

      FUSION_FIELD(t_fw_m, false),
      FUSION_FIELD(t_blanket_m, false),
      FUSION_FIELD(t_shield_m, false),
      FUSION_FIELD(t_vv_m, false),
      FUSION_FIELD(t_gap_m, false),
      FUSION_FIELD(t_tf_wind_m, false),
      FUSION_FIELD(t_tf_struct_m, false),

      FUSION_FIELD(Bpeak_factor, false),
      FUSION_FIELD(Tcoil_K, false),
      FUSION_FIELD(hts_Jc_mult, false),
      FUSION_FIELD(hts_strain, false),
      FUSION_FIELD(tf_turns_total, false),
      FUSION_FIELD(tf_volume_factor, false),
      FUSION_FIELD(tau_dump_s, false),

      FUSION_FIELD(blanket_coverage, false),
      FUSION_FIELD(TBR_mult, false),
      FUSION_FIELD(lambda_blanket_m, false),
      FUSION_FIELD(lambda_shield_m, false),
      FUSION_FIELD(f_geom_hts, false),
      FUSION_FIELD(hts_fluence_limit_n_m2, false),

      FUSION_FIELD(blanket_energy_mult, false),
      FUSION_FIELD(eta_elec, false),
      FUSION_FIELD(eta_aux, false),
      FUSION_FIELD(eta_cd_wallplug, false),
      FUSION_FIELD(eta_cd_MA_per_MW, false),
      FUSION_FIELD(P_BOP_MW, false),
      FUSION_FIELD(P_pumps_MW, false),
      FUSION_FIELD(P_cryo_cold_MW, false),
      FUSION_FIELD(cryo_COP, false),

      FUSION_FIELD(planned_outage_frac, false),
      FUSION_FIELD(forced_outage_frac, false),
      FUSION_FIELD(fixed_charge_rate, false),

      FUSION_FIELD(q95_min, false),
      FUSION_FIELD(q95_max, false),
      FUSION_FIELD(q0_min, false),
      FUSION_FIELD(betaN_max, false),
      FUSION_FIELD(fG_max, false),
      FUSION_FIELD(H98_allow, false),
      FUSION_FIELD(q_div_max_MW_m2, false),
      FUSION_FIELD(P_SOL_over_R_max_MW_m, false),
      FUSION_FIELD(q_midplane_max_MW_m2, false),
      FUSION_FIELD(Bpeak_allow_T, false),
      FUSION_FIELD(sigma_allow_MPa, false),
      FUSION_FIELD(hts_margin_min, false),
      FUSION_FIELD(hts_lifetime_min_yr, false),
      FUSION_FIELD(TBR_min, false),
      FUSION_FIELD(neutron_wall_load_max_MW_m2, false),
      FUSION_FIELD(Vdump_max_kV, false),
      FUSION_FIELD(P_net_min_MW, false),
      FUSION_FIELD(COE_max_USD_MWh, false),
      FUSION_FIELD(require_Hmode, false),
  };
  return kFields;
}

#undef FUSION_FIELD

namespace {

const InputField* find_field(std::string_view key) noexcept {
  for (const auto& f : input_fields()) {
    if (key == f.name) return &f;
  }
  return nullptr;
}

const InputField& field_or_throw(std::string_view key) {
  const InputField* f = find_field(key);
  if (!f) throw ConfigurationError("PointInputs: unknown field '" + std::string(key) + "'");
  return *f;
}

}  // namespace

PointInputs PointInputs::from_fields(const std::map<std::string, double>& fields) {
  PointInputs p;
  for (const auto& [key, value] : fields) {
    p.*(field_or_throw(key).member) = value;
  }
  for (const auto& f : input_fields()) {
    if (f.required && fields.find(f.name) == fields.end()) {
      throw ConfigurationError(std::string("PointInputs: missing required field '") + f.name + "'");
    }
  }
  return p;
}

PointInputs PointInputs::reference() {
  PointInputs p;
  p.R0_m = 1.81;
  p.a_m = 0.57;
  p.kappa = 1.8;
  p.Bt_T = 12.2;
  p.Ip_MA = 8.0;
  p.Ti_keV = 15.0;
  p.fG = 0.85;
  p.Paux_MW = 20.0;
  return p;
}

double PointInputs::get(std::string_view key) const {
  return this->*(field_or_throw(key).member);
}

PointInputs PointInputs::with(std::string_view key, double value) const {
  PointInputs p = *this;
  p.*(field_or_throw(key).member) = value;
  return p;
}

PointInputs PointInputs::with(const std::map<std::string, double>& overrides) const {
  PointInputs p = *this;
  for (const auto& [key, value] : overrides) {
    p.*(field_or_throw(key).member) = value;
  }
  return p;
}

std::map<std::string, double> PointInputs::to_fields() const {
  std::map<std::string, double> out;
  for (const auto& f : input_fields()) out.emplace(f.name, this->*(f.member));
  return out;
}

std::vector<std::string> PointInputs::field_names() {
  std::vector<std::string> out;
  out.reserve(input_fields().size());
  for (const auto& f : input_fields()) out.emplace_back(f.name);
  return out;
}

bool PointInputs::has_field(std::string_view key) noexcept {
  return find_field(key) != nullptr;
}

bool PointInputs::is_required(std::string_view key) noexcept {
  const InputField* f = find_field(key);
  return f && f->required;
}

}  // namespace fusion
