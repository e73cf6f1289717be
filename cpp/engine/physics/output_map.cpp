#include "engine/physics/output_map.hpp"

namespace fusion {

#define FUSION_OUT(name) OutputField{#name, &OutputMap::name}

const std::vector<OutputField>& output_fields() {
  static const std::vector<OutputField> kFields = {
      FUSION_OUT(V_m3), FUSION_OUT(S_m2), FUSION_OUT(A_fw_m2), FUSION_OUT(aspect), FUSION_OUT(eps),

      FUSION_OUT(n_GW_20), FUSION_OUT(ne20), FUSION_OUT(ne_m3), FUSION_OUT(fG_eff), FUSION_OUT(Ti_keV), FUSION_OUT(Te_keV),

      FUSION_OUT(sigmav_DT_m3_s), FUSION_OUT(Pfus_DT_MW), FUSION_OUT(Pfus_MW),
      FUSION_OUT(P_neutron_MW), FUSION_OUT(P_alpha_MW),

      FUSION_OUT(Pin_MW), FUSION_OUT(Prad_core_MW), FUSION_OUT(P_SOL_MW), FUSION_OUT(Ploss_MW),
      FUSION_OUT(P_SOL_over_R_MW_m), FUSION_OUT(W_MJ), FUSION_OUT(tauE_s), FUSION_OUT(tauIPB98_s),
      FUSION_OUT(tau_scaling_s), FUSION_OUT(H98), FUSION_OUT(H_scaling), FUSION_OUT(H_required),
      FUSION_OUT(power_balance_residual_MW), FUSION_OUT(Q_DT_eqv),

      FUSION_OUT(beta), FUSION_OUT(betaN), FUSION_OUT(beta_p), FUSION_OUT(q95), FUSION_OUT(q0),
      FUSION_OUT(f_bs), FUSION_OUT(Bpol_T), FUSION_OUT(lambda_q_mm), FUSION_OUT(P_LH_MW),
      FUSION_OUT(LH_margin),

      FUSION_OUT(R_coil_inner_m), FUSION_OUT(B_peak_T), FUSION_OUT(sigma_hoop_MPa),
      FUSION_OUT(sigma_vm_MPa), FUSION_OUT(hts_Jc_norm), FUSION_OUT(hts_margin),
      FUSION_OUT(I_tf_MA), FUSION_OUT(E_tf_GJ), FUSION_OUT(V_dump_kV),

      FUSION_OUT(A_wet_m2), FUSION_OUT(q_div_MW_m2), FUSION_OUT(q_midplane_MW_m2), FUSION_OUT(L_par_m),

      FUSION_OUT(TBR), FUSION_OUT(neutron_wall_load_MW_m2), FUSION_OUT(shield_capture_frac),
      FUSION_OUT(hts_fluence_per_fpy), FUSION_OUT(hts_lifetime_yr),

      FUSION_OUT(I_cd_MA), FUSION_OUT(P_cd_MW), FUSION_OUT(P_th_MW), FUSION_OUT(P_e_gross_MW),
      FUSION_OUT(P_recirc_MW), FUSION_OUT(P_net_MW), FUSION_OUT(Qe),

      FUSION_OUT(availability), FUSION_OUT(CAPEX_MUSD), FUSION_OUT(OPEX_MUSD_yr), FUSION_OUT(COE_USD_MWh),
  };
  return kFields;
}

#undef FUSION_OUT

namespace {

const OutputField* find_output(std::string_view key) noexcept {
  for (const auto& f : output_fields()) {
    if (key == f.name) return &f;
  }
  return nullptr;
}

}  // namespace

double OutputMap::get(std::string_view key) const {
  if (const OutputField* f = find_output(key)) return this->*(f->member);
  auto it = aux.find(std::string(key));
  return it == aux.end() ? kNaN : it->second;
}

bool OutputMap::has(std::string_view key) const {
  return find_output(key) != nullptr || aux.count(std::string(key)) > 0;
}

void OutputMap::set(std::string_view key, double value) {
  if (const OutputField* f = find_output(key)) {
    this->*(f->member) = value;
    return;
  }
  aux[std::string(key)] = value;
}

void OutputMap::for_each(const std::function<void(const std::string&, double)>& fn) const {
  for (const auto& f : output_fields()) fn(f.name, this->*(f.member));
  for (const auto& [k, v] : aux) fn(k, v);
}

std::vector<std::string> OutputMap::keys() const {
  std::vector<std::string> out;
  out.reserve(output_fields().size() + aux.size());
  for_each([&out](const std::string& k, double) { out.push_back(k); });
  return out;
}

bool OutputMap::is_schema_key(std::string_view key) noexcept {
  return find_output(key) != nullptr;
}

}  // namespace fusion
