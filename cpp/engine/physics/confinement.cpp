#include "engine/physics/confinement.hpp"

#include <cmath>

#include "engine/core/numeric.hpp"

namespace fusion::physics {

namespace {

bool positive(double x) noexcept { return is_finite(x) && x > 0.0; }

bool common_ok(const ScalingParams& p) noexcept {
  return positive(p.Ip_MA) && positive(p.Bt_T) && positive(p.ne20) && positive(p.Ploss_MW) &&
         positive(p.R_m) && positive(p.a_m) && positive(p.kappa) && positive(p.M_amu);
}

double tau_iter89p(const ScalingParams& p) noexcept {
  return 0.038 * std::pow(p.Ip_MA, 0.85) * std::pow(p.Bt_T, 0.2) * std::pow(p.ne20, 0.1) *
         std::pow(p.Ploss_MW, -0.5) * std::pow(p.R_m, 1.5) * std::pow(p.a_m, 0.3) *
         std::pow(p.kappa, 0.5) * std::pow(p.M_amu, 0.5);
}

double tau_kaye_goldston(const ScalingParams& p) noexcept {
  const double num = 0.055 * std::pow(p.kappa, 0.28) * std::pow(p.Ip_MA, 1.24) *
                     std::pow(p.ne20, 0.26) * std::pow(p.R_m, 1.65) * std::sqrt(p.M_amu / 1.5);
  const double den = std::pow(p.Bt_T, 0.09) * std::pow(p.a_m, 0.49) * std::pow(p.Ploss_MW, 0.58);
  return num / den;
}

double tau_neo_alcator(const ScalingParams& p) noexcept {
  if (!positive(p.q_star)) return kNaN;
  return 0.07 * p.ne20 * p.a_m * p.R_m * p.R_m * p.q_star;
}

double tau_mirnov(const ScalingParams& p) noexcept {
  return 0.2 * p.a_m * std::sqrt(p.kappa) * p.Ip_MA;
}

double tau_shimomura(const ScalingParams& p) noexcept {
  return 0.045 * p.R_m * p.a_m * p.Bt_T * std::sqrt(p.kappa) * std::sqrt(p.M_amu);
}

}  // namespace

double tau_ipb98y2(const ScalingParams& p) noexcept {
  if (!common_ok(p)) return kNaN;
  const double eps = p.a_m / p.R_m;
  return 0.0562 * std::pow(p.Ip_MA, 0.93) * std::pow(p.Bt_T, 0.15) * std::pow(p.ne20, 0.41) *
         std::pow(p.Ploss_MW, -0.69) * std::pow(p.R_m, 1.97) * std::pow(eps, 0.58) *
         std::pow(p.kappa, 0.78) * std::pow(p.M_amu, 0.19);
}

double tau_scaling(ConfinementScaling which, const ScalingParams& p) noexcept {
  if (!common_ok(p)) return kNaN;
  switch (which) {
    case ConfinementScaling::IPB98y2:      return tau_ipb98y2(p);
    case ConfinementScaling::ITER89P:      return tau_iter89p(p);
    case ConfinementScaling::KayeGoldston: return tau_kaye_goldston(p);
    case ConfinementScaling::NeoAlcator:   return tau_neo_alcator(p);
    case ConfinementScaling::Mirnov:       return tau_mirnov(p);
    case ConfinementScaling::Shimomura:    return tau_shimomura(p);
  }
  return kNaN;
}

}  // namespace fusion::physics
