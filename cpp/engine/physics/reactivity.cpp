#include "engine/physics/reactivity.hpp"

#include <cmath>

#include "engine/core/numeric.hpp"

namespace fusion::physics {

namespace {

constexpr double kBG = 34.3827;      // sqrt(keV)
constexpr double kMRC2 = 1124656.0;  // keV
constexpr double kC1 = 1.17302e-9;
constexpr double kC2 = 1.51361e-2;
constexpr double kC3 = 7.51886e-2;
constexpr double kC4 = 4.60643e-3;
constexpr double kC5 = 1.35e-2;
constexpr double kC6 = -1.0675e-4;
constexpr double kC7 = 1.366e-5;

}  // namespace

double bosch_hale_sigmav_DT(double T_keV) noexcept {
  if (!is_finite(T_keV) || T_keV <= 0.0) return kNaN;

  const double T = T_keV;
  const double num = T * (kC2 + T * (kC4 + T * kC6));
  const double den = 1.0 + T * (kC3 + T * (kC5 + T * kC7));
  const double theta = T / (1.0 - num / den);
  if (!(theta > 0.0)) return kNaN;

  const double xi = std::cbrt(kBG * kBG / (4.0 * theta));
  const double sv_cm3 = kC1 * theta * std::sqrt(xi / (kMRC2 * T * T * T)) * std::exp(-3.0 * xi);
  return sv_cm3 * 1e-6;
}

}  // namespace fusion::physics
