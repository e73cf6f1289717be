#pragma once
/*
===============================================================================
Fragment 1.3 — Core: NaN-Propagating Math Utilities
FILE: cpp/engine/core/numeric.hpp
===============================================================================
Contract:
  - Nothing here hides a NaN. An invalid operand stays NaN so the missing
    value shows up downstream as an "unknown" constraint, never as a pass.
  - Floors only protect *valid* denominators from division by zero.
===============================================================================
*/

#include <cmath>
#include <limits>
#include <type_traits>

namespace fusion {

inline constexpr double kPi   = 3.141592653589793238462643383279502884;
inline constexpr double kMu0  = 4.0e-7 * kPi;            // H/m
inline constexpr double kKeV_J = 1.602176634e-16;        // J per keV
inline constexpr double kMeV_J = 1.602176634e-13;        // J per MeV
inline constexpr double kSecondsPerYear = 3.15576e7;     // Julian year
inline constexpr double kHoursPerYear = 8760.0;

inline constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
inline constexpr double kInf = std::numeric_limits<double>::infinity();

inline bool is_finite(double x) noexcept {
  return std::isfinite(x) != 0;
}

// Comparisons against NaN are false on both sides, so NaN passes through.
template <typename T>
inline constexpr T clamp(T v, T lo, T hi) noexcept {
  static_assert(std::is_arithmetic<T>::value, "clamp requires arithmetic type");
  return (v < lo) ? lo : ((v > hi) ? hi : v);
}

// max(x, eps) for valid x; NaN stays NaN (std::max(eps, NaN) would not).
inline double floor_eps(double x, double eps) noexcept {
  return std::isnan(x) ? x : (x < eps ? eps : x);
}

inline double nan_unless(bool ok, double v) noexcept {
  return ok ? v : kNaN;
}

inline double sq(double x) noexcept { return x * x; }

}  // namespace fusion
