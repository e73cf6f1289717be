#pragma once
/*
================================================================================
Fragment 2.1 — Physics: D-T Reactivity (Bosch-Hale)
FILE: cpp/engine/physics/reactivity.hpp

Model:
  - Bosch & Hale (1992) parameterization of <sigma v> for D(T,n)He4,
    valid 0.2 - 100 keV.
      theta = T / (1 - T(C2 + T(C4 + T C6)) / (1 + T(C3 + T(C5 + T C7))))
      xi    = (B_G^2 / (4 theta))^(1/3)
      <sv>  = C1 theta sqrt(xi / (m_r c^2 T^3)) exp(-3 xi)      [cm^3/s]

Notes:
  - T <= 0 or non-finite T returns NaN.
================================================================================
*/

namespace fusion::physics {

// Energy released per D-T reaction (MeV).
inline constexpr double kE_DT_MeV = 17.6;

// <sigma v> in m^3/s at ion temperature T_keV.
double bosch_hale_sigmav_DT(double T_keV) noexcept;

}  // namespace fusion::physics
