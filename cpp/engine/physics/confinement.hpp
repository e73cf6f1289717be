#pragma once
/*
================================================================================
Fragment 2.2 — Physics: Energy Confinement Scalings
FILE: cpp/engine/physics/confinement.hpp

Purpose:
  - Empirical tau_E scalings, selected by a closed enum (no registry).
  - IPB98(y,2) is the reference for H98; the comparator scaling chosen in
    EvalConfig::model drives H_scaling and the power-balance residual.

Units:
  - Ip [MA], Bt [T], ne20 [1e20 m^-3], P [MW], R/a [m], M [amu].
  - Returns tau_E [s]. Non-positive or NaN operands give NaN.
================================================================================
*/

#include "engine/core/config.hpp"

namespace fusion::physics {

struct ScalingParams {
  double Ip_MA = 0.0;
  double Bt_T = 0.0;
  double ne20 = 0.0;
  double Ploss_MW = 0.0;
  double R_m = 0.0;
  double a_m = 0.0;
  double kappa = 0.0;
  double M_amu = 2.5;
  double q_star = 0.0;   // only Neo-Alcator uses it
};

double tau_ipb98y2(const ScalingParams& p) noexcept;

// Dispatch on the closed set of supported scalings.
double tau_scaling(ConfinementScaling which, const ScalingParams& p) noexcept;

}  // namespace fusion::physics
