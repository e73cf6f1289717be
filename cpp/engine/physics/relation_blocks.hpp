#pragma once
/*
================================================================================
Fragment 2.3 — Physics: Closed-Form Relation Blocks
FILE: cpp/engine/physics/relation_blocks.hpp

Purpose:
  - One function per physics block. Each reads PointInputs plus OutputMap
    fields written by EARLIER blocks and writes its own fields. The order in
    point_evaluator.cpp is the only valid order.

Order:
   1. geometry           plasma_blocks.cpp
   2. density
   3. fusion power
   4. power balance / confinement
   5. operational limits (beta, q, bootstrap, L-H, lambda_q)
   6. radial build + TF magnet      engineering_blocks.cpp
   7. divertor / exhaust
   8. neutronics
   9. plant power closure           plant_blocks.cpp
  10. availability + cost

NaN policy:
  - A block never throws on bad values. Invalid geometry leaves every
    geometry field NaN and each dependent block produces NaN from it.
================================================================================
*/

#include "engine/core/config.hpp"
#include "engine/core/point_inputs.hpp"
#include "engine/physics/output_map.hpp"

namespace fusion::physics {

void eval_geometry(const PointInputs& in, const EvalConfig& cfg, OutputMap& out);
void eval_density(const PointInputs& in, const EvalConfig& cfg, OutputMap& out);
void eval_fusion_power(const PointInputs& in, const EvalConfig& cfg, OutputMap& out);
void eval_power_balance(const PointInputs& in, const EvalConfig& cfg, OutputMap& out);
void eval_operational_limits(const PointInputs& in, const EvalConfig& cfg, OutputMap& out);

void eval_radial_build_magnet(const PointInputs& in, const EvalConfig& cfg, OutputMap& out);
void eval_divertor(const PointInputs& in, const EvalConfig& cfg, OutputMap& out);
void eval_neutronics(const PointInputs& in, const EvalConfig& cfg, OutputMap& out);

void eval_plant(const PointInputs& in, const EvalConfig& cfg, OutputMap& out);
void eval_availability_cost(const PointInputs& in, const EvalConfig& cfg, OutputMap& out);

// Normalized REBCO critical current Jc(B,T)/Jc(0,0). Zero at or above Tc.
double rebco_jc_norm(double B_T, double T_K) noexcept;

// Bootstrap fraction, clamped to [0, 0.95].
double bootstrap_fraction(BootstrapModel model, double betaN, double beta_p,
                          double q95, double eps, double C_bs) noexcept;

}  // namespace fusion::physics
