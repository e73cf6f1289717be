#pragma once
/*
===============================================================================
Fragment 4.3 — Solvers: Point Solvers (Q and H98 matching)
FILE: cpp/engine/solvers/point_solver.hpp
===============================================================================
Objective:
  - Two canned solves used by the CLI and by design studies:
      solve_fG_for_Q           fG such that Q_DT_eqv == Q_target
      solve_Ip_for_H98_with_Q  (Ip_MA, fG) such that H98 and Q_DT_eqv match

Clamping:
  - When Q_target is not bracketed inside [fG_lo, fG_hi], the result is
    clamped to the bound with the smaller |residual| and flagged. The output
    aux map then carries:
      solver_clamped_Q  (1/0)   solver_clamped_Q_on (0 = lo, 1 = hi)
      Q_target  Q_at_bound  Q_residual
    Clamping still reports ok = true with clamped = true, so callers must
    check the flag.

Integration:
  - Inputs/outputs are plain PointInputs/OutputMap; no limit checks here.
===============================================================================
*/

#include <string>

#include "engine/core/config.hpp"
#include "engine/core/point_inputs.hpp"
#include "engine/physics/eval_cache.hpp"
#include "engine/physics/output_map.hpp"

namespace fusion::solvers {

struct PointSolveResult {
  PointInputs inputs;
  OutputMap outputs;
  bool ok = false;
  bool clamped = false;
  std::string clamped_on;   // "fG_lo" | "fG_hi" | "Ip_lo" | "Ip_hi" | ""
  std::string method;       // "bisect" | "coupled" | "nested_bisect"
  int iterations = 0;
  std::string message;
};

// Uses cfg.root_find for the bisection tolerance/budget. Bounds must satisfy
// 0 < lo <= hi (ConfigurationError otherwise).
PointSolveResult solve_fG_for_Q(const PointInputs& base, double Q_target, double fG_lo, double fG_hi,
                                const EvalConfig& cfg, physics::EvalCache* cache = nullptr);

// Coupled 2x2 solve first; nested bisection (outer Ip, inner fG) when the
// coupled solve does not converge.
PointSolveResult solve_Ip_for_H98_with_Q(const PointInputs& base, double H98_target, double Q_target,
                                         double Ip_lo, double Ip_hi, double fG_lo, double fG_hi,
                                         const EvalConfig& cfg, physics::EvalCache* cache = nullptr);

}  // namespace fusion::solvers
