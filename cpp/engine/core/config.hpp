#pragma once
/*
================================================================================
Fragment 1.4 — Core: Evaluation Configuration
FILE: cpp/engine/core/config.hpp

Purpose:
  - Centralize every knob that is NOT a point-design parameter:
      * calibration multipliers
      * model switches (comparator confinement scaling, bootstrap model, ...)
      * numerical floors
      * root-finder / target-solver / frontier / cache settings
  - EvalConfig is passed explicitly to evaluate(inputs, config). There is no
    global model state. Model switches, calibration and numerical floors
    enter the evaluation key (eval_key.cpp); solver, frontier and cache
    settings do not.

Hardening:
  - validate_or_throw() on every struct rejects nonsensical values early.
================================================================================
*/

#include <cstdint>
#include <string>
#include <string_view>

#include "engine/core/errors.hpp"

namespace fusion {

// ----------------------------- Model switches --------------------------------
enum class ConfinementScaling : int {
  IPB98y2 = 0,
  ITER89P = 1,
  KayeGoldston = 2,
  NeoAlcator = 3,
  Mirnov = 4,
  Shimomura = 5,
};

enum class BootstrapModel : int {
  Proxy = 0,     // C_bs * betaN / q95
  Improved = 1,  // smooth beta_p / q95 / eps dependence
};

const char* to_string(ConfinementScaling s) noexcept;
const char* to_string(BootstrapModel m) noexcept;

// Text -> enum. Unknown names throw ConfigurationError.
ConfinementScaling parse_confinement_scaling(std::string_view s);
BootstrapModel parse_bootstrap_model(std::string_view s);

struct ModelOptions {
  // Comparator scaling used for H_scaling and the power-balance residual.
  // H98 is always reported against IPB98(y,2).
  ConfinementScaling comparator_scaling = ConfinementScaling::IPB98y2;

  BootstrapModel bootstrap = BootstrapModel::Proxy;

  // Core radiation as a fixed fraction of heating power.
  bool radiation_enabled = true;

  // Count (1 - f_bs) * Ip current drive power in recirculating power.
  bool include_current_drive = false;

  void validate_or_throw() const {}
};

// ----------------------------- Calibration -----------------------------------
// Multiplicative factors on proxy relations. 1.0 = uncalibrated.
struct CalibrationFactors {
  double confinement = 1.0;
  double lambda_q = 1.0;
  double hts_jc = 1.0;
  double fusion_power = 1.0;

  void validate_or_throw() const {
    auto sane = [](double x) { return x >= 0.1 && x <= 10.0; };
    if (!sane(confinement))  throw ValidationError("CalibrationFactors: confinement outside sane bounds");
    if (!sane(lambda_q))     throw ValidationError("CalibrationFactors: lambda_q outside sane bounds");
    if (!sane(hts_jc))       throw ValidationError("CalibrationFactors: hts_jc outside sane bounds");
    if (!sane(fusion_power)) throw ValidationError("CalibrationFactors: fusion_power outside sane bounds");
  }
};

// ----------------------------- Numerical -------------------------------------
struct NumericalSettings {
  // Floor applied to valid denominators.
  double eps = 1e-9;

  // Lower bound on P_SOL (MW) so loss-power scalings stay defined.
  double psol_floor_MW = 1e-9;

  void validate_or_throw() const {
    if (eps <= 0.0 || eps > 1e-3) {
      throw ValidationError("NumericalSettings: eps outside sane bounds");
    }
    if (psol_floor_MW <= 0.0 || psol_floor_MW > 1.0) {
      throw ValidationError("NumericalSettings: psol_floor_MW outside sane bounds");
    }
  }
};

// ----------------------------- Root finding ----------------------------------
struct RootFindSettings {
  double tol = 1e-4;
  int max_iter = 80;

  // Exhausting max_iter without |residual| < tol returns ok = this flag.
  // true keeps the historical "accept the narrowed midpoint" behaviour.
  bool treat_exhaustion_as_success = true;

  void validate_or_throw() const {
    if (!(tol > 0.0) || tol > 1.0) {
      throw ValidationError("RootFindSettings: tol outside sane bounds");
    }
    if (max_iter < 1 || max_iter > 10000) {
      throw ValidationError("RootFindSettings: max_iter outside sane bounds");
    }
  }
};

// ----------------------------- Target solver ---------------------------------
struct SolverSettings {
  // Relative tolerance: |value - target| <= tol * max(|target|, 1).
  double tol = 1e-3;
  int max_iter = 30;

  // Initial line-search step fraction.
  double damping = 0.6;

  // Trust radius in scaled variable units.
  double trust_delta = 5.0;
  double trust_min = 1e-6;
  double trust_max = 50.0;

  // Finite-difference step: max(fd_min_step, fd_rel_step * |x|).
  double fd_rel_step = 0.02;
  double fd_min_step = 1e-6;

  int max_linesearch = 8;

  // Consecutive iterations pinned at a bound without improvement.
  int bound_stall_iters = 3;

  void validate_or_throw() const {
    if (!(tol > 0.0) || tol > 0.5) {
      throw ValidationError("SolverSettings: tol outside sane bounds");
    }
    if (max_iter < 1 || max_iter > 10000) {
      throw ValidationError("SolverSettings: max_iter outside sane bounds");
    }
    if (!(damping > 0.0) || damping > 1.0) {
      throw ValidationError("SolverSettings: damping must be (0,1]");
    }
    if (!(trust_min > 0.0) || !(trust_max >= trust_min) ||
        trust_delta < trust_min || trust_delta > trust_max) {
      throw ValidationError("SolverSettings: trust region bounds inconsistent");
    }
    if (!(fd_rel_step > 0.0) || fd_rel_step > 0.5 || !(fd_min_step > 0.0)) {
      throw ValidationError("SolverSettings: finite-difference step outside sane bounds");
    }
    if (max_linesearch < 1 || max_linesearch > 60) {
      throw ValidationError("SolverSettings: max_linesearch outside sane bounds");
    }
    if (bound_stall_iters < 1) {
      throw ValidationError("SolverSettings: bound_stall_iters must be >= 1");
    }
  }
};

// ----------------------------- Frontier --------------------------------------
struct FrontierSettings {
  int n_random = 200;
  uint64_t seed = 1;

  // Midpoint + box corners before random samples (corners only for <= 10 levers).
  bool corner_probes = false;

  // Worker threads for sample evaluation. Result does not depend on this.
  int n_threads = 1;

  void validate_or_throw() const {
    if (n_random < 0 || n_random > 10000000) {
      throw ValidationError("FrontierSettings: n_random outside sane bounds");
    }
    if (n_threads < 1 || n_threads > 256) {
      throw ValidationError("FrontierSettings: n_threads outside sane bounds");
    }
  }
};

// ----------------------------- Cache -----------------------------------------
struct CacheSettings {
  bool enabled = true;
  size_t max_entries = 4096;

  void validate_or_throw() const {
    if (enabled && max_entries == 0) {
      throw ValidationError("CacheSettings: max_entries must be > 0 when enabled");
    }
  }
};

// ----------------------------- EvalConfig ------------------------------------
struct EvalConfig {
  ModelOptions model;
  CalibrationFactors calibration;
  NumericalSettings numerics;
  RootFindSettings root_find;
  SolverSettings solver;
  FrontierSettings frontier;
  CacheSettings cache;

  void validate_or_throw() const {
    model.validate_or_throw();
    calibration.validate_or_throw();
    numerics.validate_or_throw();
    root_find.validate_or_throw();
    solver.validate_or_throw();
    frontier.validate_or_throw();
    cache.validate_or_throw();
  }

  static EvalConfig defaults() {
    EvalConfig c;
    return c;
  }
};

}  // namespace fusion
