#pragma once
/*
===============================================================================
Fragment 4.2 — Solvers: Bounded Multi-Target Solver
FILE: cpp/engine/solvers/target_solver.hpp
===============================================================================
Objective:
  - Adjust n input variables inside their [lo, hi] box so that n output keys
    hit their target values simultaneously.

Algorithm (deterministic):
  - Variables scaled by their start magnitude, residuals by max(|target|, 1).
  - Forward-difference Jacobian, step max(fd_min_step, fd_rel_step * |x|),
    taken backwards when the forward step would leave the box.
  - Damped Newton step by Gaussian elimination with partial pivoting;
    steepest-descent fallback when the Jacobian is singular.
  - Step clipped to the trust radius, then a backtracking line search that
    accepts the first trial with a smaller residual norm. Every trial is
    clamped to the box.

Convergence:
  - |value - target| <= tol * max(|target|, 1) for every target. Checked at
    the start point first: an already-matching start returns ok with zero
    iterations and the start inputs unchanged.

Termination messages:
  converged | max_iter | no_descent | nonfinite_residual | bound_stall |
  dimension mismatch (ok = false, nothing evaluated)

Robustness wrappers:
  - solve_for_targets_multistart: same problem from several starts in the
    box; first converged start wins, else the lowest residual norm.
  - solve_for_targets_continuation: a tolerance ladder, each stage starting
    from the previous stage's solution; stops at the first failed stage.

No limit checking happens here. Build a ledger on the result if needed.
===============================================================================
*/

#include <map>
#include <string>
#include <vector>

#include "engine/core/config.hpp"
#include "engine/core/point_inputs.hpp"
#include "engine/physics/eval_cache.hpp"
#include "engine/physics/output_map.hpp"

namespace fusion::solvers {

struct TargetSpec {
  std::string key;     // OutputMap key
  double value = 0.0;
};

struct VariableSpec {
  std::string key;     // PointInputs field
  double x0 = 0.0;
  double lo = 0.0;
  double hi = 0.0;
};

struct TraceEntry {
  int iter = 0;
  std::vector<double> x;
  std::vector<double> residuals;   // target - value
  double residual_norm = 0.0;      // scaled 2-norm
  std::string method;              // "newton" | "descent"
  double trust_radius = 0.0;
  double step = 0.0;               // max |dx| in scaled units, accepted or last tried
  int linesearch_tries = 0;
  bool improved = false;
};

struct SolveReport {
  std::string status;
  std::map<std::string, double> best_achieved;       // target key -> value at result
  std::map<std::string, double> target_errors;       // target key -> target - value
  std::map<std::string, std::string> active_bounds;  // variable key -> "lo" | "hi" | ""
  double residual_norm = 0.0;
};

struct SolveResult {
  PointInputs inputs;
  OutputMap outputs;
  bool ok = false;
  int iterations = 0;
  std::vector<double> residuals;   // target - value, in target order
  std::string message;
  std::vector<TraceEntry> trace;
  SolveReport report;
};

// Unknown variable key, non-finite/inverted bounds or an empty target key
// throw ConfigurationError. Uses cfg.solver for tolerances and budgets.
SolveResult solve_for_targets(const PointInputs& base,
                              const std::vector<TargetSpec>& targets,
                              const std::vector<VariableSpec>& variables,
                              const EvalConfig& cfg,
                              physics::EvalCache* cache = nullptr);

struct MultistartResult {
  SolveResult result;
  int start_index = -1;   // candidate that produced result
  int starts_tried = 0;
};

// Candidates: x0, box midpoint, then for two variables the four corners and
// two interior points, otherwise points along the lo -> hi diagonal at
// k / min(restarts, 5). At most max(2, restarts) candidates are tried.
MultistartResult solve_for_targets_multistart(const PointInputs& base,
                                              const std::vector<TargetSpec>& targets,
                                              const std::vector<VariableSpec>& variables,
                                              const EvalConfig& cfg,
                                              int restarts = 8,
                                              physics::EvalCache* cache = nullptr);

struct ContinuationStage {
  double tol = 1e-3;
  int max_iter = 0;   // 0: cfg.solver.max_iter
};

struct StageOutcome {
  double tol = 0.0;
  bool ok = false;
  int iterations = 0;
  double residual_norm = 0.0;
  std::string message;
};

struct ContinuationResult {
  SolveResult result;                // last stage run
  std::vector<StageOutcome> stages;  // stages actually run
};

// Empty stages: tol ladder {0.1, 0.01, cfg.solver.tol}. A stage tol outside
// (0, 0.5] or a negative max_iter throws ConfigurationError.
ContinuationResult solve_for_targets_continuation(const PointInputs& base,
                                                  const std::vector<TargetSpec>& targets,
                                                  const std::vector<VariableSpec>& variables,
                                                  const EvalConfig& cfg,
                                                  std::vector<ContinuationStage> stages = {},
                                                  physics::EvalCache* cache = nullptr);

}  // namespace fusion::solvers
