#include "engine/solvers/target_solver.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"
#include "engine/physics/point_evaluator.hpp"

namespace fusion::solvers {

namespace {

constexpr double kPivotTiny = 1e-14;
constexpr double kMinStep = 1e-6;
constexpr double kStallRelImprovement = 1e-3;
constexpr double kDescentFallbackGain = 0.1;

using Matrix = std::vector<std::vector<double>>;

struct Iterate {
  std::vector<double> x;
  PointInputs inputs;
  OutputMap outputs;
  std::vector<double> raw;      // target - value
  std::vector<double> scaled;   // raw / max(|target|, 1)
  double norm = kInf;
  bool finite = false;
};

// Gaussian elimination with partial pivoting. false when singular.
bool solve_linear(Matrix A, std::vector<double> b, std::vector<double>& out) {
  const size_t n = b.size();
  for (size_t col = 0; col < n; ++col) {
    size_t piv = col;
    for (size_t r = col + 1; r < n; ++r) {
      if (std::fabs(A[r][col]) > std::fabs(A[piv][col])) piv = r;
    }
    if (!(std::fabs(A[piv][col]) > kPivotTiny)) return false;
    std::swap(A[piv], A[col]);
    std::swap(b[piv], b[col]);
    for (size_t r = col + 1; r < n; ++r) {
      const double f = A[r][col] / A[col][col];
      if (f == 0.0) continue;
      for (size_t c = col; c < n; ++c) A[r][c] -= f * A[col][c];
      b[r] -= f * b[col];
    }
  }
  out.assign(n, 0.0);
  for (size_t i = n; i-- > 0;) {
    double s = b[i];
    for (size_t c = i + 1; c < n; ++c) s -= A[i][c] * out[c];
    out[i] = s / A[i][i];
    if (!std::isfinite(out[i])) return false;
  }
  return true;
}

double max_abs(const std::vector<double>& v) {
  double m = 0.0;
  for (double e : v) m = std::max(m, std::fabs(e));
  return m;
}

std::string fmt_vec(const std::vector<double>& v) {
  std::ostringstream oss;
  oss.precision(6);
  oss << "[";
  for (size_t i = 0; i < v.size(); ++i) oss << (i ? ", " : "") << v[i];
  oss << "]";
  return oss.str();
}

std::vector<std::vector<double>> multistart_candidates(const std::vector<VariableSpec>& vars, int restarts) {
  const size_t n = vars.size();
  std::vector<std::vector<double>> c;
  std::vector<double> x0(n), mid(n);
  for (size_t j = 0; j < n; ++j) {
    x0[j] = vars[j].x0;
    mid[j] = 0.5 * (vars[j].lo + vars[j].hi);
  }
  c.push_back(x0);
  c.push_back(mid);

  if (n == 2) {
    const double lo0 = vars[0].lo, hi0 = vars[0].hi;
    const double lo1 = vars[1].lo, hi1 = vars[1].hi;
    c.push_back({lo0, lo1});
    c.push_back({lo0, hi1});
    c.push_back({hi0, lo1});
    c.push_back({hi0, hi1});
    c.push_back({0.25 * lo0 + 0.75 * hi0, 0.75 * lo1 + 0.25 * hi1});
    c.push_back({0.75 * lo0 + 0.25 * hi0, 0.25 * lo1 + 0.75 * hi1});
  } else {
    const int m = std::min(restarts, 5);
    for (int k = 1; k < m; ++k) {
      const double frac = static_cast<double>(k) / static_cast<double>(m);
      std::vector<double> x(n);
      for (size_t j = 0; j < n; ++j) x[j] = vars[j].lo + frac * (vars[j].hi - vars[j].lo);
      c.push_back(std::move(x));
    }
  }

  const size_t cap = static_cast<size_t>(std::max(2, restarts));
  if (c.size() > cap) c.resize(cap);
  return c;
}

void validate_problem(const std::vector<TargetSpec>& targets, const std::vector<VariableSpec>& vars) {
  for (const auto& t : targets) {
    FUSION_REQUIRE(!t.key.empty(), ConfigurationError, "solve_for_targets: empty target key");
    FUSION_REQUIRE(std::isfinite(t.value), ConfigurationError,
                   "solve_for_targets: non-finite target for " + t.key);
  }
  for (const auto& v : vars) {
    FUSION_REQUIRE(PointInputs::has_field(v.key), ConfigurationError,
                   "solve_for_targets: unknown variable " + v.key);
    FUSION_REQUIRE(std::isfinite(v.lo) && std::isfinite(v.hi) && std::isfinite(v.x0),
                   ConfigurationError, "solve_for_targets: non-finite bounds for " + v.key);
    FUSION_REQUIRE(v.lo <= v.hi, ConfigurationError, "solve_for_targets: lo > hi for " + v.key);
  }
}

}  // namespace

SolveResult solve_for_targets(const PointInputs& base,
                              const std::vector<TargetSpec>& targets,
                              const std::vector<VariableSpec>& variables,
                              const EvalConfig& cfg,
                              physics::EvalCache* cache) {
  SolveResult res;
  res.inputs = base;

  if (targets.size() != variables.size()) {
    res.ok = false;
    res.message = "targets and variables must have same dimension";
    res.report.status = res.message;
    res.report.residual_norm = kNaN;
    log(LogLevel::WARN, "solve_for_targets: " + res.message);
    return res;
  }
  validate_problem(targets, variables);

  const SolverSettings& S = cfg.solver;
  const physics::CachedEvaluator evaluator(cfg, cache);
  const size_t n = variables.size();

  std::vector<double> lo(n), hi(n), xscale(n), tscale(targets.size());
  for (size_t j = 0; j < n; ++j) {
    lo[j] = variables[j].lo;
    hi[j] = variables[j].hi;
    xscale[j] = std::max({std::fabs(variables[j].x0), 1e-3 * (hi[j] - lo[j]), 1e-12});
  }
  for (size_t i = 0; i < targets.size(); ++i) {
    tscale[i] = std::max(std::fabs(targets[i].value), 1.0);
  }

  auto clamp_box = [&](std::vector<double> x) {
    for (size_t j = 0; j < n; ++j) x[j] = clamp(x[j], lo[j], hi[j]);
    return x;
  };

  auto eval_at = [&](const std::vector<double>& x) {
    Iterate it;
    it.x = x;
    it.inputs = base;
    for (size_t j = 0; j < n; ++j) it.inputs = it.inputs.with(variables[j].key, x[j]);
    it.outputs = evaluator.evaluate(it.inputs);
    it.raw.resize(targets.size());
    it.scaled.resize(targets.size());
    it.finite = true;
    double ss = 0.0;
    for (size_t i = 0; i < targets.size(); ++i) {
      it.raw[i] = targets[i].value - it.outputs.get(targets[i].key);
      it.scaled[i] = it.raw[i] / tscale[i];
      if (!std::isfinite(it.scaled[i])) it.finite = false;
      ss += it.scaled[i] * it.scaled[i];
    }
    it.norm = it.finite ? std::sqrt(ss) : kInf;
    return it;
  };

  auto converged = [&](const Iterate& it) {
    return it.finite && max_abs(it.scaled) <= S.tol;
  };

  auto finish = [&](const Iterate& best, bool ok, int iters, std::string msg) {
    res.inputs = best.inputs;
    res.outputs = best.outputs;
    res.ok = ok;
    res.iterations = iters;
    res.residuals = best.raw;
    res.message = std::move(msg);
    res.report.status = res.message;
    res.report.residual_norm = best.norm;
    for (size_t i = 0; i < targets.size(); ++i) {
      res.report.best_achieved[targets[i].key] = best.outputs.get(targets[i].key);
      res.report.target_errors[targets[i].key] = best.raw[i];
    }
    for (size_t j = 0; j < n; ++j) {
      const double x = best.x[j];
      res.report.active_bounds[variables[j].key] = (x <= lo[j]) ? "lo" : (x >= hi[j] ? "hi" : "");
    }
    log(ok ? LogLevel::INFO : LogLevel::WARN,
        "solve_for_targets: " + res.message + " after " + std::to_string(iters) +
            " iterations, |r|=" + std::to_string(best.norm));
    return res;
  };

  std::vector<double> x0(n);
  for (size_t j = 0; j < n; ++j) x0[j] = variables[j].x0;
  Iterate cur = eval_at(clamp_box(x0));

  if (!cur.finite) return finish(cur, false, 0, "nonfinite_residual");
  if (converged(cur)) return finish(cur, true, 0, "converged");

  Iterate best = cur;
  double trust = S.trust_delta;
  int stall = 0;

  for (int iter = 1; iter <= S.max_iter; ++iter) {
    // ---- Jacobian of scaled residuals w.r.t. scaled variables ----
    Matrix J(targets.size(), std::vector<double>(n, 0.0));
    bool jac_ok = true;
    for (size_t j = 0; j < n; ++j) {
      const double h = std::max(S.fd_min_step, S.fd_rel_step * std::fabs(cur.x[j]));
      std::vector<double> xp = cur.x;
      xp[j] = cur.x[j] + h;
      if (xp[j] > hi[j]) xp[j] = cur.x[j] - h;
      xp[j] = clamp(xp[j], lo[j], hi[j]);
      const double du = (xp[j] - cur.x[j]) / xscale[j];
      if (du == 0.0) continue;  // degenerate box, column stays zero
      const Iterate p = eval_at(xp);
      for (size_t i = 0; i < targets.size(); ++i) {
        J[i][j] = (p.scaled[i] - cur.scaled[i]) / du;
        if (!std::isfinite(J[i][j])) jac_ok = false;
      }
    }

    // ---- Step direction (scaled units) ----
    std::vector<double> d;
    std::string method = "newton";
    std::vector<double> rhs(cur.scaled.size());
    for (size_t i = 0; i < rhs.size(); ++i) rhs[i] = -cur.scaled[i];
    if (!jac_ok || !solve_linear(J, rhs, d)) {
      method = "descent";
      d.assign(n, 0.0);
      if (jac_ok) {
        for (size_t j = 0; j < n; ++j) {
          for (size_t i = 0; i < targets.size(); ++i) d[j] -= J[i][j] * cur.scaled[i];
        }
      }
      if (max_abs(d) == 0.0) {
        for (size_t j = 0; j < n; ++j) d[j] = -kDescentFallbackGain * cur.scaled[j];
      }
    }

    const double dmax = max_abs(d);
    if (dmax > trust) {
      for (double& e : d) e *= trust / dmax;
    }

    // ---- Backtracking line search ----
    double alpha = S.damping;
    bool improved = false;
    int tries = 0;
    double step = 0.0;
    Iterate trial;
    for (tries = 1; tries <= S.max_linesearch; ++tries) {
      std::vector<double> xt = cur.x;
      for (size_t j = 0; j < n; ++j) xt[j] += alpha * d[j] * xscale[j];
      xt = clamp_box(std::move(xt));
      step = 0.0;
      for (size_t j = 0; j < n; ++j) step = std::max(step, std::fabs(xt[j] - cur.x[j]) / xscale[j]);
      trial = eval_at(xt);
      if (trial.finite && trial.norm < cur.norm) {
        improved = true;
        break;
      }
      alpha *= 0.5;
    }
    if (tries > S.max_linesearch) tries = S.max_linesearch;

    const double prev_norm = cur.norm;
    if (improved) {
      cur = std::move(trial);
      if (cur.norm < best.norm) best = cur;
      if (tries <= 2 && alpha == S.damping) trust = std::min(trust * 1.5, S.trust_max);
    } else if (tries >= 4) {
      trust = std::max(trust * 0.5, S.trust_min);
    }

    TraceEntry te;
    te.iter = iter;
    te.x = cur.x;
    te.residuals = cur.raw;
    te.residual_norm = cur.norm;
    te.method = method;
    te.trust_radius = trust;
    te.step = step;
    te.linesearch_tries = tries;
    te.improved = improved;
    res.trace.push_back(te);

    if (log_enabled(LogLevel::DEBUG)) {
      log(LogLevel::DEBUG, "solve_for_targets: iter=" + std::to_string(iter) + " method=" + method +
                               " x=" + fmt_vec(cur.x) + " |r|=" + std::to_string(cur.norm) +
                               " trust=" + std::to_string(trust));
    }

    if (converged(cur)) return finish(cur, true, iter, "converged");

    // Variable held at a bound by a step that points outward, with no real progress.
    bool pinned = false;
    for (size_t j = 0; j < n; ++j) {
      if ((cur.x[j] <= lo[j] && d[j] < 0.0) || (cur.x[j] >= hi[j] && d[j] > 0.0)) pinned = true;
    }
    if (!improved && step < kMinStep && !pinned) return finish(best, false, iter, "no_descent");

    const bool progress = improved && (prev_norm - cur.norm) > kStallRelImprovement * prev_norm;
    stall = (pinned && !progress) ? stall + 1 : 0;
    if (stall >= S.bound_stall_iters) return finish(best, false, iter, "bound_stall");
  }

  return finish(best, false, S.max_iter, "max_iter");
}

MultistartResult solve_for_targets_multistart(const PointInputs& base,
                                              const std::vector<TargetSpec>& targets,
                                              const std::vector<VariableSpec>& variables,
                                              const EvalConfig& cfg,
                                              int restarts,
                                              physics::EvalCache* cache) {
  MultistartResult ms;
  if (targets.size() != variables.size()) {
    ms.result = solve_for_targets(base, targets, variables, cfg, cache);
    ms.starts_tried = 1;
    ms.start_index = 0;
    return ms;
  }
  validate_problem(targets, variables);

  const auto candidates = multistart_candidates(variables, restarts);
  double best_norm = kInf;
  for (size_t c = 0; c < candidates.size(); ++c) {
    std::vector<VariableSpec> vars = variables;
    for (size_t j = 0; j < vars.size(); ++j) vars[j].x0 = candidates[c][j];

    SolveResult r = solve_for_targets(base, targets, vars, cfg, cache);
    ms.starts_tried = static_cast<int>(c) + 1;
    log(LogLevel::DEBUG, "solve_for_targets_multistart: start " + std::to_string(c) + " x0=" +
                             fmt_vec(candidates[c]) + " -> " + r.message);

    if (r.ok) {
      ms.result = std::move(r);
      ms.start_index = static_cast<int>(c);
      return ms;
    }
    if (ms.start_index < 0 || r.report.residual_norm < best_norm) {
      best_norm = r.report.residual_norm;
      ms.result = std::move(r);
      ms.start_index = static_cast<int>(c);
    }
  }

  log(LogLevel::WARN, "solve_for_targets_multistart: no start converged after " +
                          std::to_string(ms.starts_tried) + " tries (" + ms.result.message + ")");
  return ms;
}

ContinuationResult solve_for_targets_continuation(const PointInputs& base,
                                                  const std::vector<TargetSpec>& targets,
                                                  const std::vector<VariableSpec>& variables,
                                                  const EvalConfig& cfg,
                                                  std::vector<ContinuationStage> stages,
                                                  physics::EvalCache* cache) {
  if (stages.empty()) stages = {{1e-1, 0}, {1e-2, 0}, {cfg.solver.tol, 0}};
  for (const auto& st : stages) {
    FUSION_REQUIRE(st.tol > 0.0 && st.tol <= 0.5, ConfigurationError,
                   "solve_for_targets_continuation: stage tol outside (0, 0.5]");
    FUSION_REQUIRE(st.max_iter >= 0, ConfigurationError,
                   "solve_for_targets_continuation: negative stage max_iter");
  }

  ContinuationResult cr;
  std::vector<VariableSpec> vars = variables;
  for (const auto& st : stages) {
    EvalConfig stage_cfg = cfg;
    stage_cfg.solver.tol = st.tol;
    if (st.max_iter > 0) stage_cfg.solver.max_iter = st.max_iter;

    cr.result = solve_for_targets(base, targets, vars, stage_cfg, cache);

    StageOutcome so;
    so.tol = st.tol;
    so.ok = cr.result.ok;
    so.iterations = cr.result.iterations;
    so.residual_norm = cr.result.report.residual_norm;
    so.message = cr.result.message;
    cr.stages.push_back(so);

    if (!cr.result.ok) break;
    for (auto& v : vars) {
      const double x = cr.result.inputs.get(v.key);
      if (is_finite(x)) v.x0 = x;
    }
  }
  return cr;
}

}  // namespace fusion::solvers
