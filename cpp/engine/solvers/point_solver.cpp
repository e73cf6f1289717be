#include "engine/solvers/point_solver.hpp"

#include <cmath>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"
#include "engine/physics/point_evaluator.hpp"
#include "engine/solvers/bisect.hpp"
#include "engine/solvers/target_solver.hpp"

namespace fusion::solvers {

namespace {

void require_bounds(const char* what, double lo, double hi) {
  FUSION_REQUIRE(std::isfinite(lo) && std::isfinite(hi) && lo > 0.0 && lo <= hi, ConfigurationError,
                 std::string("point solver: bad bounds for ") + what);
}

PointSolveResult fG_solve(const physics::CachedEvaluator& ev, const PointInputs& base, double Q_target,
                          double fG_lo, double fG_hi, const BisectOptions& opt) {
  auto Q_of = [&](double fG) { return ev.evaluate(base.with("fG", fG)).Q_DT_eqv; };

  PointSolveResult r;
  r.method = "bisect";
  const BisectResult b = bisect(Q_of, fG_lo, fG_hi, Q_target, opt);
  r.iterations = b.iterations;

  if (b.status == BisectStatus::NoBracket) {
    const double res_lo = Q_of(fG_lo) - Q_target;
    const double res_hi = Q_of(fG_hi) - Q_target;
    if (!std::isfinite(res_lo) && !std::isfinite(res_hi)) {
      r.inputs = base.with("fG", fG_lo);
      r.outputs = ev.evaluate(r.inputs);
      r.ok = false;
      r.message = "nonfinite_residual";
      return r;
    }
    // A NaN residual never wins the comparison.
    const bool use_lo = !std::isfinite(res_hi) || (std::isfinite(res_lo) && std::fabs(res_lo) <= std::fabs(res_hi));
    const double fG = use_lo ? fG_lo : fG_hi;
    const double res = use_lo ? res_lo : res_hi;
    r.inputs = base.with("fG", fG);
    r.outputs = ev.evaluate(r.inputs);
    r.ok = true;
    r.clamped = true;
    r.clamped_on = use_lo ? "fG_lo" : "fG_hi";
    r.message = "Q target not bracketed within fG bounds; clamped to nearest bound";
    r.outputs.aux["solver_clamped_Q"] = 1.0;
    r.outputs.aux["solver_clamped_Q_on"] = use_lo ? 0.0 : 1.0;
    r.outputs.aux["Q_target"] = Q_target;
    r.outputs.aux["Q_at_bound"] = res + Q_target;
    r.outputs.aux["Q_residual"] = res;
    return r;
  }

  r.inputs = base.with("fG", b.x);
  r.outputs = ev.evaluate(r.inputs);
  r.ok = b.ok;
  r.message = to_string(b.status);
  r.outputs.aux["solver_clamped_Q"] = 0.0;
  return r;
}

}  // namespace

PointSolveResult solve_fG_for_Q(const PointInputs& base, double Q_target, double fG_lo, double fG_hi,
                                const EvalConfig& cfg, physics::EvalCache* cache) {
  require_bounds("fG", fG_lo, fG_hi);
  FUSION_REQUIRE(std::isfinite(Q_target), ConfigurationError, "solve_fG_for_Q: Q_target not finite");
  const physics::CachedEvaluator ev(cfg, cache);
  PointSolveResult r = fG_solve(ev, base, Q_target, fG_lo, fG_hi, BisectOptions::from(cfg.root_find));
  log(r.ok ? LogLevel::INFO : LogLevel::WARN,
      "solve_fG_for_Q: " + r.message + " fG=" + std::to_string(r.inputs.fG));
  return r;
}

PointSolveResult solve_Ip_for_H98_with_Q(const PointInputs& base, double H98_target, double Q_target,
                                         double Ip_lo, double Ip_hi, double fG_lo, double fG_hi,
                                         const EvalConfig& cfg, physics::EvalCache* cache) {
  require_bounds("Ip_MA", Ip_lo, Ip_hi);
  require_bounds("fG", fG_lo, fG_hi);
  FUSION_REQUIRE(std::isfinite(H98_target) && std::isfinite(Q_target), ConfigurationError,
                 "solve_Ip_for_H98_with_Q: targets not finite");

  const physics::CachedEvaluator ev(cfg, cache);
  const BisectOptions opt = BisectOptions::from(cfg.root_find);

  // ---- coupled attempt ----
  const double Ip0 = std::isfinite(base.Ip_MA) ? clamp(base.Ip_MA, Ip_lo, Ip_hi) : 0.5 * (Ip_lo + Ip_hi);
  const double fG0 = std::isfinite(base.fG) ? clamp(base.fG, fG_lo, fG_hi) : 0.5 * (fG_lo + fG_hi);
  const std::vector<TargetSpec> targets{{"H98", H98_target}, {"Q_DT_eqv", Q_target}};
  const std::vector<VariableSpec> vars{{"Ip_MA", Ip0, Ip_lo, Ip_hi}, {"fG", fG0, fG_lo, fG_hi}};
  const SolveResult coupled = solve_for_targets(base, targets, vars, cfg, cache);
  if (coupled.ok) {
    PointSolveResult r;
    r.inputs = coupled.inputs;
    r.outputs = coupled.outputs;
    r.ok = true;
    r.method = "coupled";
    r.iterations = coupled.iterations;
    r.message = coupled.message;
    return r;
  }
  log(LogLevel::INFO, "solve_Ip_for_H98_with_Q: coupled solve " + coupled.message +
                          ", falling back to nested bisection");

  // ---- nested bisection: outer Ip on H98, inner fG on Q ----
  int inner_iters = 0;
  auto inner = [&](double Ip) {
    PointSolveResult s = fG_solve(ev, base.with("Ip_MA", Ip), Q_target, fG_lo, fG_hi, opt);
    inner_iters += s.iterations;
    return s;
  };
  auto H_of = [&](double Ip) {
    const PointSolveResult s = inner(Ip);
    return s.ok ? s.outputs.H98 : kNaN;
  };

  const BisectResult outer = bisect(H_of, Ip_lo, Ip_hi, H98_target, opt);
  PointSolveResult r;
  if (outer.status == BisectStatus::NoBracket) {
    const PointSolveResult s_lo = inner(Ip_lo);
    const PointSolveResult s_hi = inner(Ip_hi);
    const double res_lo = s_lo.ok ? s_lo.outputs.H98 - H98_target : kNaN;
    const double res_hi = s_hi.ok ? s_hi.outputs.H98 - H98_target : kNaN;
    if (!std::isfinite(res_lo) && !std::isfinite(res_hi)) {
      r = s_lo;
      r.ok = false;
      r.method = "nested_bisect";
      r.iterations = inner_iters;
      r.message = "nonfinite_residual";
      log(LogLevel::WARN, "solve_Ip_for_H98_with_Q: " + r.message);
      return r;
    }
    const bool use_lo = !std::isfinite(res_hi) || (std::isfinite(res_lo) && std::fabs(res_lo) <= std::fabs(res_hi));
    r = use_lo ? s_lo : s_hi;
    r.clamped = true;
    r.clamped_on = use_lo ? "Ip_lo" : "Ip_hi";
    r.outputs.aux["solver_clamped_H98"] = 1.0;
    r.outputs.aux["H98_target"] = H98_target;
    r.outputs.aux["H98_residual"] = use_lo ? res_lo : res_hi;
    r.message = "H98 target not bracketed within Ip bounds; clamped to nearest bound";
  } else {
    r = inner(outer.x);
    if (!outer.ok) r.ok = false;
    r.message = to_string(outer.status);
  }
  r.method = "nested_bisect";
  r.iterations = outer.iterations + inner_iters;
  log(r.ok ? LogLevel::INFO : LogLevel::WARN,
      "solve_Ip_for_H98_with_Q: " + r.message + " Ip=" + std::to_string(r.inputs.Ip_MA) +
          " fG=" + std::to_string(r.inputs.fG));
  return r;
}

}  // namespace fusion::solvers
