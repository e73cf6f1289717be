#include "engine/frontier/nearest_feasible.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <random>
#include <set>
#include <thread>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"
#include "engine/physics/point_evaluator.hpp"

namespace fusion::frontier {

namespace {

constexpr size_t kMaxCornerLevers = 10;
constexpr double kMinSpan = 1e-9;
constexpr double kNonFiniteTargetPenalty = 1e6;

struct Candidate {
  SampleKind kind = SampleKind::Random;
  std::vector<double> x;   // lever values, declaration order
};

struct Evaluated {
  PointInputs inputs;
  OutputMap outputs;
  constraints::Ledger ledger;
};

void validate_levers(const std::vector<Lever>& levers) {
  std::set<std::string> seen;
  for (const auto& l : levers) {
    FUSION_REQUIRE(PointInputs::has_field(l.key), ConfigurationError,
                   "find_nearest_feasible: unknown lever " + l.key);
    FUSION_REQUIRE(std::isfinite(l.lo) && std::isfinite(l.hi) && l.lo <= l.hi, ConfigurationError,
                   "find_nearest_feasible: bad bounds for lever " + l.key);
    FUSION_REQUIRE(seen.insert(l.key).second, ConfigurationError,
                   "find_nearest_feasible: duplicate lever " + l.key);
  }
}

std::vector<Candidate> make_candidates(const std::vector<Lever>& levers, const FrontierSettings& fs) {
  std::vector<Candidate> out;
  const size_t n = levers.size();

  if (fs.corner_probes) {
    Candidate mid{SampleKind::Midpoint, std::vector<double>(n)};
    for (size_t j = 0; j < n; ++j) mid.x[j] = 0.5 * (levers[j].lo + levers[j].hi);
    out.push_back(mid);
    if (n <= kMaxCornerLevers) {
      for (size_t mask = 0; mask < (size_t{1} << n); ++mask) {
        Candidate c{SampleKind::Corner, std::vector<double>(n)};
        for (size_t j = 0; j < n; ++j) c.x[j] = (mask & (size_t{1} << j)) ? levers[j].hi : levers[j].lo;
        out.push_back(c);
      }
    }
  }

  std::mt19937_64 rng(fs.seed);
  std::uniform_real_distribution<double> unit(0.0, 1.0);
  for (int i = 0; i < fs.n_random; ++i) {
    Candidate c{SampleKind::Random, std::vector<double>(n)};
    for (size_t j = 0; j < n; ++j) c.x[j] = levers[j].lo + unit(rng) * (levers[j].hi - levers[j].lo);
    out.push_back(c);
  }
  return out;
}

}  // namespace

const char* to_string(SampleKind k) noexcept {
  switch (k) {
    case SampleKind::Base:     return "base";
    case SampleKind::Midpoint: return "midpoint";
    case SampleKind::Corner:   return "corner";
    case SampleKind::Random:   return "random";
  }
  return "unknown";
}

FrontierReport find_nearest_feasible(const PointInputs& base,
                                     const std::vector<Lever>& levers,
                                     const std::vector<FrontierTarget>& targets,
                                     const EvalConfig& cfg,
                                     const FrontierOptions& opt,
                                     physics::EvalCache* cache) {
  validate_levers(levers);
  if (opt.limits) constraints::validate_table(*opt.limits);
  const physics::CachedEvaluator ev(cfg, cache);

  auto evaluate_point = [&](const PointInputs& in) {
    Evaluated e;
    e.inputs = in;
    e.outputs = ev.evaluate(in);
    e.ledger = constraints::build_ledger(e.outputs,
                                         opt.limits ? *opt.limits : constraints::default_limit_table(in));
    return e;
  };

  auto inputs_at = [&](const std::vector<double>& x) {
    PointInputs in = base;
    for (size_t j = 0; j < levers.size(); ++j) in = in.with(levers[j].key, clamp(x[j], levers[j].lo, levers[j].hi));
    return in;
  };

  auto distance = [&](const PointInputs& in) {
    double s = 0.0;
    int n = 0;
    for (const auto& l : levers) {
      const double d = (in.get(l.key) - base.get(l.key)) / std::max(std::fabs(l.hi - l.lo), kMinSpan);
      if (std::isfinite(d)) {
        s += d * d;
        ++n;
      }
    }
    if (levers.empty()) return 0.0;
    return n > 0 ? std::sqrt(s / n) : kInf;
  };

  auto describe = [&](int index, SampleKind kind, const Evaluated& e) {
    FrontierSample s;
    s.index = index;
    s.kind = kind;
    for (const auto& l : levers) s.levers[l.key] = e.inputs.get(l.key);
    s.feasible = e.ledger.overall_ok;
    s.n_hard_failed = e.ledger.summary.n_hard_failed;
    s.worst_hard_margin_frac = e.ledger.summary.worst_hard_margin_frac;
    s.soft_penalty_sum = e.ledger.summary.soft_penalty_sum;
    if (!targets.empty()) {
      double sum = 0.0;
      for (const auto& t : targets) {
        const double v = e.outputs.get(t.key);
        sum += std::isfinite(v) ? sq(v - t.value) : kNonFiniteTargetPenalty;
      }
      s.target_rmse = std::sqrt(sum / static_cast<double>(targets.size()));
    }
    s.distance = distance(e.inputs);
    const double worst = std::isfinite(s.worst_hard_margin_frac) ? s.worst_hard_margin_frac : 0.0;
    s.score = 1e4 * s.n_hard_failed + 1e3 * std::max(0.0, -worst) + 10.0 * s.target_rmse + s.distance +
              0.1 * s.soft_penalty_sum;
    if (e.ledger.dominant) s.dominant = e.ledger.dominant->name;
    return s;
  };

  auto fill_best = [&](FrontierReport& r, const Evaluated& e, double dist) {
    r.best_inputs = e.inputs;
    r.best_outputs = e.outputs;
    r.best_distance = dist;
    r.best_levers.clear();
    for (const auto& l : levers) r.best_levers[l.key] = e.inputs.get(l.key);
    r.best_achieved.clear();
    for (const auto& t : targets) r.best_achieved[t.key] = e.outputs.get(t.key);
  };

  FrontierReport rep;

  // ---- 1) base ----
  const Evaluated base_eval = evaluate_point(base);
  const FrontierSample base_sample = describe(0, SampleKind::Base, base_eval);
  rep.trace.push_back(base_sample);
  rep.n_evaluated = 1;
  rep.base_feasible = base_eval.ledger.overall_ok;
  if (rep.base_feasible) {
    rep.ok = true;
    rep.status = "already_feasible";
    rep.n_feasible = 1;
    fill_best(rep, base_eval, 0.0);
    log(LogLevel::INFO, "find_nearest_feasible: base point already feasible");
    return rep;
  }

  // ---- 2,3) probes + random samples, evaluated into a fixed table ----
  const std::vector<Candidate> cands = make_candidates(levers, cfg.frontier);
  std::vector<Evaluated> table(cands.size());

  const size_t n_workers =
      std::max<size_t>(1, std::min<size_t>(static_cast<size_t>(cfg.frontier.n_threads), cands.size()));
  std::atomic<size_t> next{0};
  std::vector<std::exception_ptr> errors(n_workers);

  auto worker = [&](size_t w) {
    try {
      for (size_t i = next.fetch_add(1); i < cands.size(); i = next.fetch_add(1)) {
        table[i] = evaluate_point(inputs_at(cands[i].x));
      }
    } catch (const std::exception&) {
      errors[w] = std::current_exception();
    }
  };

  std::vector<std::thread> pool;
  for (size_t w = 1; w < n_workers; ++w) pool.emplace_back(worker, w);
  worker(0);
  for (auto& t : pool) t.join();
  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }

  // ---- 4) sequential ranking ----
  int best_idx = -1;
  double best_dist = kInf;
  int least_idx = -1;
  for (size_t i = 0; i < table.size(); ++i) {
    FrontierSample s = describe(static_cast<int>(i) + 1, cands[i].kind, table[i]);
    if (s.feasible) {
      ++rep.n_feasible;
      if (best_idx < 0 || s.distance < best_dist) {
        best_idx = static_cast<int>(i);
        best_dist = s.distance;
      }
    }
    rep.trace.push_back(std::move(s));
    const FrontierSample& cur = rep.trace.back();
    if (least_idx < 0 || cur.score < rep.trace[static_cast<size_t>(least_idx) + 1].score) {
      least_idx = static_cast<int>(i);
    }
  }
  rep.n_evaluated += static_cast<int>(table.size());

  if (least_idx >= 0) {
    rep.least_violating = rep.trace[static_cast<size_t>(least_idx) + 1];
  } else {
    rep.least_violating = base_sample;
  }

  if (best_idx >= 0) {
    rep.ok = true;
    rep.status = "found_feasible";
    fill_best(rep, table[static_cast<size_t>(best_idx)], best_dist);
    log(LogLevel::INFO, "find_nearest_feasible: found feasible sample " + std::to_string(best_idx + 1) +
                            " of " + std::to_string(table.size()) + ", distance " + std::to_string(best_dist));
  } else {
    rep.ok = false;
    rep.status = "no_feasible_sample";
    fill_best(rep, base_eval, 0.0);
    log(LogLevel::WARN, "find_nearest_feasible: no feasible sample in " + std::to_string(table.size()) +
                            " candidates; least violating: " + rep.least_violating->dominant);
  }
  return rep;
}

}  // namespace fusion::frontier
