#pragma once
/*
================================================================================
Fragment 5.1 — Frontier: Nearest-Feasible Search
FILE: cpp/engine/frontier/nearest_feasible.hpp

Purpose:
  - "This point fails, what should I change?" Vary a small set of levers
    inside their bounds and report the feasible sample closest to the base
    point.

Strategy (deterministic for a given seed):
  1) Evaluate base. Feasible -> status already_feasible, distance 0.
  2) Optional probes: lever-box midpoint, then all 2^n corners (n <= 10).
  3) n_random uniform samples from std::mt19937_64(seed), levers drawn in
     declaration order.
  4) Pick the feasible sample with the smallest distance, ties to the
     earliest sample.

Distance:
  - RMS over levers of (x - x_base) / max(|hi - lo|, 1e-9).

Threads:
  - Samples are generated up front, evaluated by n_threads workers into a
    pre-sized table, then ranked sequentially. The report does not depend on
    the thread count.

Limitation:
  - Screening device. The returned point is the nearest feasible SAMPLE, not
    a guaranteed nearest feasible point. Use more samples or narrower levers
    for a finer answer.
================================================================================
*/

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "engine/constraints/ledger.hpp"
#include "engine/constraints/limits.hpp"
#include "engine/core/config.hpp"
#include "engine/core/point_inputs.hpp"
#include "engine/physics/eval_cache.hpp"
#include "engine/physics/output_map.hpp"

namespace fusion::frontier {

struct Lever {
  std::string key;   // PointInputs field
  double lo = 0.0;
  double hi = 0.0;
};

struct FrontierTarget {
  std::string key;   // OutputMap key
  double value = 0.0;
};

enum class SampleKind : int {
  Base = 0,
  Midpoint = 1,
  Corner = 2,
  Random = 3,
};

const char* to_string(SampleKind k) noexcept;

struct FrontierOptions {
  // When set, every candidate is checked against this table instead of
  // default_limit_table(candidate).
  std::optional<constraints::LimitTable> limits;
};

struct FrontierSample {
  int index = 0;
  SampleKind kind = SampleKind::Random;
  std::map<std::string, double> levers;
  bool feasible = false;
  int n_hard_failed = 0;
  double worst_hard_margin_frac = 0.0;
  double soft_penalty_sum = 0.0;
  double target_rmse = 0.0;
  double distance = 0.0;
  double score = 0.0;          // hard failures, then worst margin, targets, distance, soft
  std::string dominant;        // dominant constraint name, "" when feasible
};

struct FrontierReport {
  bool ok = false;
  std::string status;          // already_feasible | found_feasible | no_feasible_sample
  bool base_feasible = false;

  PointInputs best_inputs;
  OutputMap best_outputs;
  std::map<std::string, double> best_levers;
  double best_distance = 0.0;
  std::map<std::string, double> best_achieved;   // target key -> value

  int n_evaluated = 0;
  int n_feasible = 0;

  std::optional<FrontierSample> least_violating;
  std::vector<FrontierSample> trace;   // base first, then samples in order
};

// Lever keys must be PointInputs fields with finite lo <= hi, no duplicates
// (ConfigurationError). Sampling settings come from cfg.frontier.
FrontierReport find_nearest_feasible(const PointInputs& base,
                                     const std::vector<Lever>& levers,
                                     const std::vector<FrontierTarget>& targets,
                                     const EvalConfig& cfg,
                                     const FrontierOptions& opt = {},
                                     physics::EvalCache* cache = nullptr);

}  // namespace fusion::frontier
