#pragma once
/*
================================================================================
Fragment 2.4 — Physics: Point Evaluator
FILE: cpp/engine/physics/point_evaluator.hpp

Purpose:
  - evaluate(): PointInputs -> OutputMap. Pure: no I/O, no logging, no global
    state. The same (inputs, config) always yields a bit-identical OutputMap.
  - CachedEvaluator: the same function behind an optional shared EvalCache,
    used by the solvers and the frontier search.

Errors:
  - Invalid EvalConfig throws ValidationError.
  - Out-of-domain input values never throw; they produce NaN outputs.
================================================================================
*/

#include "engine/core/config.hpp"
#include "engine/core/eval_key.hpp"
#include "engine/core/point_inputs.hpp"
#include "engine/physics/eval_cache.hpp"
#include "engine/physics/output_map.hpp"

namespace fusion::physics {

OutputMap evaluate(const PointInputs& inputs, const EvalConfig& config);

class CachedEvaluator {
 public:
  // cache may be null (no memoization). The cache must outlive the evaluator.
  explicit CachedEvaluator(EvalConfig config, EvalCache* cache = nullptr);

  OutputMap evaluate(const PointInputs& inputs) const;

  const EvalConfig& config() const noexcept { return config_; }
  EvalCache* cache() const noexcept { return cache_; }

 private:
  EvalConfig config_;
  EvalCache* cache_ = nullptr;
  Hash64 config_h_{};
};

}  // namespace fusion::physics
