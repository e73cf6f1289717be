#pragma once
/*
===============================================================================
Fragment 4.1 — Solvers: Bracketed Bisection
FILE: cpp/engine/solvers/bisect.hpp
===============================================================================
Objective:
  - Find x in [lo, hi] with |f(x) - target| < tol for a monotonic f.

Contract:
  - No bracket (non-finite endpoint residual, or both residuals of the same
    strict sign) returns {x = lo, ok = false, NoBracket}. Never throws.
  - A non-finite midpoint residual aborts with {x = mid, ok = false}.
  - Running out of iterations returns the last midpoint; ok is then
    BisectOptions::treat_exhaustion_as_success.

Limitation:
  - f is assumed monotonic on [lo, hi]. For a non-monotonic f the call
    terminates normally but the returned x is not guaranteed to be a root.
===============================================================================
*/

#include <functional>

#include "engine/core/config.hpp"

namespace fusion::solvers {

enum class BisectStatus : int {
  Converged = 0,
  Exhausted = 1,
  NoBracket = 2,
  NonFiniteMidpoint = 3,
};

const char* to_string(BisectStatus s) noexcept;

struct BisectOptions {
  double tol = 1e-4;
  int max_iter = 80;
  bool treat_exhaustion_as_success = true;

  static BisectOptions from(const RootFindSettings& s) {
    return BisectOptions{s.tol, s.max_iter, s.treat_exhaustion_as_success};
  }
};

struct BisectResult {
  double x = 0.0;
  bool ok = false;
  int iterations = 0;
  double residual = 0.0;   // f(x) - target at the returned x (NaN if unknown)
  BisectStatus status = BisectStatus::NoBracket;
};

using ScalarFn = std::function<double(double)>;

BisectResult bisect(const ScalarFn& f, double lo, double hi, double target,
                    const BisectOptions& opt = {});

}  // namespace fusion::solvers
