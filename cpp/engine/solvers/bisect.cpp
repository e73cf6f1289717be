#include "engine/solvers/bisect.hpp"

#include <cmath>

namespace fusion::solvers {

const char* to_string(BisectStatus s) noexcept {
  switch (s) {
    case BisectStatus::Converged:         return "converged";
    case BisectStatus::Exhausted:         return "exhausted";
    case BisectStatus::NoBracket:         return "no_bracket";
    case BisectStatus::NonFiniteMidpoint: return "nonfinite_midpoint";
  }
  return "unknown";
}

BisectResult bisect(const ScalarFn& f, double lo, double hi, double target,
                    const BisectOptions& opt) {
  BisectResult r;
  r.x = lo;

  double flo = f(lo) - target;
  const double fhi = f(hi) - target;
  r.residual = flo;

  // Signs are compared directly; the product of two tiny residuals underflows.
  const bool same_sign = (flo > 0.0 && fhi > 0.0) || (flo < 0.0 && fhi < 0.0);
  if (!std::isfinite(flo) || !std::isfinite(fhi) || same_sign) {
    r.ok = false;
    r.status = BisectStatus::NoBracket;
    return r;
  }
  if (flo == 0.0) {
    r.ok = true;
    r.status = BisectStatus::Converged;
    return r;
  }
  if (fhi == 0.0) {
    r.x = hi;
    r.residual = fhi;
    r.ok = true;
    r.status = BisectStatus::Converged;
    return r;
  }

  double a = lo;
  double b = hi;
  double mid = 0.5 * (a + b);
  for (int it = 0; it < opt.max_iter; ++it) {
    mid = 0.5 * (a + b);
    const double fm = f(mid) - target;
    r.iterations = it + 1;
    r.x = mid;
    r.residual = fm;

    if (!std::isfinite(fm)) {
      r.ok = false;
      r.status = BisectStatus::NonFiniteMidpoint;
      return r;
    }
    if (std::fabs(fm) < opt.tol) {
      r.ok = true;
      r.status = BisectStatus::Converged;
      return r;
    }
    if (fm == 0.0 || (flo < 0.0) != (fm < 0.0)) {
      b = mid;
    } else {
      a = mid;
      flo = fm;
    }
  }

  r.ok = opt.treat_exhaustion_as_success;
  r.status = BisectStatus::Exhausted;
  return r;
}

}  // namespace fusion::solvers
