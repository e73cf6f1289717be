#pragma once
/*
===============================================================================
Fragment 3.2 — Constraints: Constraint Ledger
FILE: cpp/engine/constraints/ledger.hpp
===============================================================================
Objective:
  - Check one OutputMap against a LimitTable and return one record per limit,
    the dominant (most violated) hard limit, and an overall verdict.

Margins:
  - LessEq:    margin = bound - value
  - GreaterEq: margin = value - bound
  - margin_frac = margin / |bound|; for bound == 0 the denominator is 1, so
    margin_frac == margin.
  - passed == (margin_frac >= 0) for every numeric record.

Unknown:
  - A NaN or absent value gives status Unknown, passed = false and NaN
    margins. An unknown HARD record makes overall_ok false.

Dominance:
  - Among hard records that did not pass, the most negative numeric
    margin_frac wins; ties go to the first in table order. If every failing
    hard record is Unknown, the first of them is dominant.
===============================================================================
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "engine/constraints/limits.hpp"
#include "engine/physics/output_map.hpp"

namespace fusion::constraints {

enum class ConstraintStatus : std::uint8_t {
  Pass = 0,
  Fail = 1,
  Unknown = 2,
};

enum class Verdict : std::uint8_t {
  Pass = 0,
  Warn = 1,
  Fail = 2,
};

const char* to_string(ConstraintStatus s) noexcept;
const char* to_string(Verdict v) noexcept;

struct ConstraintRecord final {
  std::string name;
  std::string group;
  std::string key;
  LimitSense sense = LimitSense::LessEq;
  Severity severity = Severity::Hard;
  std::string units;
  std::string note;

  double value = 0.0;
  double bound = 0.0;
  double margin = 0.0;
  double margin_frac = 0.0;

  ConstraintStatus status = ConstraintStatus::Unknown;
  bool passed = false;

  // 0 when passed; 10 * max(0, -margin_frac) hard, 1 * max(0, -margin_frac) soft.
  double violation_score = 0.0;

  // 1..k among records that did not pass (stable by violation score). 0 = passed.
  int dominance_rank = 0;
};

struct LedgerSummary final {
  int n_hard_failed = 0;     // includes unknown hard records
  int n_soft_failed = 0;     // includes unknown soft records
  int n_unknown = 0;
  double worst_hard_margin_frac = 0.0;   // NaN when no numeric hard record
  double soft_penalty_sum = 0.0;
  std::vector<std::string> top_blockers;  // up to kMaxTopBlockers names
};

struct Ledger final {
  static constexpr std::size_t kMaxTopBlockers = 8;

  std::vector<ConstraintRecord> records;
  std::optional<ConstraintRecord> dominant;
  bool overall_ok = true;
  Verdict verdict = Verdict::Pass;
  LedgerSummary summary;

  // FNV-1a over (name, severity, passed, margin, margin_frac, violation_score).
  std::string fingerprint;

  const ConstraintRecord* find(const std::string& name) const noexcept;
};

ConstraintRecord evaluate_limit(const LimitSpec& spec, const OutputMap& outputs);

// Validates the table (ConfigurationError on malformed specs).
Ledger build_ledger(const OutputMap& outputs, const LimitTable& limits);

}  // namespace fusion::constraints
