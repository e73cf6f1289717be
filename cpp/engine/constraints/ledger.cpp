#include "engine/constraints/ledger.hpp"

#include <algorithm>
#include <cmath>

#include "engine/core/hashing.hpp"
#include "engine/core/numeric.hpp"

namespace fusion::constraints {

namespace {

constexpr double kHardWeight = 10.0;
constexpr double kSoftWeight = 1.0;

std::string ledger_fingerprint(const std::vector<ConstraintRecord>& records) {
  Fnv1a64 h;
  h.update_tag("ConstraintLedger/v1");
  for (const auto& r : records) {
    h.update_string(r.name);
    h.update_enum(r.severity);
    h.update_bool(r.passed);
    h.update_f64(r.margin);
    h.update_f64(r.margin_frac);
    h.update_f64(r.violation_score);
  }
  return hash_to_hex(h.digest());
}

}  // namespace

const char* to_string(ConstraintStatus s) noexcept {
  switch (s) {
    case ConstraintStatus::Pass:    return "pass";
    case ConstraintStatus::Fail:    return "fail";
    case ConstraintStatus::Unknown: return "unknown";
  }
  return "unknown";
}

const char* to_string(Verdict v) noexcept {
  switch (v) {
    case Verdict::Pass: return "PASS";
    case Verdict::Warn: return "WARN";
    case Verdict::Fail: return "FAIL";
  }
  return "FAIL";
}

const ConstraintRecord* Ledger::find(const std::string& name) const noexcept {
  for (const auto& r : records) {
    if (r.name == name) return &r;
  }
  return nullptr;
}

ConstraintRecord evaluate_limit(const LimitSpec& spec, const OutputMap& outputs) {
  ConstraintRecord r;
  r.name = spec.name;
  r.group = spec.group;
  r.key = spec.key;
  r.sense = spec.sense;
  r.severity = spec.severity;
  r.units = spec.units;
  r.note = spec.note;
  r.bound = spec.bound;
  r.value = outputs.get(spec.key);

  if (std::isnan(r.value)) {
    r.status = ConstraintStatus::Unknown;
    r.passed = false;
    r.margin = kNaN;
    r.margin_frac = kNaN;
    r.violation_score = kNaN;
    return r;
  }

  r.margin = (spec.sense == LimitSense::LessEq) ? (spec.bound - r.value) : (r.value - spec.bound);
  const double denom = (spec.bound == 0.0) ? 1.0 : std::fabs(spec.bound);
  r.margin_frac = r.margin / denom;

  r.passed = r.margin_frac >= 0.0;
  r.status = r.passed ? ConstraintStatus::Pass : ConstraintStatus::Fail;

  const double w = (spec.severity == Severity::Hard) ? kHardWeight : kSoftWeight;
  r.violation_score = r.passed ? 0.0 : w * (-r.margin_frac);
  return r;
}

Ledger build_ledger(const OutputMap& outputs, const LimitTable& limits) {
  validate_table(limits);

  Ledger L;
  L.records.reserve(limits.size());
  for (const auto& spec : limits) L.records.push_back(evaluate_limit(spec, outputs));

  // ---- Dominant hard constraint ----
  const ConstraintRecord* dom = nullptr;
  const ConstraintRecord* first_unknown_hard = nullptr;
  for (const auto& r : L.records) {
    if (r.severity != Severity::Hard || r.passed) continue;
    if (r.status == ConstraintStatus::Unknown) {
      if (!first_unknown_hard) first_unknown_hard = &r;
      continue;
    }
    if (!dom || r.margin_frac < dom->margin_frac) dom = &r;  // strict: first wins ties
  }
  if (!dom) dom = first_unknown_hard;
  if (dom) L.dominant = *dom;

  // ---- Summary ----
  LedgerSummary& s = L.summary;
  s.worst_hard_margin_frac = kNaN;
  for (const auto& r : L.records) {
    const bool unknown = r.status == ConstraintStatus::Unknown;
    if (unknown) ++s.n_unknown;
    if (r.severity == Severity::Hard) {
      if (!r.passed) ++s.n_hard_failed;
      if (!unknown && (std::isnan(s.worst_hard_margin_frac) || r.margin_frac < s.worst_hard_margin_frac)) {
        s.worst_hard_margin_frac = r.margin_frac;
      }
    } else {
      if (!r.passed) ++s.n_soft_failed;
      if (!unknown && !r.passed) s.soft_penalty_sum += r.violation_score;
    }
  }

  L.overall_ok = (s.n_hard_failed == 0);
  if (!L.overall_ok) {
    L.verdict = Verdict::Fail;
  } else if (s.n_soft_failed > 0) {
    L.verdict = Verdict::Warn;
  } else {
    L.verdict = Verdict::Pass;
  }

  // ---- Dominance ranking over records that did not pass ----
  // Unknown records sort after every numeric violation, hard before soft.
  std::vector<size_t> failed;
  for (size_t i = 0; i < L.records.size(); ++i) {
    if (!L.records[i].passed) failed.push_back(i);
  }
  std::stable_sort(failed.begin(), failed.end(), [&L](size_t a, size_t b) {
    const auto& ra = L.records[a];
    const auto& rb = L.records[b];
    const bool ua = ra.status == ConstraintStatus::Unknown;
    const bool ub = rb.status == ConstraintStatus::Unknown;
    if (ua != ub) return !ua;
    if (ua) return ra.severity == Severity::Hard && rb.severity != Severity::Hard;
    return ra.violation_score > rb.violation_score;
  });
  for (size_t rank = 0; rank < failed.size(); ++rank) {
    L.records[failed[rank]].dominance_rank = static_cast<int>(rank + 1);
    if (s.top_blockers.size() < Ledger::kMaxTopBlockers) {
      s.top_blockers.push_back(L.records[failed[rank]].name);
    }
  }
  if (L.dominant) {
    if (const ConstraintRecord* r = L.find(L.dominant->name)) L.dominant = *r;
  }

  L.fingerprint = ledger_fingerprint(L.records);
  return L;
}

}  // namespace fusion::constraints
