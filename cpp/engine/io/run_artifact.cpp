#include "engine/io/run_artifact.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <ostream>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

#include "engine/core/eval_key.hpp"

namespace fusion::io {
namespace {

std::string escape_json(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);

  for (unsigned char c : s) {
    switch (c) {
      case '\"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          static const char* hex = "0123456789abcdef";
          out += "\\u00";
          out += hex[(c >> 4) & 0xF];
          out += hex[c & 0xF];
        } else {
          out += static_cast<char>(c);
        }
        break;
    }
  }
  return out;
}

// Classic locale and round-trip precision on the caller's stream, restored on exit.
class StreamFormatGuard {
 public:
  explicit StreamFormatGuard(std::ostream& os)
      : os_(os), locale_(os.imbue(std::locale::classic())), precision_(os.precision()), flags_(os.flags()) {
    os_.unsetf(std::ios_base::floatfield);
  }
  ~StreamFormatGuard() {
    os_.flags(flags_);
    os_.precision(precision_);
    os_.imbue(locale_);
  }
  StreamFormatGuard(const StreamFormatGuard&) = delete;
  StreamFormatGuard& operator=(const StreamFormatGuard&) = delete;

 private:
  std::ostream& os_;
  std::locale locale_;
  std::streamsize precision_;
  std::ios_base::fmtflags flags_;
};

// Every value (object member or array element) starts on its own line;
// empty containers print as {} / [].
class JsonWriter {
 public:
  JsonWriter(std::ostream& os, const JsonWriteOptions& opt) : os_(os), opt_(opt) {}

  void begin_object() { open('{'); }
  void end_object() { close('}'); }
  void begin_array() { open('['); }
  void end_array() { close(']'); }

  void key(std::string_view k) {
    element_prefix();
    os_ << "\"" << escape_json(k) << "\":";
    if (opt_.pretty) os_ << " ";
    pending_value_ = true;
  }

  void string(std::string_view v) {
    value_prefix();
    os_ << "\"" << escape_json(v) << "\"";
  }

  void boolean(bool v) {
    value_prefix();
    os_ << (v ? "true" : "false");
  }

  void null_value() {
    value_prefix();
    os_ << "null";
  }

  // Non-finite -> null.
  void number(double v) {
    if (!std::isfinite(v)) {
      null_value();
      return;
    }
    value_prefix();
    os_ << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
  }

  void integer(long long v) {
    value_prefix();
    os_ << v;
  }

  void kv(std::string_view k, std::string_view v) { key(k); string(v); }
  void kv_num(std::string_view k, double v) { key(k); number(v); }
  void kv_bool(std::string_view k, bool v) { key(k); boolean(v); }
  void kv_int(std::string_view k, long long v) { key(k); integer(v); }

 private:
  void newline_indent(int depth) {
    if (!opt_.pretty) return;
    os_ << "\n";
    for (int i = 0; i < depth * opt_.indent_spaces; ++i) os_ << ' ';
  }

  void element_prefix() {
    if (!first_.empty()) {
      if (!first_.back()) os_ << ",";
      first_.back() = false;
      newline_indent(static_cast<int>(first_.size()));
    }
  }

  void value_prefix() {
    if (pending_value_) {
      pending_value_ = false;
      return;
    }
    element_prefix();
  }

  void open(char c) {
    value_prefix();
    os_ << c;
    first_.push_back(true);
  }

  void close(char c) {
    const bool empty = first_.back();
    first_.pop_back();
    if (!empty) newline_indent(static_cast<int>(first_.size()));
    os_ << c;
  }

  std::ostream& os_;
  JsonWriteOptions opt_;
  std::vector<bool> first_;
  bool pending_value_ = false;
};

void write_inputs(JsonWriter& w, const PointInputs& in) {
  w.begin_object();
  for (const auto& f : input_fields()) w.kv_num(f.name, in.*(f.member));
  w.end_object();
}

void write_outputs(JsonWriter& w, const OutputMap& out) {
  w.begin_object();
  out.for_each([&](const std::string& k, double v) { w.kv_num(k, v); });
  w.end_object();
}

void write_constraints(JsonWriter& w, const std::vector<constraints::ConstraintRecord>& recs) {
  w.begin_array();
  for (const auto& r : recs) {
    w.begin_object();
    w.kv("name", r.name);
    w.kv("group", r.group);
    w.kv("key", r.key);
    w.kv("sense", constraints::to_string(r.sense));
    w.kv("severity", constraints::to_string(r.severity));
    w.kv("units", r.units);
    w.kv("note", r.note);
    w.kv_num("value", r.value);
    w.kv_num("bound", r.bound);
    w.kv_num("margin", r.margin);
    w.kv_num("margin_frac", r.margin_frac);
    w.kv("status", constraints::to_string(r.status));
    w.kv_bool("passed", r.passed);
    w.kv_num("violation_score", r.violation_score);
    w.kv_int("dominance_rank", r.dominance_rank);
    w.end_object();
  }
  w.end_array();
}

void write_summary(JsonWriter& w, const ArtifactSummary& s) {
  w.begin_object();
  w.kv_bool("overall_ok", s.overall_ok);
  w.kv("verdict", s.verdict);
  w.kv("dominant", s.dominant);
  w.kv_int("n_hard_failed", s.n_hard_failed);
  w.kv_int("n_soft_failed", s.n_soft_failed);
  w.kv_int("n_unknown", s.n_unknown);
  w.kv_num("worst_hard_margin_frac", s.worst_hard_margin_frac);
  w.kv("fingerprint", s.fingerprint);
  w.end_object();
}

void write_number_map(JsonWriter& w, const std::map<std::string, double>& m) {
  w.begin_object();
  for (const auto& [k, v] : m) w.kv_num(k, v);
  w.end_object();
}

void write_solve(JsonWriter& w, const ArtifactSolve& s) {
  w.begin_object();
  w.kv_bool("ok", s.ok);
  w.kv_int("iterations", s.iterations);
  w.kv("message", s.message);
  w.key("targets");
  write_number_map(w, s.targets);
  w.key("residuals");
  write_number_map(w, s.residuals);
  w.end_object();
}

}  // namespace

RunArtifact make_run_artifact(const PointInputs& inputs, const OutputMap& outputs,
                              const constraints::Ledger& ledger, const EvalConfig& cfg) {
  RunArtifact a;
  a.eval_id = make_eval_key(inputs, cfg).eval_id();
  a.confinement_scaling = to_string(cfg.model.comparator_scaling);
  a.bootstrap_model = to_string(cfg.model.bootstrap);
  a.inputs = inputs;
  a.outputs = outputs;
  a.constraints = ledger.records;
  a.summary.overall_ok = ledger.overall_ok;
  a.summary.verdict = constraints::to_string(ledger.verdict);
  a.summary.dominant = ledger.dominant ? ledger.dominant->name : "";
  a.summary.n_hard_failed = ledger.summary.n_hard_failed;
  a.summary.n_soft_failed = ledger.summary.n_soft_failed;
  a.summary.n_unknown = ledger.summary.n_unknown;
  a.summary.worst_hard_margin_frac = ledger.summary.worst_hard_margin_frac;
  a.summary.fingerprint = ledger.fingerprint;
  return a;
}

void attach_solve(RunArtifact& art, const solvers::SolveResult& res,
                  const std::vector<solvers::TargetSpec>& targets) {
  ArtifactSolve s;
  s.ok = res.ok;
  s.iterations = res.iterations;
  s.message = res.message;
  for (size_t i = 0; i < targets.size(); ++i) {
    s.targets[targets[i].key] = targets[i].value;
    if (i < res.residuals.size()) s.residuals[targets[i].key] = res.residuals[i];
  }
  art.solve = std::move(s);
}

void write_run_artifact_json(std::ostream& os, const RunArtifact& art, const JsonWriteOptions& opt) {
  const StreamFormatGuard guard(os);
  JsonWriter w(os, opt);

  w.begin_object();
  w.kv("schema_version", art.schema_version);
  w.kv("eval_id", art.eval_id);
  w.key("model");
  w.begin_object();
  w.kv("confinement_scaling", art.confinement_scaling);
  w.kv("bootstrap", art.bootstrap_model);
  w.end_object();
  w.key("inputs");
  write_inputs(w, art.inputs);
  w.key("outputs");
  write_outputs(w, art.outputs);
  w.key("constraints");
  write_constraints(w, art.constraints);
  w.key("summary");
  write_summary(w, art.summary);
  if (art.solve) {
    w.key("solve");
    write_solve(w, *art.solve);
  }
  w.end_object();

  if (opt.pretty) os << "\n";
}

std::string run_artifact_to_json(const RunArtifact& art, const JsonWriteOptions& opt) {
  std::ostringstream ss;
  write_run_artifact_json(ss, art, opt);
  return ss.str();
}

}  // namespace fusion::io
