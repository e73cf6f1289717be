#include "engine/io/run_artifact_parse.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <istream>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fusion::io {
namespace {

constexpr double kNullNumber = std::numeric_limits<double>::quiet_NaN();

enum class JType { kNull, kBool, kNum, kStr, kObj, kArr };

struct JVal {
  JType t = JType::kNull;
  bool b = false;
  double num = 0.0;
  std::string str;
  std::unordered_map<std::string, JVal> obj;
  std::vector<JVal> arr;
};

// Recursive-descent reader over a byte range. Tracks line/col for errors.
class Reader {
 public:
  Reader(std::string_view text, JsonParseError* err)
      : b_(text.data()), p_(text.data()), e_(text.data() + text.size()), err_(err) {}

  bool parse_document(JVal& out) {
    if (!parse_value(out, 0)) return false;
    skip_ws();
    if (!eof()) return fail("Trailing characters after JSON");
    return true;
  }

  bool fail(std::string msg) {
    if (err_) {
      err_->message = std::move(msg);
      err_->offset = static_cast<size_t>(p_ - b_);
      err_->line = line_;
      err_->col = col_;
    }
    return false;
  }

 private:
  static constexpr int kMaxDepth = 64;

  bool eof() const { return p_ >= e_; }

  void advance() {
    if (*p_ == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    ++p_;
  }

  void skip_ws() {
    while (!eof() && (*p_ == ' ' || *p_ == '\t' || *p_ == '\r' || *p_ == '\n')) advance();
  }

  bool expect(char ch) {
    skip_ws();
    if (eof() || *p_ != ch) return fail(std::string("Expected '") + ch + "'");
    advance();
    return true;
  }

  bool literal(const char* lit) {
    const char* q = p_;
    for (const char* s = lit; *s; ++s, ++q) {
      if (q >= e_ || *q != *s) return fail("Invalid literal");
    }
    while (p_ < q) advance();
    return true;
  }

  bool hex4(unsigned& out) {
    out = 0;
    for (int i = 0; i < 4; ++i) {
      if (eof()) return fail("Unexpected EOF in \\uXXXX escape");
      const char ch = *p_;
      unsigned v = 0;
      if (ch >= '0' && ch <= '9') v = static_cast<unsigned>(ch - '0');
      else if (ch >= 'a' && ch <= 'f') v = 10u + static_cast<unsigned>(ch - 'a');
      else if (ch >= 'A' && ch <= 'F') v = 10u + static_cast<unsigned>(ch - 'A');
      else return fail("Invalid hex digit in \\uXXXX escape");
      out = (out << 4) | v;
      advance();
    }
    return true;
  }

  static void append_utf8(std::string& s, unsigned cp) {
    if (cp <= 0x7F) {
      s.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      s.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      s.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      s.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  bool parse_string(std::string& out) {
    skip_ws();
    if (eof() || *p_ != '"') return fail("Expected string");
    advance();
    out.clear();

    while (!eof()) {
      const char ch = *p_;
      if (ch == '"') {
        advance();
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) return fail("Unescaped control character in string");
      if (ch != '\\') {
        out.push_back(ch);
        advance();
        continue;
      }
      advance();
      if (eof()) return fail("Unexpected EOF in string escape");
      const char esc = *p_;
      advance();
      switch (esc) {
        case '"':  out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/':  out.push_back('/'); break;
        case 'b':  out.push_back('\b'); break;
        case 'f':  out.push_back('\f'); break;
        case 'n':  out.push_back('\n'); break;
        case 'r':  out.push_back('\r'); break;
        case 't':  out.push_back('\t'); break;
        case 'u': {
          unsigned u = 0;
          if (!hex4(u)) return false;
          if (u >= 0xD800 && u <= 0xDBFF) {
            if (eof() || *p_ != '\\') return fail("High surrogate not followed by low surrogate");
            advance();
            if (eof() || *p_ != 'u') return fail("High surrogate not followed by \\u");
            advance();
            unsigned u2 = 0;
            if (!hex4(u2)) return false;
            if (u2 < 0xDC00 || u2 > 0xDFFF) return fail("Invalid low surrogate");
            append_utf8(out, 0x10000u + (((u - 0xD800u) << 10) | (u2 - 0xDC00u)));
          } else if (u >= 0xDC00 && u <= 0xDFFF) {
            return fail("Unexpected low surrogate");
          } else {
            append_utf8(out, u);
          }
        } break;
        default:
          return fail("Invalid escape sequence");
      }
    }
    return fail("Unterminated string");
  }

  bool digits() {
    if (eof() || !std::isdigit(static_cast<unsigned char>(*p_))) return false;
    while (!eof() && std::isdigit(static_cast<unsigned char>(*p_))) advance();
    return true;
  }

  // JSON number grammar: no leading '+', no NaN/Inf, no leading zeros.
  bool parse_number(double& out) {
    const char* start = p_;
    if (*p_ == '-') advance();
    if (eof()) return fail("Expected digits after '-'");
    if (*p_ == '0') {
      advance();
    } else if (!digits()) {
      return fail("Invalid number");
    }
    if (!eof() && *p_ == '.') {
      advance();
      if (!digits()) return fail("Expected digits after '.'");
    }
    if (!eof() && (*p_ == 'e' || *p_ == 'E')) {
      advance();
      if (!eof() && (*p_ == '+' || *p_ == '-')) advance();
      if (!digits()) return fail("Expected digits in exponent");
    }

    const std::string tmp(start, p_);
    errno = 0;
    char* endptr = nullptr;
    const double v = std::strtod(tmp.c_str(), &endptr);
    if (endptr == tmp.c_str() || *endptr != '\0') return fail("Failed to parse number");
    if (errno == ERANGE || !std::isfinite(v)) return fail("Number out of range");
    out = v;
    return true;
  }

  bool parse_array(JVal& out, int depth) {
    if (!expect('[')) return false;
    out.t = JType::kArr;
    skip_ws();
    if (!eof() && *p_ == ']') {
      advance();
      return true;
    }
    while (true) {
      JVal v;
      if (!parse_value(v, depth + 1)) return false;
      out.arr.emplace_back(std::move(v));
      skip_ws();
      if (eof()) return fail("Unexpected EOF in array");
      if (*p_ == ',') {
        advance();
        continue;
      }
      if (*p_ == ']') {
        advance();
        return true;
      }
      return fail("Expected ',' or ']'");
    }
  }

  bool parse_object(JVal& out, int depth) {
    if (!expect('{')) return false;
    out.t = JType::kObj;
    skip_ws();
    if (!eof() && *p_ == '}') {
      advance();
      return true;
    }
    while (true) {
      std::string key;
      if (!parse_string(key)) return false;
      if (!expect(':')) return false;
      JVal val;
      if (!parse_value(val, depth + 1)) return false;
      out.obj[std::move(key)] = std::move(val);
      skip_ws();
      if (eof()) return fail("Unexpected EOF in object");
      if (*p_ == ',') {
        advance();
        continue;
      }
      if (*p_ == '}') {
        advance();
        return true;
      }
      return fail("Expected ',' or '}'");
    }
  }

  bool parse_value(JVal& out, int depth) {
    if (depth > kMaxDepth) return fail("Nesting too deep");
    skip_ws();
    if (eof()) return fail("Unexpected EOF");

    const char ch = *p_;
    if (ch == '{') return parse_object(out, depth);
    if (ch == '[') return parse_array(out, depth);
    if (ch == '"') {
      out.t = JType::kStr;
      return parse_string(out.str);
    }
    if (ch == 't' || ch == 'f') {
      out.t = JType::kBool;
      out.b = (ch == 't');
      return literal(out.b ? "true" : "false");
    }
    if (ch == 'n') {
      out.t = JType::kNull;
      return literal("null");
    }
    if (ch == '-' || (ch >= '0' && ch <= '9')) {
      out.t = JType::kNum;
      return parse_number(out.num);
    }
    return fail("Unexpected token");
  }

  const char* b_;
  const char* p_;
  const char* e_;
  JsonParseError* err_;
  int line_ = 1;
  int col_ = 1;
};

// ---- schema mapping (errors carry the document start as location) ----

bool schema_error(JsonParseError* err, std::string msg) {
  if (err) {
    err->message = std::move(msg);
    err->offset = 0;
    err->line = 1;
    err->col = 1;
  }
  return false;
}

const JVal* member(const JVal& o, const char* k) {
  if (o.t != JType::kObj) return nullptr;
  auto it = o.obj.find(k);
  return it == o.obj.end() ? nullptr : &it->second;
}

bool read_string(const JVal& o, const char* k, std::string& out, bool required, JsonParseError* err) {
  const JVal* v = member(o, k);
  if (!v) return required ? schema_error(err, std::string("Missing string field: ") + k) : true;
  if (v->t != JType::kStr) return schema_error(err, std::string("Field must be string: ") + k);
  out = v->str;
  return true;
}

// Number or null (null -> NaN). Absent leaves out unchanged.
bool read_number(const JVal& o, const char* k, double& out, JsonParseError* err) {
  const JVal* v = member(o, k);
  if (!v) return true;
  if (v->t == JType::kNull) {
    out = kNullNumber;
    return true;
  }
  if (v->t != JType::kNum) return schema_error(err, std::string("Field must be number or null: ") + k);
  out = v->num;
  return true;
}

bool read_int(const JVal& o, const char* k, int& out, JsonParseError* err) {
  const JVal* v = member(o, k);
  if (!v) return true;
  if (v->t != JType::kNum || v->num != std::floor(v->num) || std::fabs(v->num) > 1e9) {
    return schema_error(err, std::string("Field must be integer: ") + k);
  }
  out = static_cast<int>(v->num);
  return true;
}

bool read_bool(const JVal& o, const char* k, bool& out, JsonParseError* err) {
  const JVal* v = member(o, k);
  if (!v) return true;
  if (v->t != JType::kBool) return schema_error(err, std::string("Field must be boolean: ") + k);
  out = v->b;
  return true;
}

bool read_number_map(const JVal& o, const char* k, std::map<std::string, double>& out, JsonParseError* err) {
  const JVal* v = member(o, k);
  if (!v) return true;
  if (v->t != JType::kObj) return schema_error(err, std::string(k) + " must be an object");
  out.clear();
  for (const auto& [name, val] : v->obj) {
    if (val.t == JType::kNull) out[name] = kNullNumber;
    else if (val.t == JType::kNum) out[name] = val.num;
    else return schema_error(err, std::string(k) + "." + name + " must be number or null");
  }
  return true;
}

bool read_inputs(const JVal& obj, PointInputs& out, JsonParseError* err) {
  if (obj.t != JType::kObj) return schema_error(err, "inputs must be an object");
  std::map<std::string, double> fields;
  for (const auto& [name, val] : obj.obj) {
    if (!PointInputs::has_field(name)) continue;
    if (val.t == JType::kNull) fields[name] = kNullNumber;
    else if (val.t == JType::kNum) fields[name] = val.num;
    else return schema_error(err, "inputs." + name + " must be number or null");
  }
  for (const auto& f : input_fields()) {
    if (f.required && fields.find(f.name) == fields.end()) {
      return schema_error(err, std::string("Missing required input field: ") + f.name);
    }
  }
  out = PointInputs::from_fields(fields);
  return true;
}

bool parse_sense(const std::string& s, constraints::LimitSense& out) {
  if (s == "<=") { out = constraints::LimitSense::LessEq; return true; }
  if (s == ">=") { out = constraints::LimitSense::GreaterEq; return true; }
  return false;
}

bool parse_severity(const std::string& s, constraints::Severity& out) {
  if (s == "hard") { out = constraints::Severity::Hard; return true; }
  if (s == "soft") { out = constraints::Severity::Soft; return true; }
  return false;
}

bool parse_status(const std::string& s, constraints::ConstraintStatus& out) {
  if (s == "pass")    { out = constraints::ConstraintStatus::Pass; return true; }
  if (s == "fail")    { out = constraints::ConstraintStatus::Fail; return true; }
  if (s == "unknown") { out = constraints::ConstraintStatus::Unknown; return true; }
  return false;
}

bool read_record(const JVal& o, constraints::ConstraintRecord& r, JsonParseError* err) {
  if (o.t != JType::kObj) return schema_error(err, "constraints elements must be objects");
  std::string sense, severity, status;
  if (!read_string(o, "name", r.name, true, err)) return false;
  if (!read_string(o, "group", r.group, false, err)) return false;
  if (!read_string(o, "key", r.key, true, err)) return false;
  if (!read_string(o, "sense", sense, true, err)) return false;
  if (!read_string(o, "severity", severity, true, err)) return false;
  if (!read_string(o, "units", r.units, false, err)) return false;
  if (!read_string(o, "note", r.note, false, err)) return false;
  if (!read_string(o, "status", status, true, err)) return false;
  if (!parse_sense(sense, r.sense)) return schema_error(err, "Unknown constraint sense: " + sense);
  if (!parse_severity(severity, r.severity)) return schema_error(err, "Unknown severity: " + severity);
  if (!parse_status(status, r.status)) return schema_error(err, "Unknown constraint status: " + status);
  r.value = r.bound = r.margin = r.margin_frac = r.violation_score = kNullNumber;
  return read_number(o, "value", r.value, err) && read_number(o, "bound", r.bound, err) &&
         read_number(o, "margin", r.margin, err) && read_number(o, "margin_frac", r.margin_frac, err) &&
         read_bool(o, "passed", r.passed, err) &&
         read_number(o, "violation_score", r.violation_score, err) &&
         read_int(o, "dominance_rank", r.dominance_rank, err);
}

bool fill_artifact(const JVal& root, RunArtifact& a, JsonParseError* err) {
  if (root.t != JType::kObj) return schema_error(err, "Root must be an object");

  if (!read_string(root, "schema_version", a.schema_version, true, err)) return false;
  if (a.schema_version != kRunArtifactSchema) {
    return schema_error(err, "Unsupported schema_version: " + a.schema_version);
  }
  if (!read_string(root, "eval_id", a.eval_id, false, err)) return false;

  if (const JVal* model = member(root, "model")) {
    if (model->t != JType::kObj) return schema_error(err, "model must be an object");
    if (!read_string(*model, "confinement_scaling", a.confinement_scaling, false, err)) return false;
    if (!read_string(*model, "bootstrap", a.bootstrap_model, false, err)) return false;
  }

  const JVal* inputs = member(root, "inputs");
  if (!inputs) return schema_error(err, "Missing inputs object");
  if (!read_inputs(*inputs, a.inputs, err)) return false;

  if (const JVal* outputs = member(root, "outputs")) {
    if (outputs->t != JType::kObj) return schema_error(err, "outputs must be an object");
    for (const auto& [name, val] : outputs->obj) {
      if (val.t == JType::kNull) a.outputs.set(name, kNullNumber);
      else if (val.t == JType::kNum) a.outputs.set(name, val.num);
      else return schema_error(err, "outputs." + name + " must be number or null");
    }
  }

  if (const JVal* recs = member(root, "constraints")) {
    if (recs->t != JType::kArr) return schema_error(err, "constraints must be an array");
    a.constraints.reserve(recs->arr.size());
    for (const auto& it : recs->arr) {
      constraints::ConstraintRecord r;
      if (!read_record(it, r, err)) return false;
      a.constraints.push_back(std::move(r));
    }
  }

  if (const JVal* s = member(root, "summary")) {
    if (s->t != JType::kObj) return schema_error(err, "summary must be an object");
    ArtifactSummary& sm = a.summary;
    sm.worst_hard_margin_frac = kNullNumber;
    if (!read_bool(*s, "overall_ok", sm.overall_ok, err) ||
        !read_string(*s, "verdict", sm.verdict, false, err) ||
        !read_string(*s, "dominant", sm.dominant, false, err) ||
        !read_int(*s, "n_hard_failed", sm.n_hard_failed, err) ||
        !read_int(*s, "n_soft_failed", sm.n_soft_failed, err) ||
        !read_int(*s, "n_unknown", sm.n_unknown, err) ||
        !read_number(*s, "worst_hard_margin_frac", sm.worst_hard_margin_frac, err) ||
        !read_string(*s, "fingerprint", sm.fingerprint, false, err)) {
      return false;
    }
  }

  if (const JVal* s = member(root, "solve")) {
    if (s->t != JType::kObj) return schema_error(err, "solve must be an object");
    ArtifactSolve sv;
    if (!read_bool(*s, "ok", sv.ok, err) || !read_int(*s, "iterations", sv.iterations, err) ||
        !read_string(*s, "message", sv.message, false, err) ||
        !read_number_map(*s, "targets", sv.targets, err) ||
        !read_number_map(*s, "residuals", sv.residuals, err)) {
      return false;
    }
    a.solve = std::move(sv);
  }
  return true;
}

std::string slurp(std::istream& is) {
  std::ostringstream ss;
  ss << is.rdbuf();
  return ss.str();
}

}  // namespace

bool parse_run_artifact_json(std::string_view json, RunArtifact* out, JsonParseError* err) {
  if (!out) return false;
  JVal root;
  Reader rd(json, err);
  if (!rd.parse_document(root)) return false;

  RunArtifact a;
  if (!fill_artifact(root, a, err)) return false;
  *out = std::move(a);
  return true;
}

bool parse_run_artifact_json(std::istream& is, RunArtifact* out, JsonParseError* err) {
  return parse_run_artifact_json(std::string_view(slurp(is)), out, err);
}

bool parse_point_inputs_json(std::string_view json, PointInputs* out, JsonParseError* err) {
  if (!out) return false;
  JVal root;
  Reader rd(json, err);
  if (!rd.parse_document(root)) return false;
  if (root.t != JType::kObj) return schema_error(err, "Root must be an object");

  const JVal* inputs = member(root, "inputs");
  PointInputs p;
  if (!read_inputs(inputs ? *inputs : root, p, err)) return false;
  *out = p;
  return true;
}

}  // namespace fusion::io
