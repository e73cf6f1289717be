/*
  Fragment 6.1t — Run Artifact JSON Selftest

  Objective
  ---------
  Framework-free checks for the artifact writer and parser:
    1) NaN/Inf never appear as literals; they are written as null.
    2) write(parse(write(x))) == write(x), pretty and compact; parsed inputs
       are bit-identical to the written ones and reproduce the eval_id.
    3) Parser rejects non-JSON literals, wrong schema, missing required inputs.
    4) Inputs-only documents (flat or full artifact) load PointInputs.

  Expected use
  ------------
    ./run_artifact_json_selftest     (non-zero exit on failure)
*/

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

#include "engine/constraints/ledger.hpp"
#include "engine/constraints/limits.hpp"
#include "engine/core/config.hpp"
#include "engine/core/eval_key.hpp"
#include "engine/core/point_inputs.hpp"
#include "engine/io/run_artifact.hpp"
#include "engine/io/run_artifact_parse.hpp"
#include "engine/physics/point_evaluator.hpp"

namespace fusion::io {
namespace {

static int g_fail_count = 0;

void expect_true(bool v, std::string_view msg) {
  if (!v) {
    ++g_fail_count;
    std::cerr << "[FAIL] " << msg << "\n";
  } else {
    std::cerr << "[ OK ] " << msg << "\n";
  }
}

bool contains(const std::string& s, std::string_view needle) {
  return s.find(needle) != std::string::npos;
}

RunArtifact artifact_for(const PointInputs& in) {
  const EvalConfig cfg = EvalConfig::defaults();
  const OutputMap out = physics::evaluate(in, cfg);
  const auto led = constraints::build_ledger(out, constraints::default_limit_table(in));
  RunArtifact a = make_run_artifact(in, out, led, cfg);
  return a;
}

JsonWriteOptions compact() {
  JsonWriteOptions o;
  o.pretty = false;
  return o;
}

void test_no_nan_literals() {
  // a = 0 drives geometry, and everything downstream of it, to NaN.
  const RunArtifact a = artifact_for(PointInputs::reference().with("a_m", 0.0));
  const std::string j = run_artifact_to_json(a, compact());

  const bool clean = !contains(j, ":nan") && !contains(j, ":-nan") && !contains(j, ":inf") &&
                     !contains(j, ":-inf") && !contains(j, "NaN") && !contains(j, "Infinity");
  expect_true(clean, "no NaN/Inf literals in the document");
  expect_true(contains(j, "\"aspect\":null"), "NaN output written as null");
  expect_true(contains(j, "\"status\":\"unknown\""), "unknown constraint status serialized");

  RunArtifact back;
  JsonParseError err;
  const bool ok = parse_run_artifact_json(j, &back, &err);
  expect_true(ok, "document with nulls parses");
  if (!ok) std::cerr << "  parse error: " << err.message << "\n";
  expect_true(std::isnan(back.outputs.aspect), "null reads back as NaN");
  expect_true(back.inputs.a_m == 0.0, "inputs survive the round trip");
}

void test_round_trip_is_byte_stable() {
  RunArtifact a = artifact_for(PointInputs::reference());
  a.outputs.aux["solver_clamped_Q"] = 1.0;

  solvers::SolveResult sr;
  sr.ok = true;
  sr.iterations = 3;
  sr.message = "converged";
  sr.residuals = {0.5};
  attach_solve(a, sr, {{"Pfus_MW", 1000.0}});

  for (const bool pretty : {true, false}) {
    JsonWriteOptions opt;
    opt.pretty = pretty;
    const std::string j1 = run_artifact_to_json(a, opt);

    RunArtifact b;
    JsonParseError err;
    const bool ok = parse_run_artifact_json(j1, &b, &err);
    expect_true(ok, pretty ? "pretty document parses" : "compact document parses");
    if (!ok) std::cerr << "  parse error: " << err.message << "\n";
    const std::string j2 = run_artifact_to_json(b, opt);
    expect_true(j1 == j2, pretty ? "pretty round trip is byte-stable" : "compact round trip is byte-stable");

    expect_true(b.solve.has_value() && b.solve->residuals.at("Pfus_MW") == 0.5 &&
                    b.solve->targets.at("Pfus_MW") == 1000.0,
                "solve block survives the round trip");
    expect_true(b.outputs.aux.count("solver_clamped_Q") == 1, "aux outputs survive the round trip");
    expect_true(b.constraints.size() == a.constraints.size() && b.summary.verdict == a.summary.verdict,
                "constraints and summary survive the round trip");
  }

  std::ostringstream os;
  write_run_artifact_json(os, a, compact());
  RunArtifact c;
  std::istringstream is(os.str());
  expect_true(parse_run_artifact_json(is, &c) && c.eval_id == a.eval_id, "stream overloads agree");
}

bool same_inputs(const PointInputs& a, const PointInputs& b) {
  const auto fa = a.to_fields();
  const auto fb = b.to_fields();
  if (fa.size() != fb.size()) return false;
  for (const auto& [name, va] : fa) {
    const auto it = fb.find(name);
    if (it == fb.end()) return false;
    const double vb = it->second;
    if (std::isnan(va) ? !std::isnan(vb) : va != vb) return false;
  }
  return true;
}

void test_inputs_survive_exactly() {
  // Values a solver produces are rarely short decimals.
  PointInputs in = PointInputs::reference();
  in.fG = 0.1 + 0.2;
  in.Paux_MW = 100.0 / 3.0;
  in.Ip_MA = 8.7 * (1.0 + 1e-15);
  const RunArtifact a = artifact_for(in);

  for (const bool pretty : {true, false}) {
    JsonWriteOptions opt;
    opt.pretty = pretty;
    RunArtifact back;
    JsonParseError err;
    const bool ok = parse_run_artifact_json(run_artifact_to_json(a, opt), &back, &err);
    expect_true(ok, "artifact with long decimals parses");
    expect_true(back.inputs.fG == in.fG && back.inputs.Paux_MW == in.Paux_MW && back.inputs.Ip_MA == in.Ip_MA,
                "long decimals read back bit-identical");
    expect_true(same_inputs(back.inputs, in), "every input field survives write -> parse");
    expect_true(make_eval_key(back.inputs, EvalConfig::defaults()).eval_id() == a.eval_id,
                "parsed inputs reproduce the artifact eval_id");
    expect_true(physics::evaluate(back.inputs, EvalConfig::defaults()).Pfus_MW == a.outputs.Pfus_MW,
                "re-evaluating parsed inputs reproduces the outputs");
  }

  // A caller's stream keeps its own formatting state.
  std::ostringstream os;
  os << std::fixed << std::setprecision(3);
  write_run_artifact_json(os, a, compact());
  expect_true(os.precision() == 3 && (os.flags() & std::ios_base::fixed), "caller stream format restored");
  RunArtifact back;
  std::istringstream is(os.str());
  expect_true(parse_run_artifact_json(is, &back) && back.inputs.fG == in.fG,
              "caller stream format does not truncate numbers");
}

void test_document_layout() {
  const RunArtifact a = artifact_for(PointInputs::reference());
  const std::string j = run_artifact_to_json(a, compact());
  const size_t p_schema = j.find("\"schema_version\"");
  const size_t p_id = j.find("\"eval_id\"");
  const size_t p_in = j.find("\"inputs\"");
  const size_t p_out = j.find("\"outputs\"");
  const size_t p_con = j.find("\"constraints\"");
  const size_t p_sum = j.find("\"summary\"");
  expect_true(p_schema < p_id && p_id < p_in && p_in < p_out && p_out < p_con && p_con < p_sum,
              "fixed top-level key order");
  expect_true(contains(j, std::string("\"schema_version\":\"") + kRunArtifactSchema + "\""),
              "schema version written");
  expect_true(a.eval_id == make_eval_key(PointInputs::reference(), EvalConfig::defaults()).eval_id(),
              "eval_id matches the evaluation key");
  expect_true(!contains(j, "\"solve\""), "no solve block unless attached");
  expect_true(!contains(j, "\n"), "compact output is a single line");
}

void test_parse_rejections() {
  RunArtifact a;
  JsonParseError err;

  expect_true(!parse_run_artifact_json(R"({"schema_version":"fusion.run_artifact.v1","inputs":{"R0_m":NaN}})", &a, &err),
              "NaN literal rejected");
  expect_true(!err.message.empty(), "rejection carries a message");

  err = JsonParseError{};
  expect_true(!parse_run_artifact_json("{\"schema_version\":\"fusion.run_artifact.v1\",\n \"inputs\": [1,}", &a, &err),
              "malformed JSON rejected");
  expect_true(err.line == 2, "syntax error reports its line");

  err = JsonParseError{};
  expect_true(!parse_run_artifact_json(R"({"schema_version":"other.v9","inputs":{}})", &a, &err),
              "wrong schema_version rejected");
  expect_true(contains(err.message, "schema_version"), "schema message names the field");

  err = JsonParseError{};
  expect_true(!parse_run_artifact_json(R"({"schema_version":"fusion.run_artifact.v1","inputs":{"R0_m":1.81}})", &a,
                                       &err),
              "missing required inputs rejected");
  expect_true(contains(err.message, "Missing required input field: a_m"), "message names the missing field");
}

void test_inputs_documents() {
  const std::string flat =
      R"({"R0_m":2.0,"a_m":0.6,"kappa":1.7,"Bt_T":11.0,"Ip_MA":7.5,"Ti_keV":14.0,"fG":0.8,"Paux_MW":25.0,)"
      R"("t_blanket_m":0.6,"comment":"ignored","future_field":3})";
  PointInputs p;
  JsonParseError err;
  const bool ok = parse_point_inputs_json(flat, &p, &err);
  expect_true(ok, "flat inputs object parses");
  if (!ok) std::cerr << "  parse error: " << err.message << "\n";
  expect_true(p.R0_m == 2.0 && p.Ip_MA == 7.5 && p.Paux_MW == 25.0, "required fields loaded");
  expect_true(p.t_blanket_m == 0.6, "optional field loaded");
  expect_true(p.t_shield_m == PointInputs{}.t_shield_m, "absent optional field keeps its default");

  const std::string full = run_artifact_to_json(artifact_for(PointInputs::reference()), compact());
  PointInputs q;
  expect_true(parse_point_inputs_json(full, &q) && q.Bt_T == 12.2 && q.fG == 0.85,
              "full artifact supplies its inputs block");

  expect_true(!parse_point_inputs_json(R"({"R0_m":2.0})", &q, &err), "flat object missing fields rejected");
}

}  // namespace
}  // namespace fusion::io

int main() {
  using namespace fusion::io;

  test_no_nan_literals();
  test_round_trip_is_byte_stable();
  test_inputs_survive_exactly();
  test_document_layout();
  test_parse_rejections();
  test_inputs_documents();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
