#pragma once
/*
================================================================================
Fragment 6.1 — IO: Run Artifact (Types + JSON Writer)
FILE: cpp/engine/io/run_artifact.hpp

Purpose:
  - One self-describing JSON document per evaluated point:
      schema_version, eval_id, model, inputs, outputs, constraints, summary,
      optional solve block.
  - Deterministic: fixed key order (schema order for inputs/outputs, table
    order for constraints, sorted for maps), 15 significant digits.

NaN handling:
  - JSON has no NaN/Inf. Every non-finite number is written as null and
    read back as NaN, so write(parse(write(x))) == write(x) byte-for-byte.
================================================================================
*/

#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "engine/constraints/ledger.hpp"
#include "engine/core/config.hpp"
#include "engine/core/point_inputs.hpp"
#include "engine/physics/output_map.hpp"
#include "engine/solvers/target_solver.hpp"

namespace fusion::io {

inline constexpr const char* kRunArtifactSchema = "fusion.run_artifact.v1";

struct JsonWriteOptions {
  bool pretty = true;
  int indent_spaces = 2;
};

struct ArtifactSummary {
  bool overall_ok = false;
  std::string verdict;       // PASS | WARN | FAIL
  std::string dominant;      // dominant constraint name, "" when none
  int n_hard_failed = 0;
  int n_soft_failed = 0;
  int n_unknown = 0;
  double worst_hard_margin_frac = 0.0;
  std::string fingerprint;
};

struct ArtifactSolve {
  bool ok = false;
  int iterations = 0;
  std::string message;
  std::map<std::string, double> targets;     // key -> target value
  std::map<std::string, double> residuals;   // key -> target - value
};

struct RunArtifact {
  std::string schema_version = kRunArtifactSchema;
  std::string eval_id;
  std::string confinement_scaling;
  std::string bootstrap_model;
  PointInputs inputs;
  OutputMap outputs;
  std::vector<constraints::ConstraintRecord> constraints;
  ArtifactSummary summary;
  std::optional<ArtifactSolve> solve;
};

RunArtifact make_run_artifact(const PointInputs& inputs, const OutputMap& outputs,
                              const constraints::Ledger& ledger, const EvalConfig& cfg);

// Attach a solve block built from a solver result and its targets.
void attach_solve(RunArtifact& art, const solvers::SolveResult& res,
                  const std::vector<solvers::TargetSpec>& targets);

void write_run_artifact_json(std::ostream& os, const RunArtifact& art, const JsonWriteOptions& opt = {});
std::string run_artifact_to_json(const RunArtifact& art, const JsonWriteOptions& opt = {});

}  // namespace fusion::io
