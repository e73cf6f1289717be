#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

#include "engine/io/run_artifact.hpp"

namespace fusion::io {

struct JsonParseError {
  std::string message;
  size_t offset = 0;  // byte offset in input
  int line = 1;       // 1-based
  int col = 1;        // 1-based
};

/// Parse a RunArtifact from JSON text.
/// - Accepts `null` for numeric fields (converts to NaN).
/// - Rejects NaN/Inf literals (not valid JSON).
/// - Every required PointInputs field must be present under "inputs".
/// - Unknown keys are ignored (forward compatible).
bool parse_run_artifact_json(std::string_view json, RunArtifact* out, JsonParseError* err = nullptr);

/// Stream convenience (reads full stream into memory).
bool parse_run_artifact_json(std::istream& is, RunArtifact* out, JsonParseError* err = nullptr);

/// Inputs-only document: either a full artifact (uses its "inputs") or a
/// flat object of PointInputs fields. Used by `fusion_cli evaluate --in`.
bool parse_point_inputs_json(std::string_view json, PointInputs* out, JsonParseError* err = nullptr);

}  // namespace fusion::io
