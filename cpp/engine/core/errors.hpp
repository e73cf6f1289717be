#pragma once
/*
================================================================================
Fragment 1.2 — Core: Error Types
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Uniform exception types for the few failures that are structural:
      * malformed point inputs (missing/unknown fields, bad switch codes)
      * invalid evaluation settings
      * artifact I/O
  - Physics domain problems are NOT exceptions. They surface as NaN outputs
    and as "unknown" constraint records.

Hardening:
  - Small, dependency-free exceptions.
  - ErrorSite keeps file/line/function for the throw site when raised through
    FUSION_REQUIRE.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace fusion {

// Base error for the engine.
class FusionError : public std::runtime_error {
 public:
  explicit FusionError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Structurally invalid point inputs: missing required field, unknown field
// name, unknown switch code, malformed limit/variable specification.
class ConfigurationError : public FusionError {
 public:
  explicit ConfigurationError(std::string msg) : FusionError(std::move(msg)) {}
};

// EvalConfig / settings outside sane bounds.
class ValidationError : public FusionError {
 public:
  explicit ValidationError(std::string msg) : FusionError(std::move(msg)) {}
};

// Reserved for internal numerical invariants that cannot be expressed as NaN.
class NumericalError : public FusionError {
 public:
  explicit NumericalError(std::string msg) : FusionError(std::move(msg)) {}
};

// File/stream related failures.
class IOError : public FusionError {
 public:
  explicit IOError(std::string msg) : FusionError(std::move(msg)) {}
};

struct ErrorSite {
  const char* file = "";
  const char* func = "";
  int line = 0;
};

template <class E>
[[noreturn]] inline void raise_at(const ErrorSite& site, const std::string& msg) {
  std::ostringstream oss;
  oss << msg;
  if (site.file && *site.file) {
    oss << " @ " << site.file << ":" << site.line;
    if (site.func && *site.func) oss << " (" << site.func << ")";
  }
  throw E(oss.str());
}

}  // namespace fusion

#define FUSION_SITE() ::fusion::ErrorSite{__FILE__, __func__, __LINE__}

#define FUSION_REQUIRE(cond, ErrType, msg)                       \
  do {                                                           \
    if (!(cond)) {                                               \
      ::fusion::raise_at<ErrType>(FUSION_SITE(), (msg));         \
    }                                                            \
  } while (0)
