#pragma once
/*
===============================================================================
Fragment 3.1 — Constraints: Limit Specifications + Default Limit Table
FILE: cpp/engine/constraints/limits.hpp
===============================================================================
A limit names an OutputMap key, a sense (value <= bound / value >= bound), a
finite bound and a severity. Hard limits decide feasibility; soft limits
only mark a point WARN.

default_limit_table() reads the allowables carried by PointInputs. An
allowable set to NaN means the limit is not requested and is left out.
===============================================================================
*/

#include <cstdint>
#include <string>
#include <vector>

#include "engine/core/point_inputs.hpp"

namespace fusion::constraints {

enum class LimitSense : std::uint8_t {
  LessEq = 0,
  GreaterEq = 1,
};

enum class Severity : std::uint8_t {
  Soft = 0,
  Hard = 1,
};

const char* to_string(LimitSense s) noexcept;
const char* to_string(Severity s) noexcept;

struct LimitSpec final {
  std::string name;      // stable id, e.g. "q95_min"
  std::string group;     // plasma / exhaust / magnets / neutronics / plant / economics
  std::string key;       // OutputMap key
  LimitSense sense = LimitSense::LessEq;
  double bound = 0.0;
  Severity severity = Severity::Hard;
  std::string units;
  std::string note;

  // Empty name/key or non-finite bound throws ConfigurationError.
  void validate() const;
};

using LimitTable = std::vector<LimitSpec>;

void validate_table(const LimitTable& table);

LimitTable default_limit_table(const PointInputs& in);

}  // namespace fusion::constraints
