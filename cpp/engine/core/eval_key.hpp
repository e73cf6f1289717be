#pragma once
/*
================================================================================
Fragment 1.7 — Core: Deterministic Evaluation Keys
FILE: cpp/engine/core/eval_key.hpp

Purpose:
  - Content address of one point evaluation: every PointInputs field plus the
    EvalConfig parts that change physics outputs (model switches, calibration,
    numerical floors). Solver/frontier/cache settings are deliberately left
    out: they never change what evaluate() returns.
  - Stable string IDs for artifacts and logs.

Hardening:
  - No std::hash. Fields hashed in table order with versioned tags.
  - Doubles hashed via canonical bit patterns (Fnv1a64::update_f64).
================================================================================
*/

#include <cstddef>
#include <string>

#include "engine/core/config.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/point_inputs.hpp"

namespace fusion {

struct EvalKey {
  Hash64 inputs_h{};
  Hash64 config_h{};
  Hash64 combined_h{};

  bool operator==(const EvalKey& o) const noexcept {
    return inputs_h == o.inputs_h && config_h == o.config_h && combined_h == o.combined_h;
  }

  std::string inputs_hex() const { return hash_to_hex(inputs_h); }
  std::string config_hex() const { return hash_to_hex(config_h); }

  // Format: i_<16>__c_<16>__e_<16>
  std::string eval_id() const;
};

struct EvalKeyHash {
  size_t operator()(const EvalKey& k) const noexcept {
    return static_cast<size_t>(k.combined_h.value);
  }
};

Hash64 hash_point_inputs(const PointInputs& p);

// Validates cfg first so nonsensical configs never reach a cache.
Hash64 hash_eval_config(const EvalConfig& cfg);

EvalKey make_eval_key(const PointInputs& p, const EvalConfig& cfg);

}  // namespace fusion
