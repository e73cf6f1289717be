#include "engine/core/eval_key.hpp"

namespace fusion {

std::string EvalKey::eval_id() const {
  std::string s;
  s.reserve(3 * 16 + 12);
  s += "i_";
  s += hash_to_hex(inputs_h);
  s += "__c_";
  s += hash_to_hex(config_h);
  s += "__e_";
  s += hash_to_hex(combined_h);
  return s;
}

Hash64 hash_point_inputs(const PointInputs& p) {
  Fnv1a64 h;
  h.update_tag("PointInputs/v1");
  for (const auto& f : input_fields()) {
    h.update_string(f.name);
    h.update_f64(p.*(f.member));
  }
  return h.digest();
}

Hash64 hash_eval_config(const EvalConfig& cfg) {
  cfg.validate_or_throw();

  Fnv1a64 h;
  h.update_tag("EvalConfig/v1");

  h.update_tag("Model");
  h.update_enum(cfg.model.comparator_scaling);
  h.update_enum(cfg.model.bootstrap);
  h.update_bool(cfg.model.radiation_enabled);
  h.update_bool(cfg.model.include_current_drive);

  h.update_tag("Calibration");
  h.update_f64(cfg.calibration.confinement);
  h.update_f64(cfg.calibration.lambda_q);
  h.update_f64(cfg.calibration.hts_jc);
  h.update_f64(cfg.calibration.fusion_power);

  h.update_tag("Numerics");
  h.update_f64(cfg.numerics.eps);
  h.update_f64(cfg.numerics.psol_floor_MW);

  return h.digest();
}

EvalKey make_eval_key(const PointInputs& p, const EvalConfig& cfg) {
  EvalKey k;
  k.inputs_h = hash_point_inputs(p);
  k.config_h = hash_eval_config(cfg);
  k.combined_h = hash_combine(k.inputs_h, k.config_h);
  return k;
}

}  // namespace fusion
