#include "engine/physics/point_evaluator.hpp"

#include <utility>

#include "engine/physics/relation_blocks.hpp"

namespace fusion::physics {

OutputMap evaluate(const PointInputs& inputs, const EvalConfig& config) {
  config.validate_or_throw();

  OutputMap out;
  eval_geometry(inputs, config, out);
  eval_density(inputs, config, out);
  eval_fusion_power(inputs, config, out);
  eval_power_balance(inputs, config, out);
  eval_operational_limits(inputs, config, out);
  eval_radial_build_magnet(inputs, config, out);
  eval_divertor(inputs, config, out);
  eval_neutronics(inputs, config, out);
  eval_plant(inputs, config, out);
  eval_availability_cost(inputs, config, out);
  return out;
}

CachedEvaluator::CachedEvaluator(EvalConfig config, EvalCache* cache)
    : config_(std::move(config)), cache_(cache), config_h_(hash_eval_config(config_)) {
  if (cache_ && !config_.cache.enabled) cache_ = nullptr;
}

OutputMap CachedEvaluator::evaluate(const PointInputs& inputs) const {
  if (!cache_) return physics::evaluate(inputs, config_);

  EvalKey key;
  key.inputs_h = hash_point_inputs(inputs);
  key.config_h = config_h_;
  key.combined_h = hash_combine(key.inputs_h, key.config_h);

  if (auto hit = cache_->get(key)) return std::move(*hit);

  OutputMap out = physics::evaluate(inputs, config_);
  cache_->put(key, out);
  return out;
}

}  // namespace fusion::physics
