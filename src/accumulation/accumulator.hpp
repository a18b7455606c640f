#ifndef ACCUMULATOR_HPP
#define ACCUMULATOR_HPP

#include "accumulator_config.hpp"
#include "accumulator_state.hpp"
#include "entity_key.hpp"
#include "metrics/verification_metrics.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace accumulation {

struct UpdateResult {
  size_t accepted = 0;
  size_t rejected = 0;
};

/**
 * Running verification statistics of one (entity, variable) key.
 *
 * The accumulator owns its state and is only changed through `update` and
 * `merge`. Neither is thread-safe; a worker owns its accumulators
 * exclusively until they are handed to the merger.
 */
class Accumulator {
public:
  // Throws core::ConfigurationError when `config` is null or the variable
  // name is empty.
  Accumulator(EntityKey entity, std::string variable,
              AccumulatorConfigPtr config);

  // Restores a persisted state. The state must have the shape of `config`.
  Accumulator(EntityKey entity, std::string variable,
              AccumulatorConfigPtr config, AccumulatorState state);

  /**
   * Folds a batch of aligned forecast/observation values into the state.
   * `probabilities`, when given, must have the same length and requires
   * configured probability bins.
   *
   * Throws core::ShapeMismatchError on length disagreement and
   * core::ConfigurationError for probabilities without bins. In both cases
   * the state is left untouched.
   */
  UpdateResult update(const std::vector<double> &forecasts,
                      const std::vector<double> &observations,
                      const std::vector<double> *probabilities = nullptr);

  // Throws core::IncompatibleAccumulatorError unless `other` describes the
  // same entity and variable with an equal configuration.
  void merge(const Accumulator &other);

  bool is_compatible_with(const Accumulator &other) const;

  metrics::MetricsReport compute_metrics() const;

  const EntityKey &entity() const { return entity_; }
  const std::string &variable() const { return variable_; }
  const AccumulatorConfigPtr &config() const { return config_; }
  const AccumulatorState &state() const { return state_; }
  AccumulatorKey key() const { return {entity_, variable_}; }

private:
  EntityKey entity_;
  std::string variable_;
  AccumulatorConfigPtr config_;
  AccumulatorState state_;
};

// New accumulator holding lhs merged with rhs; neither input changes.
Accumulator merged(const Accumulator &lhs, const Accumulator &rhs);

} // namespace accumulation

#endif // ACCUMULATOR_HPP
