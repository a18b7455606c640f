#ifndef ACCUMULATOR_SET_HPP
#define ACCUMULATOR_SET_HPP

#include "accumulator.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace accumulation {

/**
 * Accumulators of one worker (or one restored checkpoint), keyed by
 * (entity, variable). Iteration follows key order so snapshots and reports
 * come out deterministic.
 */
class AccumulatorSet {
public:
  using Map = std::map<AccumulatorKey, Accumulator>;

  // Returns the accumulator for the key, creating an empty one on first use.
  // Throws core::ConfigurationError if the existing one has another config,
  // core::IncompatibleAccumulatorError if its entity differs beyond the key
  // (name, coordinates, network).
  Accumulator &get_or_create(const EntityKey &entity,
                             const std::string &variable,
                             const AccumulatorConfigPtr &config);

  Accumulator *find(const AccumulatorKey &key);
  const Accumulator *find(const AccumulatorKey &key) const;

  // Adds `accumulator`, merging into an existing one under the same key.
  void insert(const Accumulator &accumulator);

  // Key-wise merge of every accumulator of `other` into this set
  void merge_from(const AccumulatorSet &other);

  std::vector<metrics::MetricsReport> compute_all_metrics() const;

  size_t size() const { return accumulators_.size(); }
  bool empty() const { return accumulators_.empty(); }
  void clear() { accumulators_.clear(); }

  Map::const_iterator begin() const { return accumulators_.begin(); }
  Map::const_iterator end() const { return accumulators_.end(); }

private:
  Map accumulators_;
};

} // namespace accumulation

#endif // ACCUMULATOR_SET_HPP
