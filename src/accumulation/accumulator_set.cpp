#include "accumulator_set.hpp"
#include "core/errors.hpp"

#include <utility>

namespace accumulation {

Accumulator &AccumulatorSet::get_or_create(const EntityKey &entity,
                                           const std::string &variable,
                                           const AccumulatorConfigPtr &config) {
  AccumulatorKey key{entity, variable};
  auto it = accumulators_.find(key);
  if (it != accumulators_.end()) {
    if (!it->second.entity().same_identity(entity))
      throw core::IncompatibleAccumulatorError(
          key.to_string() + " already exists with different entity metadata");
    if (!same_config(it->second.config(), config))
      throw core::ConfigurationError(key.to_string() +
                                     " already exists with another "
                                     "configuration");
    return it->second;
  }
  auto inserted =
      accumulators_.try_emplace(std::move(key), entity, variable, config);
  return inserted.first->second;
}

Accumulator *AccumulatorSet::find(const AccumulatorKey &key) {
  auto it = accumulators_.find(key);
  return it == accumulators_.end() ? nullptr : &it->second;
}

const Accumulator *AccumulatorSet::find(const AccumulatorKey &key) const {
  auto it = accumulators_.find(key);
  return it == accumulators_.end() ? nullptr : &it->second;
}

void AccumulatorSet::insert(const Accumulator &accumulator) {
  auto key = accumulator.key();
  auto it = accumulators_.find(key);
  if (it == accumulators_.end()) {
    accumulators_.emplace(std::move(key), accumulator);
    return;
  }
  it->second.merge(accumulator);
}

void AccumulatorSet::merge_from(const AccumulatorSet &other) {
  for (const auto &entry : other.accumulators_)
    insert(entry.second);
}

std::vector<metrics::MetricsReport> AccumulatorSet::compute_all_metrics() const {
  std::vector<metrics::MetricsReport> reports;
  reports.reserve(accumulators_.size());
  for (const auto &entry : accumulators_)
    reports.push_back(entry.second.compute_metrics());
  return reports;
}

} // namespace accumulation
