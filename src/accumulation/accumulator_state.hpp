#ifndef ACCUMULATOR_STATE_HPP
#define ACCUMULATOR_STATE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace core {
class BinarySerializer;
class BinaryDeserializer;
} // namespace core

namespace accumulation {

// 2x2 table for one threshold
struct ContingencyCounts {
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t false_alarms = 0;
  uint64_t correct_negatives = 0;

  uint64_t total() const {
    return hits + misses + false_alarms + correct_negatives;
  }

  ContingencyCounts &operator+=(const ContingencyCounts &other) {
    hits += other.hits;
    misses += other.misses;
    false_alarms += other.false_alarms;
    correct_negatives += other.correct_negatives;
    return *this;
  }

  bool operator==(const ContingencyCounts &other) const {
    return hits == other.hits && misses == other.misses &&
           false_alarms == other.false_alarms &&
           correct_negatives == other.correct_negatives;
  }
  bool operator!=(const ContingencyCounts &other) const {
    return !(*this == other);
  }
};

// Running totals of one forecast probability bin
struct ProbabilityBinStats {
  double forecast_prob_sum = 0.0;
  uint64_t observed_event_count = 0;
  uint64_t bin_sample_count = 0;

  ProbabilityBinStats &operator+=(const ProbabilityBinStats &other) {
    forecast_prob_sum += other.forecast_prob_sum;
    observed_event_count += other.observed_event_count;
    bin_sample_count += other.bin_sample_count;
    return *this;
  }

  bool operator==(const ProbabilityBinStats &other) const {
    return forecast_prob_sum == other.forecast_prob_sum &&
           observed_event_count == other.observed_event_count &&
           bin_sample_count == other.bin_sample_count;
  }
  bool operator!=(const ProbabilityBinStats &other) const {
    return !(*this == other);
  }
};

/**
 * Sufficient statistics of one (entity, variable) stream.
 *
 * The state forms a commutative monoid: `identity(shape)` is the all-zero
 * state and `combine` adds every field. Integer counters combine exactly,
 * the double sums up to summation order. `contingency` runs parallel to the
 * configured thresholds and `probability_bins` to the configured bins, so
 * two states only combine when their shapes agree.
 */
struct AccumulatorState {
  uint64_t sample_count = 0;
  uint64_t missing_count = 0;

  double sum_fcst = 0.0;
  double sum_obs = 0.0;
  double sum_abs_error = 0.0;
  double sum_error = 0.0; // fcst - obs
  double sum_squared_error = 0.0;
  // Pairs covered by the three second-moment sums. Lags sample_count only
  // for states upgraded from a schema that had no second moments.
  uint64_t moment_count = 0;
  double sum_fcst_squared = 0.0;
  double sum_obs_squared = 0.0;
  double sum_fcst_obs = 0.0;

  std::vector<ContingencyCounts> contingency;
  std::vector<ProbabilityBinStats> probability_bins;
  double sum_squared_prob_error = 0.0;

  static AccumulatorState identity(size_t threshold_count, size_t bin_count);

  bool same_shape(const AccumulatorState &other) const {
    return contingency.size() == other.contingency.size() &&
           probability_bins.size() == other.probability_bins.size();
  }

  // Field-wise addition. Throws core::IncompatibleAccumulatorError when the
  // shapes differ.
  AccumulatorState &combine(const AccumulatorState &other);

  // Pairs that went into the probabilistic block
  uint64_t probability_sample_count() const;
  uint64_t observed_event_count() const;

  bool operator==(const AccumulatorState &other) const;
  bool operator!=(const AccumulatorState &other) const {
    return !(*this == other);
  }

  void serialize(core::BinarySerializer &out) const;
  static AccumulatorState deserialize(core::BinaryDeserializer &in);
};

AccumulatorState combine(AccumulatorState lhs, const AccumulatorState &rhs);

} // namespace accumulation

#endif // ACCUMULATOR_STATE_HPP
