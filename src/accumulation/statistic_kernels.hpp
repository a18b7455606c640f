#ifndef STATISTIC_KERNELS_HPP
#define STATISTIC_KERNELS_HPP

#include "accumulator_config.hpp"
#include "accumulator_state.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace accumulation {
namespace kernels {

// Finite, not the missing sentinel, and inside the valid range if one is set
bool is_valid_value(double value, const AccumulatorConfig &config);

inline bool is_event(double value, double threshold) {
  return value >= threshold;
}

struct ContinuousDelta {
  double fcst = 0.0;
  double obs = 0.0;
  double abs_error = 0.0;
  double error = 0.0;
  double squared_error = 0.0;
  double fcst_squared = 0.0;
  double obs_squared = 0.0;
  double fcst_obs = 0.0;
};

ContinuousDelta continuous_delta(double fcst, double obs);

// Exactly one of the four counters is 1
ContingencyCounts categorical_delta(double fcst, double obs, double threshold);

// std::nullopt when the probability is NaN, or outside [0, 1] under REJECT
std::optional<double> normalize_probability(double probability,
                                            ProbabilityPolicy policy);

// Index of the bin holding `probability`. Bins are [edge_k, edge_k+1) with
// the last one closed on the right. Values below the first edge or above the
// last land in the end bins; std::nullopt only without at least two edges.
std::optional<size_t> probability_bin_index(double probability,
                                            const std::vector<double> &edges);

struct ProbabilisticDelta {
  size_t bin = 0;
  double probability = 0.0;
  bool observed_event = false;
  double squared_error = 0.0;
};

std::optional<ProbabilisticDelta>
probabilistic_delta(double probability, double obs, double event_threshold,
                    const std::vector<double> &edges);

struct BatchCounts {
  size_t accepted = 0;
  size_t rejected = 0;
};

/**
 * Folds a batch of pairs into `delta`, which must have the shape of
 * `config`. `probabilities` is either null or points at `count` values.
 * A pair is rejected (missing_count only) when either value is invalid or
 * its probability cannot be normalized or binned.
 */
BatchCounts accumulate_batch(const double *forecasts, const double *observations,
                             const double *probabilities, size_t count,
                             const AccumulatorConfig &config,
                             AccumulatorState &delta);

} // namespace kernels
} // namespace accumulation

#endif // STATISTIC_KERNELS_HPP
