#include "statistic_kernels.hpp"

#include <algorithm>
#include <cmath>

namespace accumulation {
namespace kernels {

bool is_valid_value(double value, const AccumulatorConfig &config) {
  if (!std::isfinite(value))
    return false;
  if (config.missing_value() && value == *config.missing_value())
    return false;
  if (config.valid_min() && value < *config.valid_min())
    return false;
  if (config.valid_max() && value > *config.valid_max())
    return false;
  return true;
}

ContinuousDelta continuous_delta(double fcst, double obs) {
  ContinuousDelta delta;
  const double error = fcst - obs;
  delta.fcst = fcst;
  delta.obs = obs;
  delta.abs_error = std::fabs(error);
  delta.error = error;
  delta.squared_error = error * error;
  delta.fcst_squared = fcst * fcst;
  delta.obs_squared = obs * obs;
  delta.fcst_obs = fcst * obs;
  return delta;
}

ContingencyCounts categorical_delta(double fcst, double obs, double threshold) {
  ContingencyCounts counts;
  const bool fcst_event = is_event(fcst, threshold);
  const bool obs_event = is_event(obs, threshold);
  if (fcst_event && obs_event)
    counts.hits = 1;
  else if (!fcst_event && obs_event)
    counts.misses = 1;
  else if (fcst_event && !obs_event)
    counts.false_alarms = 1;
  else
    counts.correct_negatives = 1;
  return counts;
}

std::optional<double> normalize_probability(double probability,
                                            ProbabilityPolicy policy) {
  if (std::isnan(probability))
    return std::nullopt;
  if (probability >= 0.0 && probability <= 1.0)
    return probability;
  if (policy == ProbabilityPolicy::CLIP)
    return std::clamp(probability, 0.0, 1.0);
  return std::nullopt;
}

std::optional<size_t> probability_bin_index(double probability,
                                            const std::vector<double> &edges) {
  if (edges.size() < 2)
    return std::nullopt;
  // Probabilities outside partial edges fall into the nearest end bin
  if (probability < edges.front())
    return 0;
  if (probability >= edges.back())
    return edges.size() - 2;

  // first edge strictly greater than p closes p's bin
  auto upper = std::upper_bound(edges.begin(), edges.end(), probability);
  return static_cast<size_t>(upper - edges.begin()) - 1;
}

std::optional<ProbabilisticDelta>
probabilistic_delta(double probability, double obs, double event_threshold,
                    const std::vector<double> &edges) {
  auto bin = probability_bin_index(probability, edges);
  if (!bin)
    return std::nullopt;

  ProbabilisticDelta delta;
  delta.bin = *bin;
  delta.probability = probability;
  delta.observed_event = is_event(obs, event_threshold);
  const double outcome = delta.observed_event ? 1.0 : 0.0;
  delta.squared_error = (probability - outcome) * (probability - outcome);
  return delta;
}

BatchCounts accumulate_batch(const double *forecasts, const double *observations,
                             const double *probabilities, size_t count,
                             const AccumulatorConfig &config,
                             AccumulatorState &delta) {
  BatchCounts result;
  const auto &thresholds = config.thresholds();
  const auto &edges = config.probability_bin_edges();
  const double event_threshold = config.event_threshold().value_or(0.0);

  for (size_t n = 0; n < count; ++n) {
    const double fcst = forecasts[n];
    const double obs = observations[n];

    if (!is_valid_value(fcst, config) || !is_valid_value(obs, config)) {
      ++delta.missing_count;
      ++result.rejected;
      continue;
    }

    std::optional<ProbabilisticDelta> prob_delta;
    if (probabilities) {
      auto probability =
          normalize_probability(probabilities[n], config.probability_policy());
      if (probability)
        prob_delta =
            probabilistic_delta(*probability, obs, event_threshold, edges);
      if (!prob_delta) {
        ++delta.missing_count;
        ++result.rejected;
        continue;
      }
    }

    const ContinuousDelta c = continuous_delta(fcst, obs);
    delta.sum_fcst += c.fcst;
    delta.sum_obs += c.obs;
    delta.sum_abs_error += c.abs_error;
    delta.sum_error += c.error;
    delta.sum_squared_error += c.squared_error;
    ++delta.moment_count;
    delta.sum_fcst_squared += c.fcst_squared;
    delta.sum_obs_squared += c.obs_squared;
    delta.sum_fcst_obs += c.fcst_obs;

    for (size_t t = 0; t < thresholds.size(); ++t)
      delta.contingency[t] += categorical_delta(fcst, obs, thresholds[t]);

    if (prob_delta) {
      auto &bin = delta.probability_bins[prob_delta->bin];
      bin.forecast_prob_sum += prob_delta->probability;
      bin.bin_sample_count += 1;
      if (prob_delta->observed_event)
        bin.observed_event_count += 1;
      delta.sum_squared_prob_error += prob_delta->squared_error;
    }

    ++delta.sample_count;
    ++result.accepted;
  }

  return result;
}

} // namespace kernels
} // namespace accumulation
