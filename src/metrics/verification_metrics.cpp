#include "verification_metrics.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace metrics {

namespace {
constexpr double MIN_MEAN_OBS_MAGNITUDE = 1e-10;
// Relative variance below which a series is treated as constant
constexpr double CONSTANT_SERIES_TOLERANCE = 1e-12;

double population_variance(double sum, double sum_squared, double n) {
  const double mean = sum / n;
  const double variance = sum_squared / n - mean * mean;
  const double scale = std::max(1.0, sum_squared / n);
  if (variance <= CONSTANT_SERIES_TOLERANCE * scale)
    return 0.0;
  return variance;
}
} // namespace

MetricValue safe_ratio(double numerator, double denominator) {
  if (denominator == 0.0 || !std::isfinite(denominator))
    return std::nullopt;
  return numerator / denominator;
}

ContinuousMetrics derive_continuous(const accumulation::AccumulatorState &s) {
  ContinuousMetrics m;
  if (s.sample_count == 0)
    return m;

  const double n = static_cast<double>(s.sample_count);
  m.mae = s.sum_abs_error / n;
  m.bias = s.sum_error / n;
  m.rmse = std::sqrt(s.sum_squared_error / n);
  m.mean_fcst = s.sum_fcst / n;
  m.mean_obs = s.sum_obs / n;

  if (std::fabs(*m.mean_obs) >= MIN_MEAN_OBS_MAGNITUDE)
    m.bias_ratio = *m.mean_fcst / *m.mean_obs;

  if (s.moment_count != s.sample_count)
    return m;

  const double var_f = population_variance(s.sum_fcst, s.sum_fcst_squared, n);
  const double var_o = population_variance(s.sum_obs, s.sum_obs_squared, n);
  m.fcst_stddev = std::sqrt(var_f);
  m.obs_stddev = std::sqrt(var_o);

  if (var_f > 0.0 && var_o > 0.0) {
    const double covariance =
        s.sum_fcst_obs / n - (*m.mean_fcst) * (*m.mean_obs);
    double r = covariance / std::sqrt(var_f * var_o);
    m.correlation = std::clamp(r, -1.0, 1.0);
  }
  return m;
}

CategoricalMetrics derive_categorical(double threshold,
                                      const accumulation::ContingencyCounts &c) {
  CategoricalMetrics m;
  m.threshold = threshold;
  m.counts = c;

  const double hits = static_cast<double>(c.hits);
  const double misses = static_cast<double>(c.misses);
  const double false_alarms = static_cast<double>(c.false_alarms);
  const double correct_negatives = static_cast<double>(c.correct_negatives);

  m.hit_rate = safe_ratio(hits, hits + misses);
  m.false_alarm_ratio = safe_ratio(false_alarms, hits + false_alarms);
  m.critical_success_index = safe_ratio(hits, hits + misses + false_alarms);
  m.frequency_bias = safe_ratio(hits + false_alarms, hits + misses);
  m.false_alarm_rate =
      safe_ratio(false_alarms, false_alarms + correct_negatives);
  return m;
}

std::optional<ProbabilisticMetrics>
derive_probabilistic(const accumulation::AccumulatorState &s,
                     const accumulation::AccumulatorConfig &config) {
  if (!config.has_probability_bins())
    return std::nullopt;

  ProbabilisticMetrics m;
  m.event_threshold = config.event_threshold().value_or(0.0);
  m.sample_count = s.probability_sample_count();

  const auto &edges = config.probability_bin_edges();
  const double n = static_cast<double>(m.sample_count);
  const uint64_t events = s.observed_event_count();
  const uint64_t non_events = m.sample_count - events;

  if (m.sample_count > 0) {
    m.brier_score = s.sum_squared_prob_error / n;
    m.base_rate = static_cast<double>(events) / n;
    // Brier score of always forecasting the base rate
    const double reference = *m.base_rate * (1.0 - *m.base_rate);
    if (reference > 0.0)
      m.brier_skill_score = 1.0 - *m.brier_score / reference;
  }

  for (size_t b = 0; b < s.probability_bins.size(); ++b) {
    const auto &bin = s.probability_bins[b];
    ReliabilityPoint point;
    point.bin_lower = edges[b];
    point.bin_upper = edges[b + 1];
    point.sample_count = bin.bin_sample_count;
    const double count = static_cast<double>(bin.bin_sample_count);
    point.mean_forecast_prob = safe_ratio(bin.forecast_prob_sum, count);
    point.observed_frequency =
        safe_ratio(static_cast<double>(bin.observed_event_count), count);
    m.reliability.push_back(point);
  }

  // Walk thresholds from the highest bin down, accumulating the "yes" side
  std::vector<RocPoint> roc(s.probability_bins.size());
  uint64_t yes_events = 0;
  uint64_t yes_non_events = 0;
  for (size_t b = s.probability_bins.size(); b-- > 0;) {
    const auto &bin = s.probability_bins[b];
    yes_events += bin.observed_event_count;
    yes_non_events += bin.bin_sample_count - bin.observed_event_count;
    roc[b].probability_threshold = edges[b];
    roc[b].hit_rate = safe_ratio(static_cast<double>(yes_events),
                                 static_cast<double>(events));
    roc[b].false_alarm_rate = safe_ratio(static_cast<double>(yes_non_events),
                                         static_cast<double>(non_events));
  }
  m.roc = std::move(roc);

  return m;
}

MetricsReport derive_report(const accumulation::EntityKey &entity,
                            const std::string &variable,
                            const accumulation::AccumulatorState &state,
                            const accumulation::AccumulatorConfig &config) {
  MetricsReport report;
  report.entity = entity;
  report.variable = variable;
  report.sample_count = state.sample_count;
  report.missing_count = state.missing_count;
  report.continuous = derive_continuous(state);

  const auto &thresholds = config.thresholds();
  for (size_t t = 0; t < thresholds.size() && t < state.contingency.size();
       ++t) {
    report.categorical.push_back(
        derive_categorical(thresholds[t], state.contingency[t]));
  }

  report.probabilistic = derive_probabilistic(state, config);
  report.raw = state;
  return report;
}

uint64_t min_samples_for(accumulation::EntityKind kind,
                         const Config::CompletenessConfig &config) {
  switch (kind) {
  case accumulation::EntityKind::GRIDPOINT:
    return config.gridpoint_min_samples;
  case accumulation::EntityKind::REGION:
    return config.region_min_samples;
  case accumulation::EntityKind::STATION:
    return config.station_min_samples;
  }
  return 0;
}

CompletenessSummary
check_completeness(std::vector<MetricsReport> &reports,
                   const Config::CompletenessConfig &config) {
  CompletenessSummary summary;
  for (auto &report : reports) {
    Completeness completeness;
    completeness.min_samples = min_samples_for(report.entity.kind, config);
    completeness.sufficient = report.sample_count >= completeness.min_samples;
    report.completeness = completeness;
    ++summary.checked;

    if (completeness.sufficient)
      continue;
    ++summary.insufficient;
    summary.min_samples_found =
        std::min(summary.min_samples_found.value_or(report.sample_count),
                 report.sample_count);
    summary.max_samples_found =
        std::max(summary.max_samples_found.value_or(report.sample_count),
                 report.sample_count);
    LOG(LogLevel::DEBUG, LogComponent::METRICS,
        report.entity.to_string()
            << " " << report.variable << ": insufficient samples ("
            << report.sample_count << " < " << completeness.min_samples
            << ")");
  }

  if (summary.insufficient > 0) {
    LOG(LogLevel::WARN, LogComponent::METRICS,
        summary.insufficient << " of " << summary.checked
                             << " reports have insufficient samples");
  }
  return summary;
}

} // namespace metrics
