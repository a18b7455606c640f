#ifndef VERIFICATION_METRICS_HPP
#define VERIFICATION_METRICS_HPP

#include "accumulation/accumulator_config.hpp"
#include "accumulation/accumulator_state.hpp"
#include "accumulation/entity_key.hpp"
#include "core/config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace metrics {

// std::nullopt marks an undefined metric (zero denominator, no data). It is
// never reported as zero.
using MetricValue = std::optional<double>;

MetricValue safe_ratio(double numerator, double denominator);

struct ContinuousMetrics {
  MetricValue mae;
  MetricValue bias;
  MetricValue rmse;
  MetricValue bias_ratio;
  MetricValue mean_fcst;
  MetricValue mean_obs;
  MetricValue fcst_stddev;
  MetricValue obs_stddev;
  MetricValue correlation;
};

struct CategoricalMetrics {
  double threshold = 0.0;
  accumulation::ContingencyCounts counts;
  MetricValue hit_rate;               // POD
  MetricValue false_alarm_ratio;      // FAR
  MetricValue critical_success_index; // CSI
  MetricValue frequency_bias;
  MetricValue false_alarm_rate; // POFD
};

struct ReliabilityPoint {
  double bin_lower = 0.0;
  double bin_upper = 0.0;
  uint64_t sample_count = 0;
  MetricValue mean_forecast_prob;
  MetricValue observed_frequency;
};

// Forecasting "yes" whenever the probability reaches probability_threshold
struct RocPoint {
  double probability_threshold = 0.0;
  MetricValue hit_rate;
  MetricValue false_alarm_rate;
};

struct ProbabilisticMetrics {
  double event_threshold = 0.0;
  uint64_t sample_count = 0;
  MetricValue base_rate;
  MetricValue brier_score;
  MetricValue brier_skill_score;
  // CRPS needs ensemble or full distribution input which the accumulated
  // state does not carry. The slot is always undefined.
  MetricValue crps;
  std::vector<ReliabilityPoint> reliability;
  std::vector<RocPoint> roc;
};

// Outcome of the minimum sample count check for one report
struct Completeness {
  uint64_t min_samples = 0;
  bool sufficient = true;
};

/**
 * Everything reported for one (entity, variable) key: derived metrics plus
 * the raw sufficient statistics they came from.
 */
struct MetricsReport {
  accumulation::EntityKey entity;
  std::string variable;
  uint64_t sample_count = 0;
  uint64_t missing_count = 0;
  ContinuousMetrics continuous;
  std::vector<CategoricalMetrics> categorical;
  std::optional<ProbabilisticMetrics> probabilistic;
  // Unset until check_completeness has run over the report
  std::optional<Completeness> completeness;
  accumulation::AccumulatorState raw;
};

struct CompletenessSummary {
  size_t checked = 0;
  size_t insufficient = 0;
  // Sample counts among the insufficient reports
  std::optional<uint64_t> min_samples_found;
  std::optional<uint64_t> max_samples_found;
};

ContinuousMetrics derive_continuous(const accumulation::AccumulatorState &state);

CategoricalMetrics derive_categorical(double threshold,
                                      const accumulation::ContingencyCounts &c);

// std::nullopt when the configuration has no probability bins
std::optional<ProbabilisticMetrics>
derive_probabilistic(const accumulation::AccumulatorState &state,
                     const accumulation::AccumulatorConfig &config);

MetricsReport derive_report(const accumulation::EntityKey &entity,
                            const std::string &variable,
                            const accumulation::AccumulatorState &state,
                            const accumulation::AccumulatorConfig &config);

uint64_t min_samples_for(accumulation::EntityKind kind,
                         const Config::CompletenessConfig &config);

// Flags every report whose sample count is below the minimum for its entity
// kind. Metrics are still reported for insufficient entities.
CompletenessSummary
check_completeness(std::vector<MetricsReport> &reports,
                   const Config::CompletenessConfig &config);

} // namespace metrics

#endif // VERIFICATION_METRICS_HPP
