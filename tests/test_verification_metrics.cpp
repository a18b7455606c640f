#include "metrics/verification_metrics.hpp"
#include <cmath>
#include <gtest/gtest.h>

using namespace metrics;
using accumulation::AccumulatorConfig;
using accumulation::AccumulatorState;
using accumulation::ContingencyCounts;

namespace {

AccumulatorState continuous_state(const std::vector<double> &f,
                                  const std::vector<double> &o) {
  AccumulatorState s = AccumulatorState::identity(0, 0);
  for (size_t n = 0; n < f.size(); ++n) {
    const double e = f[n] - o[n];
    s.sum_fcst += f[n];
    s.sum_obs += o[n];
    s.sum_abs_error += std::fabs(e);
    s.sum_error += e;
    s.sum_squared_error += e * e;
    s.sum_fcst_squared += f[n] * f[n];
    s.sum_obs_squared += o[n] * o[n];
    s.sum_fcst_obs += f[n] * o[n];
  }
  s.sample_count = f.size();
  s.moment_count = f.size();
  return s;
}

} // namespace

TEST(VerificationMetricsTest, SafeRatio) {
  EXPECT_EQ(safe_ratio(1.0, 4.0), 0.25);
  EXPECT_FALSE(safe_ratio(1.0, 0.0).has_value());
  EXPECT_FALSE(safe_ratio(0.0, 0.0).has_value());
  EXPECT_FALSE(safe_ratio(1.0, NAN).has_value());
}

TEST(VerificationMetricsTest, PerfectForecast) {
  auto m = derive_continuous(continuous_state({1, 2, 3}, {1, 2, 3}));
  EXPECT_DOUBLE_EQ(*m.mae, 0.0);
  EXPECT_DOUBLE_EQ(*m.rmse, 0.0);
  EXPECT_DOUBLE_EQ(*m.bias_ratio, 1.0);
  EXPECT_NEAR(*m.correlation, 1.0, 1e-12);
  EXPECT_NEAR(*m.fcst_stddev, std::sqrt(2.0 / 3.0), 1e-12);
}

TEST(VerificationMetricsTest, AntiCorrelatedForecast) {
  auto m = derive_continuous(continuous_state({3, 2, 1}, {1, 2, 3}));
  EXPECT_NEAR(*m.correlation, -1.0, 1e-12);
  EXPECT_DOUBLE_EQ(*m.bias, 0.0);
}

TEST(VerificationMetricsTest, ConstantSeriesHasNoCorrelation) {
  auto m = derive_continuous(continuous_state({5, 5, 5}, {1, 2, 3}));
  ASSERT_TRUE(m.fcst_stddev.has_value());
  EXPECT_DOUBLE_EQ(*m.fcst_stddev, 0.0);
  EXPECT_FALSE(m.correlation.has_value());
}

TEST(VerificationMetricsTest, BiasRatioUndefinedForZeroMeanObs) {
  auto m = derive_continuous(continuous_state({1, 1}, {-1, 1}));
  EXPECT_FALSE(m.bias_ratio.has_value());
  EXPECT_DOUBLE_EQ(*m.mae, 1.0);
}

TEST(VerificationMetricsTest, MissingMomentsLeaveSpreadUndefined) {
  auto s = continuous_state({1, 2}, {2, 4});
  s.moment_count = 0;
  auto m = derive_continuous(s);
  EXPECT_TRUE(m.mae.has_value());
  EXPECT_FALSE(m.fcst_stddev.has_value());
  EXPECT_FALSE(m.obs_stddev.has_value());
  EXPECT_FALSE(m.correlation.has_value());
}

TEST(VerificationMetricsTest, CategoricalScores) {
  ContingencyCounts c;
  c.hits = 6;
  c.misses = 2;
  c.false_alarms = 3;
  c.correct_negatives = 9;
  auto m = derive_categorical(5.0, c);
  EXPECT_DOUBLE_EQ(m.threshold, 5.0);
  EXPECT_DOUBLE_EQ(*m.hit_rate, 0.75);
  EXPECT_DOUBLE_EQ(*m.false_alarm_ratio, 1.0 / 3.0);
  EXPECT_DOUBLE_EQ(*m.critical_success_index, 6.0 / 11.0);
  EXPECT_DOUBLE_EQ(*m.frequency_bias, 9.0 / 8.0);
  EXPECT_DOUBLE_EQ(*m.false_alarm_rate, 0.25);
}

TEST(VerificationMetricsTest, CategoricalWithoutEvents) {
  ContingencyCounts c;
  c.correct_negatives = 10;
  auto m = derive_categorical(5.0, c);
  EXPECT_FALSE(m.hit_rate.has_value());
  EXPECT_FALSE(m.false_alarm_ratio.has_value());
  EXPECT_FALSE(m.critical_success_index.has_value());
  EXPECT_FALSE(m.frequency_bias.has_value());
  EXPECT_DOUBLE_EQ(*m.false_alarm_rate, 0.0);
}

class ProbabilisticMetricsTest : public ::testing::Test {
protected:
  void SetUp() override {
    AccumulatorConfig::Options options;
    options.probability_bin_edges = {0.0, 0.5, 1.0};
    options.event_threshold = 1.0;
    config = AccumulatorConfig::create(options);

    state = AccumulatorState::identity(0, 2);
    // bin 0: p=0.2 twice, no events; bin 1: p=0.8 twice, one event
    state.probability_bins[0] = {0.4, 0, 2};
    state.probability_bins[1] = {1.6, 1, 2};
    state.sum_squared_prob_error = 0.04 + 0.04 + 0.04 + 0.64;
  }

  accumulation::AccumulatorConfigPtr config;
  AccumulatorState state;
};

TEST_F(ProbabilisticMetricsTest, BrierAndSkill) {
  auto m = derive_probabilistic(state, *config);
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->sample_count, 4u);
  EXPECT_DOUBLE_EQ(*m->base_rate, 0.25);
  EXPECT_NEAR(*m->brier_score, 0.19, 1e-12);
  EXPECT_NEAR(*m->brier_skill_score, 1.0 - 0.19 / 0.1875, 1e-12);
  EXPECT_FALSE(m->crps.has_value());
}

TEST_F(ProbabilisticMetricsTest, ReliabilityAndRoc) {
  auto m = derive_probabilistic(state, *config);
  ASSERT_TRUE(m.has_value());
  ASSERT_EQ(m->reliability.size(), 2u);
  EXPECT_DOUBLE_EQ(m->reliability[1].bin_lower, 0.5);
  EXPECT_DOUBLE_EQ(*m->reliability[1].mean_forecast_prob, 0.8);
  EXPECT_DOUBLE_EQ(*m->reliability[1].observed_frequency, 0.5);
  EXPECT_DOUBLE_EQ(*m->reliability[0].observed_frequency, 0.0);

  ASSERT_EQ(m->roc.size(), 2u);
  // Forecasting yes at p >= 0 always fires
  EXPECT_DOUBLE_EQ(*m->roc[0].hit_rate, 1.0);
  EXPECT_DOUBLE_EQ(*m->roc[0].false_alarm_rate, 1.0);
  EXPECT_DOUBLE_EQ(m->roc[1].probability_threshold, 0.5);
  EXPECT_DOUBLE_EQ(*m->roc[1].hit_rate, 1.0);
  EXPECT_DOUBLE_EQ(*m->roc[1].false_alarm_rate, 1.0 / 3.0);
}

TEST_F(ProbabilisticMetricsTest, NoEventsLeavesSkillUndefined) {
  state.probability_bins[1].observed_event_count = 0;
  auto m = derive_probabilistic(state, *config);
  ASSERT_TRUE(m.has_value());
  EXPECT_DOUBLE_EQ(*m->base_rate, 0.0);
  EXPECT_FALSE(m->brier_skill_score.has_value());
  EXPECT_FALSE(m->roc[0].hit_rate.has_value());
}

TEST_F(ProbabilisticMetricsTest, EmptyStateIsUndefined) {
  auto m = derive_probabilistic(AccumulatorState::identity(0, 2), *config);
  ASSERT_TRUE(m.has_value());
  EXPECT_FALSE(m->brier_score.has_value());
  EXPECT_FALSE(m->base_rate.has_value());
  EXPECT_FALSE(m->reliability[0].mean_forecast_prob.has_value());
}

TEST_F(ProbabilisticMetricsTest, NoBinsNoProbabilisticBlock) {
  AccumulatorConfig::Options options;
  options.thresholds = {1.0};
  auto plain = AccumulatorConfig::create(options);
  EXPECT_FALSE(derive_probabilistic(AccumulatorState::identity(1, 0), *plain)
                   .has_value());
}

TEST_F(ProbabilisticMetricsTest, ReportCarriesRawState) {
  auto entity = accumulation::EntityKey::gridpoint(1, 2, 3.0, 4.0);
  auto report = derive_report(entity, "precip", state, *config);
  EXPECT_EQ(report.variable, "precip");
  EXPECT_EQ(report.raw, state);
  EXPECT_TRUE(report.categorical.empty());
  EXPECT_TRUE(report.probabilistic.has_value());
}

TEST(VerificationMetricsTest, CompletenessFlagsSmallSamples) {
  using accumulation::EntityKey;
  auto config = AccumulatorConfig::create({});

  auto report_for = [&](const EntityKey &entity, uint64_t samples) {
    AccumulatorState state = AccumulatorState::identity(0, 0);
    state.sample_count = samples;
    return derive_report(entity, "t2m", state, *config);
  };

  std::vector<MetricsReport> reports = {
      report_for(EntityKey::gridpoint(0, 0, 40.0, -105.0), 3),
      report_for(EntityKey::gridpoint(1, 0, 40.0, -104.0), 5),
      report_for(EntityKey::region({"CWA", "BOU", "Boulder"}), 49),
      report_for(EntityKey::station("KDEN", "Denver", 39.85, -104.66), 12)};
  EXPECT_FALSE(reports[0].completeness.has_value());

  Config::CompletenessConfig minimums;
  auto summary = check_completeness(reports, minimums);

  EXPECT_EQ(summary.checked, 4u);
  EXPECT_EQ(summary.insufficient, 2u);
  EXPECT_EQ(summary.min_samples_found, 3u);
  EXPECT_EQ(summary.max_samples_found, 49u);

  ASSERT_TRUE(reports[0].completeness.has_value());
  EXPECT_FALSE(reports[0].completeness->sufficient);
  EXPECT_EQ(reports[0].completeness->min_samples, 5u);
  // The minimum itself is enough
  EXPECT_TRUE(reports[1].completeness->sufficient);
  EXPECT_FALSE(reports[2].completeness->sufficient);
  EXPECT_EQ(reports[2].completeness->min_samples, 50u);
  EXPECT_TRUE(reports[3].completeness->sufficient);
  // Metrics stay available for insufficient entities
  EXPECT_EQ(reports[0].sample_count, 3u);

  minimums.gridpoint_min_samples = 0;
  minimums.region_min_samples = 0;
  EXPECT_EQ(check_completeness(reports, minimums).insufficient, 0u);
}
