#include "accumulation/statistic_kernels.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <vector>

using namespace accumulation;

class StatisticKernelsTest : public ::testing::Test {
protected:
  AccumulatorConfigPtr make_config(ProbabilityPolicy policy) {
    AccumulatorConfig::Options options;
    options.thresholds = {1.0, 5.0};
    options.probability_bin_edges = {0.0, 0.5, 1.0};
    options.event_threshold = 1.0;
    options.missing_value = -9999.0;
    options.valid_min = -100.0;
    options.valid_max = 100.0;
    options.probability_policy = policy;
    return AccumulatorConfig::create(options);
  }
};

TEST_F(StatisticKernelsTest, ValidValueQualityControl) {
  auto config = make_config(ProbabilityPolicy::REJECT);
  EXPECT_TRUE(kernels::is_valid_value(12.5, *config));
  EXPECT_TRUE(kernels::is_valid_value(100.0, *config));
  EXPECT_FALSE(kernels::is_valid_value(-9999.0, *config));
  EXPECT_FALSE(kernels::is_valid_value(100.5, *config));
  EXPECT_FALSE(kernels::is_valid_value(-101.0, *config));
  EXPECT_FALSE(
      kernels::is_valid_value(std::numeric_limits<double>::quiet_NaN(), *config));
  EXPECT_FALSE(
      kernels::is_valid_value(std::numeric_limits<double>::infinity(), *config));
}

TEST_F(StatisticKernelsTest, EventIsInclusiveOfThreshold) {
  EXPECT_TRUE(kernels::is_event(1.0, 1.0));
  EXPECT_FALSE(kernels::is_event(0.999, 1.0));
}

TEST_F(StatisticKernelsTest, ContinuousDelta) {
  auto d = kernels::continuous_delta(3.0, 5.0);
  EXPECT_DOUBLE_EQ(d.error, -2.0);
  EXPECT_DOUBLE_EQ(d.abs_error, 2.0);
  EXPECT_DOUBLE_EQ(d.squared_error, 4.0);
  EXPECT_DOUBLE_EQ(d.fcst_obs, 15.0);
  EXPECT_DOUBLE_EQ(d.obs_squared, 25.0);
}

TEST_F(StatisticKernelsTest, CategoricalDeltaQuadrants) {
  auto hit = kernels::categorical_delta(3.0, 2.0, 2.0);
  EXPECT_EQ(hit.hits, 1u);
  EXPECT_EQ(hit.total(), 1u);

  EXPECT_EQ(kernels::categorical_delta(1.0, 3.0, 2.0).misses, 1u);
  EXPECT_EQ(kernels::categorical_delta(3.0, 1.0, 2.0).false_alarms, 1u);
  EXPECT_EQ(kernels::categorical_delta(1.0, 1.5, 2.0).correct_negatives, 1u);
}

TEST_F(StatisticKernelsTest, NormalizeProbability) {
  EXPECT_EQ(kernels::normalize_probability(0.3, ProbabilityPolicy::REJECT), 0.3);
  EXPECT_FALSE(
      kernels::normalize_probability(1.2, ProbabilityPolicy::REJECT).has_value());
  EXPECT_EQ(kernels::normalize_probability(1.2, ProbabilityPolicy::CLIP), 1.0);
  EXPECT_EQ(kernels::normalize_probability(-0.1, ProbabilityPolicy::CLIP), 0.0);
  EXPECT_FALSE(kernels::normalize_probability(
                   std::numeric_limits<double>::quiet_NaN(),
                   ProbabilityPolicy::CLIP)
                   .has_value());
}

TEST_F(StatisticKernelsTest, ProbabilityBinIndex) {
  std::vector<double> edges = {0.0, 0.25, 0.5, 1.0};
  EXPECT_EQ(kernels::probability_bin_index(0.0, edges), 0u);
  EXPECT_EQ(kernels::probability_bin_index(0.1, edges), 0u);
  // Interior edges belong to the upper bin
  EXPECT_EQ(kernels::probability_bin_index(0.25, edges), 1u);
  EXPECT_EQ(kernels::probability_bin_index(0.75, edges), 2u);
  // Last bin is closed on the right
  EXPECT_EQ(kernels::probability_bin_index(1.0, edges), 2u);

  // Edges that do not span [0, 1] clamp into the end bins
  std::vector<double> partial = {0.2, 0.5, 0.8};
  EXPECT_EQ(kernels::probability_bin_index(0.1, partial), 0u);
  EXPECT_EQ(kernels::probability_bin_index(0.9, partial), 1u);

  EXPECT_FALSE(kernels::probability_bin_index(0.5, {}).has_value());
}

TEST_F(StatisticKernelsTest, ProbabilisticDelta) {
  std::vector<double> edges = {0.0, 0.5, 1.0};
  auto d = kernels::probabilistic_delta(0.8, 2.0, 1.0, edges);
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->bin, 1u);
  EXPECT_TRUE(d->observed_event);
  EXPECT_NEAR(d->squared_error, 0.04, 1e-12);

  auto no_event = kernels::probabilistic_delta(0.2, 0.5, 1.0, edges);
  ASSERT_TRUE(no_event.has_value());
  EXPECT_FALSE(no_event->observed_event);
  EXPECT_NEAR(no_event->squared_error, 0.04, 1e-12);
}

TEST_F(StatisticKernelsTest, BatchSkipsInvalidPairs) {
  auto config = make_config(ProbabilityPolicy::REJECT);
  auto delta = AccumulatorState::identity(config->threshold_count(),
                                          config->bin_count());

  std::vector<double> f = {2.0, -9999.0, 3.0, std::nan("")};
  std::vector<double> o = {1.0, 4.0, 7.0, 1.0};
  auto counts = kernels::accumulate_batch(f.data(), o.data(), nullptr, f.size(),
                                          *config, delta);

  EXPECT_EQ(counts.accepted, 2u);
  EXPECT_EQ(counts.rejected, 2u);
  EXPECT_EQ(delta.sample_count, 2u);
  EXPECT_EQ(delta.missing_count, 2u);
  EXPECT_EQ(delta.moment_count, 2u);
  EXPECT_DOUBLE_EQ(delta.sum_abs_error, 5.0);
  EXPECT_DOUBLE_EQ(delta.sum_error, -3.0);
  // threshold 5: (2,1) correct negative, (3,7) miss
  EXPECT_EQ(delta.contingency[1].misses, 1u);
  EXPECT_EQ(delta.contingency[1].correct_negatives, 1u);
  EXPECT_EQ(delta.probability_sample_count(), 0u);
}

TEST_F(StatisticKernelsTest, RejectPolicyDropsWholePair) {
  auto config = make_config(ProbabilityPolicy::REJECT);
  auto delta = AccumulatorState::identity(config->threshold_count(),
                                          config->bin_count());

  std::vector<double> f = {2.0, 2.0};
  std::vector<double> o = {1.0, 1.0};
  std::vector<double> p = {0.7, 1.5};
  auto counts = kernels::accumulate_batch(f.data(), o.data(), p.data(),
                                          f.size(), *config, delta);

  EXPECT_EQ(counts.accepted, 1u);
  EXPECT_EQ(counts.rejected, 1u);
  EXPECT_EQ(delta.sample_count, 1u);
  EXPECT_EQ(delta.probability_sample_count(), 1u);
  EXPECT_EQ(delta.probability_bins[1].bin_sample_count, 1u);
  EXPECT_EQ(delta.probability_bins[1].observed_event_count, 1u);
}

TEST_F(StatisticKernelsTest, ClipPolicyKeepsPair) {
  auto config = make_config(ProbabilityPolicy::CLIP);
  auto delta = AccumulatorState::identity(config->threshold_count(),
                                          config->bin_count());

  std::vector<double> f = {2.0};
  std::vector<double> o = {0.0};
  std::vector<double> p = {1.5};
  auto counts = kernels::accumulate_batch(f.data(), o.data(), p.data(),
                                          f.size(), *config, delta);

  EXPECT_EQ(counts.accepted, 1u);
  EXPECT_DOUBLE_EQ(delta.probability_bins[1].forecast_prob_sum, 1.0);
  EXPECT_DOUBLE_EQ(delta.sum_squared_prob_error, 1.0);
}

TEST_F(StatisticKernelsTest, PartialBinEdgesKeepEveryPair) {
  AccumulatorConfig::Options options;
  options.probability_bin_edges = {0.2, 0.5, 0.8};
  options.event_threshold = 1.0;
  options.probability_policy = ProbabilityPolicy::CLIP;
  auto config = AccumulatorConfig::create(options);
  auto delta = AccumulatorState::identity(config->threshold_count(),
                                          config->bin_count());

  std::vector<double> f = {2.0, 0.0, 1.0};
  std::vector<double> o = {2.0, 0.0, 1.0};
  std::vector<double> p = {0.9, 0.1, 0.5};
  auto counts = kernels::accumulate_batch(f.data(), o.data(), p.data(),
                                          f.size(), *config, delta);

  EXPECT_EQ(counts.accepted, 3u);
  EXPECT_EQ(counts.rejected, 0u);
  EXPECT_EQ(delta.sample_count, 3u);
  EXPECT_EQ(delta.missing_count, 0u);
  EXPECT_EQ(delta.probability_bins[0].bin_sample_count, 1u);
  EXPECT_EQ(delta.probability_bins[1].bin_sample_count, 2u);
  EXPECT_EQ(delta.probability_bins[1].observed_event_count, 2u);
}
