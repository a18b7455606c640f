#include "accumulation/accumulator.hpp"
#include "accumulation/accumulator_set.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <vector>

using namespace accumulation;

class AccumulatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    AccumulatorConfig::Options options;
    options.thresholds = {2.0};
    options.missing_value = -9999.0;
    config = AccumulatorConfig::create(options);

    AccumulatorConfig::Options prob_options;
    prob_options.probability_bin_edges = {0.0, 0.5, 1.0};
    prob_options.event_threshold = 1.0;
    prob_config = AccumulatorConfig::create(prob_options);
  }

  Accumulator make(const EntityKey &entity = EntityKey::gridpoint(3, 4, 40.0,
                                                                  -105.0)) {
    return Accumulator(entity, "t2m", config);
  }

  AccumulatorConfigPtr config;
  AccumulatorConfigPtr prob_config;
};

TEST_F(AccumulatorTest, ContinuousMetricsFromSmallBatch) {
  auto acc = make();
  auto result = acc.update({0.0, 1.0, 2.0, 3.0}, {0.0, 1.0, 1.0, 4.0});
  EXPECT_EQ(result.accepted, 4u);
  EXPECT_EQ(result.rejected, 0u);

  auto report = acc.compute_metrics();
  EXPECT_EQ(report.sample_count, 4u);
  ASSERT_TRUE(report.continuous.mae.has_value());
  EXPECT_DOUBLE_EQ(*report.continuous.mae, 0.5);
  // errors are fcst - obs: 0, 0, +1, -1
  EXPECT_DOUBLE_EQ(*report.continuous.bias, 0.0);
  EXPECT_DOUBLE_EQ(*report.continuous.rmse, std::sqrt(0.5));
}

TEST_F(AccumulatorTest, ContingencyTableAtThreshold) {
  auto acc = make();
  // correct negative, hit, false alarm, miss at threshold 2
  acc.update({1.0, 3.0, 3.0, 1.0}, {1.0, 3.0, 1.0, 3.0});

  auto report = acc.compute_metrics();
  ASSERT_EQ(report.categorical.size(), 1u);
  const auto &cat = report.categorical[0];
  EXPECT_EQ(cat.counts.hits, 1u);
  EXPECT_EQ(cat.counts.misses, 1u);
  EXPECT_EQ(cat.counts.false_alarms, 1u);
  EXPECT_EQ(cat.counts.correct_negatives, 1u);
  EXPECT_DOUBLE_EQ(*cat.hit_rate, 0.5);
  EXPECT_DOUBLE_EQ(*cat.false_alarm_ratio, 0.5);
  EXPECT_DOUBLE_EQ(*cat.critical_success_index, 1.0 / 3.0);
  EXPECT_DOUBLE_EQ(*cat.frequency_bias, 1.0);
  EXPECT_DOUBLE_EQ(*cat.false_alarm_rate, 0.5);
}

TEST_F(AccumulatorTest, MergeAddsSufficientStatistics) {
  auto a = make();
  a.update({2.0, 2.0, 2.0}, {0.0, 0.0, 0.0}); // n=3, sum |e| = 6
  auto b = make();
  b.update({2.0}, {0.0}); // n=1, sum |e| = 2

  a.merge(b);
  EXPECT_EQ(a.state().sample_count, 4u);
  EXPECT_DOUBLE_EQ(a.state().sum_abs_error, 8.0);
  EXPECT_DOUBLE_EQ(*a.compute_metrics().continuous.mae, 2.0);
  // b is untouched
  EXPECT_EQ(b.state().sample_count, 1u);
}

TEST_F(AccumulatorTest, MergedLeavesInputsUnchanged) {
  auto a = make();
  a.update({1.0}, {2.0});
  auto b = make();
  b.update({4.0}, {2.0});

  auto c = merged(a, b);
  EXPECT_EQ(c.state().sample_count, 2u);
  EXPECT_EQ(a.state().sample_count, 1u);
  EXPECT_DOUBLE_EQ(*c.compute_metrics().continuous.bias, 0.5);
}

TEST_F(AccumulatorTest, MissingValuesAreExcluded) {
  auto acc = make();
  auto result = acc.update({1.0, -9999.0, NAN, 2.0}, {1.0, 1.0, 1.0, -9999.0});
  EXPECT_EQ(result.accepted, 1u);
  EXPECT_EQ(result.rejected, 3u);

  auto report = acc.compute_metrics();
  EXPECT_EQ(report.sample_count, 1u);
  EXPECT_EQ(report.missing_count, 3u);
  EXPECT_DOUBLE_EQ(*report.continuous.mae, 0.0);
}

TEST_F(AccumulatorTest, ZeroSamplesGiveUndefinedMetrics) {
  auto acc = make();
  auto report = acc.compute_metrics();
  EXPECT_EQ(report.sample_count, 0u);
  EXPECT_FALSE(report.continuous.mae.has_value());
  EXPECT_FALSE(report.continuous.rmse.has_value());
  EXPECT_FALSE(report.continuous.correlation.has_value());
  ASSERT_EQ(report.categorical.size(), 1u);
  EXPECT_FALSE(report.categorical[0].hit_rate.has_value());
  EXPECT_FALSE(report.categorical[0].critical_success_index.has_value());
}

TEST_F(AccumulatorTest, EmptyBatchIsNoOp) {
  auto acc = make();
  auto before = acc.state();
  auto result = acc.update({}, {});
  EXPECT_EQ(result.accepted, 0u);
  EXPECT_EQ(acc.state(), before);
}

TEST_F(AccumulatorTest, ShapeMismatchLeavesStateUntouched) {
  auto acc = make();
  acc.update({1.0}, {1.0});
  auto before = acc.state();

  EXPECT_THROW(acc.update({1.0, 2.0}, {1.0}), core::ShapeMismatchError);
  EXPECT_EQ(acc.state(), before);
}

TEST_F(AccumulatorTest, ProbabilitiesWithoutBinsRejected) {
  auto acc = make();
  std::vector<double> p = {0.5};
  EXPECT_THROW(acc.update({1.0}, {1.0}, &p), core::ConfigurationError);
  EXPECT_EQ(acc.state().sample_count, 0u);
}

TEST_F(AccumulatorTest, ProbabilityLengthMismatch) {
  Accumulator acc(EntityKey::gridpoint(0, 0, 0.0, 0.0), "precip", prob_config);
  std::vector<double> p = {0.5, 0.1};
  EXPECT_THROW(acc.update({1.0}, {1.0}, &p), core::ShapeMismatchError);
}

TEST_F(AccumulatorTest, NullConfigOrEmptyVariableRejected) {
  EXPECT_THROW(Accumulator(EntityKey::gridpoint(0, 0, 0.0, 0.0), "t2m", nullptr),
               core::ConfigurationError);
  EXPECT_THROW(Accumulator(EntityKey::gridpoint(0, 0, 0.0, 0.0), "", config),
               core::ConfigurationError);
}

TEST_F(AccumulatorTest, MergeRejectsDifferentKeyOrConfig) {
  auto a = make();
  auto other_entity = make(EntityKey::gridpoint(5, 4, 40.0, -104.0));
  EXPECT_THROW(a.merge(other_entity), core::IncompatibleAccumulatorError);

  Accumulator other_variable(a.entity(), "precip", config);
  EXPECT_THROW(a.merge(other_variable), core::IncompatibleAccumulatorError);

  AccumulatorConfig::Options options;
  options.thresholds = {3.0};
  Accumulator other_config(a.entity(), "t2m",
                           AccumulatorConfig::create(options));
  EXPECT_FALSE(a.is_compatible_with(other_config));
  EXPECT_THROW(a.merge(other_config), core::IncompatibleAccumulatorError);
}

TEST_F(AccumulatorTest, EqualConfigsFromDifferentInstancesMerge) {
  AccumulatorConfig::Options options;
  options.thresholds = {2.0};
  options.missing_value = -9999.0;
  Accumulator twin(EntityKey::gridpoint(3, 4, 40.0, -105.0), "t2m",
                   AccumulatorConfig::create(options));
  twin.update({1.0}, {1.0});

  auto a = make();
  EXPECT_TRUE(a.is_compatible_with(twin));
  a.merge(twin);
  EXPECT_EQ(a.state().sample_count, 1u);
}

TEST_F(AccumulatorTest, RestoredStateMustMatchConfig) {
  auto wrong_shape = AccumulatorState::identity(3, 0);
  EXPECT_THROW(Accumulator(EntityKey::gridpoint(0, 0, 0.0, 0.0), "t2m", config,
                           wrong_shape),
               core::ConfigurationError);
}

TEST_F(AccumulatorTest, InvalidConfigOptionsRejected) {
  AccumulatorConfig::Options no_event;
  no_event.probability_bin_edges = {0.0, 1.0};
  EXPECT_THROW(AccumulatorConfig::create(no_event), core::ConfigurationError);

  AccumulatorConfig::Options bad_edges;
  bad_edges.probability_bin_edges = {0.0, 0.7, 0.3, 1.0};
  bad_edges.event_threshold = 1.0;
  EXPECT_THROW(AccumulatorConfig::create(bad_edges), core::ConfigurationError);

  AccumulatorConfig::Options single_edge;
  single_edge.probability_bin_edges = {0.5};
  single_edge.event_threshold = 1.0;
  EXPECT_THROW(AccumulatorConfig::create(single_edge), core::ConfigurationError);

  AccumulatorConfig::Options dup;
  dup.thresholds = {1.0, 1.0};
  EXPECT_THROW(AccumulatorConfig::create(dup), core::ConfigurationError);
}

TEST_F(AccumulatorTest, SetGetOrCreateRejectsConflictingConfig) {
  AccumulatorSet set;
  auto entity = EntityKey::gridpoint(1, 1, 0.0, 0.0);
  auto &acc = set.get_or_create(entity, "t2m", config);
  acc.update({1.0}, {2.0});
  EXPECT_EQ(&set.get_or_create(entity, "t2m", config), &acc);
  EXPECT_EQ(set.size(), 1u);

  EXPECT_THROW(set.get_or_create(entity, "t2m", prob_config),
               core::ConfigurationError);
}

TEST_F(AccumulatorTest, SetGetOrCreateRejectsConflictingEntityMetadata) {
  AccumulatorSet set;
  set.get_or_create(EntityKey::gridpoint(1, 1, 40.0, -105.0), "t2m", config);
  EXPECT_THROW(
      set.get_or_create(EntityKey::gridpoint(1, 1, 41.0, -105.0), "t2m", config),
      core::IncompatibleAccumulatorError);

  set.get_or_create(
      EntityKey::station("KDEN", "Denver", 39.85, -104.66, 1656.0, "ASOS"),
      "t2m", config);
  EXPECT_THROW(set.get_or_create(EntityKey::station("KDEN", "Denver Intl",
                                                    39.85, -104.66, 1656.0,
                                                    "ASOS"),
                                 "t2m", config),
               core::IncompatibleAccumulatorError);
  EXPECT_EQ(set.size(), 2u);
}

TEST_F(AccumulatorTest, SetInsertMergesSameKey) {
  AccumulatorSet set;
  auto a = make();
  a.update({1.0}, {1.0});
  auto b = make();
  b.update({2.0, 2.0}, {1.0, 1.0});

  set.insert(a);
  set.insert(b);
  ASSERT_EQ(set.size(), 1u);
  const auto *found = set.find(a.key());
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(found->state().sample_count, 3u);

  auto reports = set.compute_all_metrics();
  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].variable, "t2m");
}
