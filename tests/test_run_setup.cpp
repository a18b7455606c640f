#include "core/errors.hpp"
#include "workflow/run_setup.hpp"
#include <gtest/gtest.h>

using namespace workflow;
using accumulation::AccumulatorConfig;
using accumulation::EntityKey;

class RunSetupTest : public ::testing::Test {
protected:
  void SetUp() override {
    app.worker_threads = 6;
    app.checkpoint_interval_chunks = 40;
    app.checkpoint_path = "state/run.ckpt";
    app.checkpoint_file_magic = 0x12345678u;

    Config::VariableConfig t2m;
    t2m.thresholds = {273.15, 283.15};
    t2m.missing_value = -9999.0;
    app.variables["t2m"] = t2m;

    Config::VariableConfig precip;
    precip.thresholds = {1.0};
    precip.probability_bin_edges = {0.0, 0.5, 1.0};
    precip.event_threshold = 1.0;
    precip.probability_policy = "clip";
    app.variables["precip"] = precip;
  }

  Config::AppConfig app;
};

TEST_F(RunSetupTest, RunnerOptionsFollowConfig) {
  auto options = make_runner_options(app);
  EXPECT_EQ(options.worker_threads, 6u);
  EXPECT_EQ(options.checkpoint_interval_chunks, 40u);

  app.checkpoint_enabled = false;
  EXPECT_EQ(make_runner_options(app).checkpoint_interval_chunks, 0u);
}

TEST_F(RunSetupTest, CheckpointStoreOnlyWhenEnabled) {
  auto store = make_checkpoint_store(app);
  ASSERT_NE(store, nullptr);
  EXPECT_EQ(store->path(), "state/run.ckpt");

  app.checkpoint_enabled = false;
  EXPECT_EQ(make_checkpoint_store(app), nullptr);
}

TEST_F(RunSetupTest, VariableConfigsFromSections) {
  auto configs = make_variable_configs(app);
  ASSERT_EQ(configs.size(), 2u);
  EXPECT_EQ(configs.at("t2m")->threshold_count(), 2u);
  EXPECT_EQ(configs.at("precip")->bin_count(), 2u);
  EXPECT_EQ(configs.at("precip")->probability_policy(),
            accumulation::ProbabilityPolicy::CLIP);

  app.variables["bad"].probability_policy = "round";
  EXPECT_THROW(make_variable_configs(app), core::ConfigurationError);
}

TEST_F(RunSetupTest, ConfiguredRunnerProcessesChunks) {
  auto index = std::make_shared<routing::StaticSpatialIndex>();
  index->set_location({0, 0}, {40.0, -105.0});
  index->set_location({1, 0}, {40.0, -104.0});
  auto router = std::make_shared<routing::ChunkRouter>(index);

  app.checkpoint_enabled = false;
  app.worker_threads = 2;
  ParallelRunner runner(router, make_variable_configs(app),
                        make_runner_options(app), nullptr);
  runner.start();

  GridChunk chunk;
  chunk.chunk_id = "c0";
  chunk.variable = "t2m";
  chunk.range = routing::GridRange{0, 2, 0, 1};
  chunk.n_times = 1;
  chunk.forecast = {280.0, 275.0};
  chunk.observation = {281.0, -9999.0};
  EXPECT_TRUE(runner.submit(chunk));
  auto result = runner.finish();

  EXPECT_EQ(runner.stats().processed, 1u);
  EXPECT_EQ(runner.stats().samples_accepted, 1u);
  EXPECT_EQ(result.size(), 2u);
}

TEST_F(RunSetupTest, SummaryFlagsChangedAndUnknownVariables) {
  auto configs = make_variable_configs(app);

  storage::CheckpointRecord record;
  record.accumulators.get_or_create(EntityKey::gridpoint(0, 0, 40.0, -105.0),
                                    "t2m", configs.at("t2m"));
  record.accumulators.get_or_create(EntityKey::gridpoint(1, 0, 40.0, -104.0),
                                    "t2m", configs.at("t2m"));

  auto summary = summarize_checkpoint(record, configs);
  EXPECT_EQ(summary.accumulators_per_variable.at("t2m"), 2u);
  EXPECT_TRUE(summary.resumable());

  // Same values through another instance still match
  AccumulatorConfig::Options old_precip = configs.at("precip")->options();
  record.accumulators.get_or_create(EntityKey::gridpoint(0, 0, 40.0, -105.0),
                                    "precip",
                                    AccumulatorConfig::create(old_precip));
  EXPECT_TRUE(summarize_checkpoint(record, configs).resumable());

  old_precip.thresholds = {2.0};
  record.accumulators.get_or_create(EntityKey::gridpoint(1, 0, 40.0, -104.0),
                                    "precip",
                                    AccumulatorConfig::create(old_precip));
  AccumulatorConfig::Options wind;
  record.accumulators.get_or_create(EntityKey::gridpoint(0, 0, 40.0, -105.0),
                                    "wind10m", AccumulatorConfig::create(wind));

  summary = summarize_checkpoint(record, configs);
  EXPECT_FALSE(summary.resumable());
  EXPECT_EQ(summary.changed_variables, std::set<std::string>{"precip"});
  EXPECT_EQ(summary.unconfigured_variables, std::set<std::string>{"wind10m"});
  EXPECT_EQ(summary.accumulators_per_variable.at("precip"), 2u);
}
