#include "run_setup.hpp"
#include "accumulation/accumulator_config.hpp"
#include "core/logger.hpp"

namespace workflow {

RunnerOptions make_runner_options(const Config::AppConfig &config) {
  RunnerOptions options;
  options.worker_threads = config.worker_threads;
  options.checkpoint_interval_chunks =
      config.checkpoint_enabled ? config.checkpoint_interval_chunks : 0;
  return options;
}

VariableConfigs make_variable_configs(const Config::AppConfig &config) {
  VariableConfigs configs;
  for (const auto &entry : config.variables) {
    configs[entry.first] = accumulation::make_accumulator_config(entry.second);
    LOG(LogLevel::DEBUG, LogComponent::CONFIG,
        "Variable " << entry.first << ": "
                    << configs[entry.first]->describe());
  }
  return configs;
}

std::unique_ptr<storage::CheckpointStore>
make_checkpoint_store(const Config::AppConfig &config) {
  if (!config.checkpoint_enabled)
    return nullptr;
  return std::make_unique<storage::CheckpointStore>(
      config.checkpoint_path, config.checkpoint_file_magic);
}

CheckpointSummary summarize_checkpoint(const storage::CheckpointRecord &record,
                                       const VariableConfigs &configs) {
  CheckpointSummary summary;
  for (const auto &entry : record.accumulators) {
    const auto &accumulator = entry.second;
    const std::string &variable = accumulator.variable();
    ++summary.accumulators_per_variable[variable];

    auto it = configs.find(variable);
    if (it == configs.end())
      summary.unconfigured_variables.insert(variable);
    else if (!accumulation::same_config(it->second, accumulator.config()))
      summary.changed_variables.insert(variable);
  }

  for (const auto &variable : summary.changed_variables) {
    LOG(LogLevel::WARN, LogComponent::WORKFLOW,
        "Checkpoint setup of variable " << variable
                                        << " differs from the configuration");
  }
  return summary;
}

} // namespace workflow
