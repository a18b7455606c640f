#ifndef RUN_SETUP_HPP
#define RUN_SETUP_HPP

#include "core/config.hpp"
#include "parallel_runner.hpp"
#include "storage/checkpoint_store.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace workflow {

// worker_threads and checkpoint_interval_chunks from the global keys.
// Periodic checkpoints are off when checkpoint_enabled is false.
RunnerOptions make_runner_options(const Config::AppConfig &config);

// One immutable accumulator config per [Variable:<NAME>] section. Throws
// core::ConfigurationError for a section that does not describe a valid
// accumulator.
VariableConfigs make_variable_configs(const Config::AppConfig &config);

// nullptr when checkpoint_enabled is false
std::unique_ptr<storage::CheckpointStore>
make_checkpoint_store(const Config::AppConfig &config);

struct CheckpointSummary {
  std::map<std::string, size_t> accumulators_per_variable;
  // Stored with another accumulator setup than configured now. A resumed
  // run would fail merging these.
  std::set<std::string> changed_variables;
  // Present in the checkpoint but without a [Variable:<NAME>] section
  std::set<std::string> unconfigured_variables;

  bool resumable() const {
    return changed_variables.empty() && unconfigured_variables.empty();
  }
};

// Compares a loaded checkpoint against the configured variables
CheckpointSummary summarize_checkpoint(const storage::CheckpointRecord &record,
                                       const VariableConfigs &configs);

} // namespace workflow

#endif // RUN_SETUP_HPP
