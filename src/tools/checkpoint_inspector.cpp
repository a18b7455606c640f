#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "metrics/verification_metrics.hpp"
#include "storage/checkpoint_store.hpp"
#include "utils/json_formatter.hpp"
#include "workflow/run_setup.hpp"

#include <iostream>
#include <optional>
#include <string>

// Loads a checkpoint, prints a summary and writes the metric reports of every
// accumulator it holds.
int main(int argc, char *argv[]) {
  std::cout << "Forecast Verification Checkpoint Inspector\n";
  std::cout << "==========================================\n\n";

  if (argc < 2 || argc > 3) {
    std::cout << "Usage: " << argv[0] << " <config_file> [checkpoint_file]\n";
    std::cout << "Example: " << argv[0]
              << " config/fcstverif.ini data/verification.ckpt\n";
    return 1;
  }

  Config::ConfigManager config_manager;
  if (!config_manager.load_configuration(argv[1])) {
    std::cout << "✗ Could not load configuration: " << argv[1] << "\n";
    return 1;
  }
  auto config = config_manager.get_config();
  LogManager::instance().configure(config->logging);

  std::string checkpoint_path =
      argc == 3 ? std::string(argv[2]) : config->checkpoint_path;
  std::cout << "Inspecting checkpoint: " << checkpoint_path << "\n\n";

  storage::CheckpointStore store(checkpoint_path,
                                 config->checkpoint_file_magic);
  std::optional<storage::CheckpointRecord> record;
  try {
    record = store.load();
  } catch (const core::CheckpointCorruptError &e) {
    std::cout << "✗ Checkpoint is corrupt: " << e.what() << "\n";
    return 2;
  }

  if (!record) {
    std::cout << "✗ No checkpoint found at " << checkpoint_path << "\n";
    return 1;
  }

  std::cout << "Schema version:    " << record->schema_version;
  if (record->source_schema_version != record->schema_version)
    std::cout << " (migrated from v" << record->source_schema_version << ")";
  std::cout << "\n";
  std::cout << "Sequence number:   " << record->sequence_number << "\n";
  std::cout << "Completed chunks:  " << record->completed_chunk_ids.size()
            << "\n";
  std::cout << "Accumulators:      " << record->accumulators.size() << "\n";

  workflow::VariableConfigs configs;
  try {
    configs = workflow::make_variable_configs(*config);
  } catch (const core::ConfigurationError &e) {
    std::cout << "✗ Invalid variable configuration: " << e.what() << "\n";
    return 1;
  }

  auto summary = workflow::summarize_checkpoint(*record, configs);
  for (const auto &[variable, count] : summary.accumulators_per_variable) {
    std::cout << "  - " << variable << ": " << count;
    if (summary.changed_variables.count(variable))
      std::cout << " (config changed)";
    else if (summary.unconfigured_variables.count(variable))
      std::cout << " (not configured)";
    std::cout << "\n";
  }
  std::cout << "Resumable:         " << (summary.resumable() ? "yes" : "no")
            << "\n";

  auto options = workflow::make_runner_options(*config);
  std::cout << "Workers:           " << options.worker_threads << "\n";
  std::cout << "Checkpoint every:  " << options.checkpoint_interval_chunks
            << " chunks\n\n";

  auto reports = record->accumulators.compute_all_metrics();
  auto completeness = metrics::check_completeness(reports, config->completeness);
  std::cout << "Insufficient:      " << completeness.insufficient << " of "
            << completeness.checked << " reports\n";
  if (!JsonFormatter::write_reports_file(reports, config->report_output_path)) {
    std::cout << "✗ Could not write reports to " << config->report_output_path
              << "\n";
    return 1;
  }

  std::cout << "✓ Wrote " << reports.size() << " reports to "
            << config->report_output_path << "\n";
  return 0;
}
