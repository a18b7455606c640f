#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *CHECKPOINT_ENABLED = "checkpoint_enabled";
constexpr const char *CHECKPOINT_PATH = "checkpoint_path";
constexpr const char *CHECKPOINT_INTERVAL_CHUNKS = "checkpoint_interval_chunks";
constexpr const char *CHECKPOINT_FILE_MAGIC = "checkpoint_file_magic";
constexpr const char *WORKER_THREADS = "worker_threads";
constexpr const char *REPORT_OUTPUT_PATH = "report_output_path";

// Variable Settings ([Variable:<NAME>] sections)
constexpr const char *VAR_THRESHOLDS = "thresholds";
constexpr const char *VAR_PROBABILITY_BIN_EDGES = "probability_bin_edges";
constexpr const char *VAR_EVENT_THRESHOLD = "event_threshold";
constexpr const char *VAR_MISSING_VALUE = "missing_value";
constexpr const char *VAR_VALID_MIN = "valid_min";
constexpr const char *VAR_VALID_MAX = "valid_max";
constexpr const char *VAR_PROBABILITY_POLICY = "probability_policy";

// Completeness Settings ([Completeness] section)
constexpr const char *GRIDPOINT_MIN_SAMPLES = "gridpoint_min_samples";
constexpr const char *REGION_MIN_SAMPLES = "region_min_samples";
constexpr const char *STATION_MIN_SAMPLES = "station_min_samples";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

constexpr const char *VARIABLE_SECTION_PREFIX = "Variable:";

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

// Per-variable verification setup, as written in the config file. Turned
// into an immutable accumulation::AccumulatorConfig before use.
struct VariableConfig {
  std::vector<double> thresholds;
  std::vector<double> probability_bin_edges;
  std::optional<double> event_threshold;
  std::optional<double> missing_value;
  std::optional<double> valid_min;
  std::optional<double> valid_max;
  std::string probability_policy = "reject";
};

// Sample counts below which a report is flagged as insufficient. 0 accepts
// any count.
struct CompletenessConfig {
  uint64_t gridpoint_min_samples = 5;
  uint64_t region_min_samples = 50;
  uint64_t station_min_samples = 10;
};

struct AppConfig {
  bool checkpoint_enabled = true;
  std::string checkpoint_path = "data/verification.ckpt";
  uint64_t checkpoint_interval_chunks = 100;
  uint32_t checkpoint_file_magic = 0xFCE57A7E;

  uint32_t worker_threads = 4;
  std::string report_output_path = "reports/metrics.json";

  std::map<std::string, VariableConfig> variables;
  CompletenessConfig completeness;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_variable_config(const std::string &name,
                              const VariableConfig &config,
                              std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Parses a comma separated list of numbers, e.g. "273.15, 283.15"
std::optional<std::vector<double>> parse_number_list(const std::string &value);

LogLevel string_to_log_level(const std::string &level_str_raw);
LoggingConfig default_logging_config();

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
