#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"accumulation", LogComponent::ACCUMULATION},
    {"accumulation.merge", LogComponent::MERGE},
    {"metrics", LogComponent::METRICS},
    {"routing", LogComponent::ROUTING},
    {"workflow", LogComponent::WORKFLOW},
    {"state.persist", LogComponent::STATE_PERSIST},
    {"state.migrate", LogComponent::STATE_MIGRATE}};

LoggingConfig default_logging_config() {
  LoggingConfig logging;
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
  return logging;
}

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

std::optional<std::vector<double>> parse_number_list(const std::string &value) {
  std::vector<double> numbers;
  if (Utils::trim_copy(value).empty())
    return numbers;

  for (const auto &token : Utils::split_string(value, ',')) {
    std::string trimmed = Utils::trim_copy(token);
    if (trimmed.empty())
      return std::nullopt;
    auto number = Utils::string_to_number<double>(trimmed);
    if (!number)
      return std::nullopt;
    numbers.push_back(*number);
  }
  return numbers;
}

bool validate_variable_config(const std::string &name,
                              const VariableConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;
  const std::string prefix = "Variable '" + name + "': ";

  for (size_t i = 0; i < config.thresholds.size(); ++i) {
    if (!std::isfinite(config.thresholds[i])) {
      errors.push_back(prefix + "thresholds must be finite");
      valid = false;
      break;
    }
    if (std::find(config.thresholds.begin(), config.thresholds.begin() + i,
                  config.thresholds[i]) != config.thresholds.begin() + i) {
      errors.push_back(prefix + "thresholds must be unique");
      valid = false;
      break;
    }
  }

  const auto &edges = config.probability_bin_edges;
  if (!edges.empty()) {
    if (edges.size() < 2) {
      errors.push_back(prefix + "probability_bin_edges needs at least 2 edges");
      valid = false;
    }
    for (size_t i = 0; i < edges.size(); ++i) {
      if (!(edges[i] >= 0.0 && edges[i] <= 1.0)) {
        errors.push_back(prefix +
                         "probability_bin_edges must lie within [0, 1]");
        valid = false;
        break;
      }
      if (i > 0 && !(edges[i] > edges[i - 1])) {
        errors.push_back(prefix +
                         "probability_bin_edges must be strictly increasing");
        valid = false;
        break;
      }
    }
    if (!config.event_threshold) {
      errors.push_back(prefix + "event_threshold is required when "
                                "probability_bin_edges are set");
      valid = false;
    }
  }

  if (config.event_threshold && !std::isfinite(*config.event_threshold)) {
    errors.push_back(prefix + "event_threshold must be finite");
    valid = false;
  }

  if (config.valid_min && config.valid_max &&
      *config.valid_min > *config.valid_max) {
    errors.push_back(prefix + "valid_min must not exceed valid_max");
    valid = false;
  }

  if (config.probability_policy != "reject" &&
      config.probability_policy != "clip") {
    errors.push_back(prefix + "probability_policy must be 'reject' or 'clip'");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.worker_threads < 1 || config.worker_threads > 256) {
    errors.push_back("worker_threads must be between 1 and 256");
    valid = false;
  }

  if (config.checkpoint_enabled) {
    if (config.checkpoint_path.empty()) {
      errors.push_back("checkpoint_path must be set when checkpoints are "
                       "enabled");
      valid = false;
    }
    if (config.checkpoint_interval_chunks < 1) {
      errors.push_back("checkpoint_interval_chunks must be at least 1");
      valid = false;
    }
  }

  for (const auto &[name, variable] : config.variables) {
    if (!validate_variable_config(name, variable, errors)) {
      valid = false;
    }
  }

  return valid;
}

namespace {

void warn_invalid_number(int line_num, const std::string &key,
                         const std::string &value) {
  std::cerr << "Warning (Config Line " << line_num
            << "): Invalid numeric value for key '" << key << "': '" << value
            << "'" << std::endl;
}

void parse_variable_key(const std::string &key, const std::string &value,
                        int line_num, VariableConfig &variable) {
  if (key == Keys::VAR_THRESHOLDS || key == Keys::VAR_PROBABILITY_BIN_EDGES) {
    auto numbers = parse_number_list(value);
    if (!numbers) {
      warn_invalid_number(line_num, key, value);
      return;
    }
    if (key == Keys::VAR_THRESHOLDS)
      variable.thresholds = *numbers;
    else
      variable.probability_bin_edges = *numbers;
    return;
  }

  if (key == Keys::VAR_PROBABILITY_POLICY) {
    std::string policy = Utils::trim_copy(value);
    std::transform(policy.begin(), policy.end(), policy.begin(), ::tolower);
    variable.probability_policy = policy;
    return;
  }

  std::optional<double> *target = nullptr;
  if (key == Keys::VAR_EVENT_THRESHOLD)
    target = &variable.event_threshold;
  else if (key == Keys::VAR_MISSING_VALUE)
    target = &variable.missing_value;
  else if (key == Keys::VAR_VALID_MIN)
    target = &variable.valid_min;
  else if (key == Keys::VAR_VALID_MAX)
    target = &variable.valid_max;

  if (!target) {
    std::cerr << "Warning (Config Line " << line_num
              << "): Unknown variable key '" << key << "'" << std::endl;
    return;
  }

  auto number = Utils::string_to_number<double>(value);
  if (!number || value.empty()) {
    warn_invalid_number(line_num, key, value);
    return;
  }
  *target = *number;
}

void parse_completeness_key(const std::string &key, const std::string &value,
                            int line_num, CompletenessConfig &completeness) {
  uint64_t *target = nullptr;
  if (key == Keys::GRIDPOINT_MIN_SAMPLES)
    target = &completeness.gridpoint_min_samples;
  else if (key == Keys::REGION_MIN_SAMPLES)
    target = &completeness.region_min_samples;
  else if (key == Keys::STATION_MIN_SAMPLES)
    target = &completeness.station_min_samples;

  if (!target) {
    std::cerr << "Warning (Config Line " << line_num
              << "): Unknown completeness key '" << key << "'" << std::endl;
    return;
  }

  auto number = Utils::string_to_number<uint64_t>(value);
  if (!number) {
    warn_invalid_number(line_num, key, value);
    return;
  }
  *target = *number;
}

void parse_logging_key(const std::string &key, const std::string &value,
                       LoggingConfig &logging) {
  if (key == Keys::LOGGING_DEFAULT_LEVEL) {
    LogLevel default_level = string_to_log_level(value);
    for (auto &pair : logging.log_levels)
      pair.second = default_level;
    return;
  }

  auto comp_it = key_to_component_map.find(key);
  if (comp_it != key_to_component_map.end()) {
    logging.log_levels[comp_it->second] = string_to_log_level(value);
  } else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
    // Wildcard match, e.g., "state.* = DEBUG"
    std::string prefix = key.substr(0, key.length() - 1);
    for (const auto &pair : key_to_component_map) {
      if (pair.first.rfind(prefix, 0) == 0)
        logging.log_levels[pair.second] = string_to_log_level(value);
    }
  }
}

} // namespace

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  config.logging = default_logging_config();

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      if (current_section.rfind(VARIABLE_SECTION_PREFIX, 0) == 0) {
        std::string name = Utils::trim_copy(
            current_section.substr(std::string(VARIABLE_SECTION_PREFIX).size()));
        if (name.empty()) {
          std::cerr << "Warning (Config Line " << line_num
                    << "): Variable section without a name." << std::endl;
        } else {
          config.variables[name];
        }
      }
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    // Global (non-section) keys
    if (current_section.empty()) {
      if (key == Keys::CHECKPOINT_ENABLED)
        config.checkpoint_enabled = string_to_bool(value);
      else if (key == Keys::CHECKPOINT_PATH)
        config.checkpoint_path = value;
      else if (key == Keys::CHECKPOINT_INTERVAL_CHUNKS)
        config.checkpoint_interval_chunks =
            Utils::string_to_number<uint64_t>(value).value_or(
                config.checkpoint_interval_chunks);
      else if (key == Keys::CHECKPOINT_FILE_MAGIC)
        config.checkpoint_file_magic =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.checkpoint_file_magic);
      else if (key == Keys::WORKER_THREADS)
        config.worker_threads =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.worker_threads);
      else if (key == Keys::REPORT_OUTPUT_PATH)
        config.report_output_path = value;
      else
        config.custom_settings[key] = value;

    } else if (current_section.rfind(VARIABLE_SECTION_PREFIX, 0) == 0) {
      std::string name = Utils::trim_copy(
          current_section.substr(std::string(VARIABLE_SECTION_PREFIX).size()));
      if (!name.empty())
        parse_variable_key(key, value, line_num, config.variables[name]);

    } else if (current_section == "Completeness") {
      parse_completeness_key(key, value, line_num, config.completeness);

    } else if (current_section == "Logging") {
      parse_logging_key(key, value, config.logging);

    } else {
      std::cerr << "Warning (Config Line " << line_num << "): Unknown section '"
                << current_section << "'" << std::endl;
    }
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
