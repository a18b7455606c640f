#ifndef ACCUMULATOR_CONFIG_HPP
#define ACCUMULATOR_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Config {
struct AppConfig;
struct VariableConfig;
} // namespace Config

namespace accumulation {

// What to do with a forecast probability outside [0, 1]. Persisted in
// checkpoints, do not renumber.
enum class ProbabilityPolicy : uint8_t {
  REJECT = 0, // the pair counts as missing
  CLIP = 1    // clamp into [0, 1]
};

const char *probability_policy_to_string(ProbabilityPolicy policy);

/**
 * Immutable threshold, bin and QC setup of one accumulator.
 *
 * Instances are only handed out through `create`, which validates the
 * options and throws core::ConfigurationError when they cannot work. Many
 * accumulators share one instance via shared_ptr<const>; equality is by
 * value.
 */
class AccumulatorConfig {
public:
  struct Options {
    std::vector<double> thresholds;
    std::vector<double> probability_bin_edges;
    std::optional<double> event_threshold;
    std::optional<double> missing_value;
    std::optional<double> valid_min;
    std::optional<double> valid_max;
    ProbabilityPolicy probability_policy = ProbabilityPolicy::REJECT;
  };

  static std::shared_ptr<const AccumulatorConfig> create(Options options);

  const std::vector<double> &thresholds() const {
    return options_.thresholds;
  }
  const std::vector<double> &probability_bin_edges() const {
    return options_.probability_bin_edges;
  }
  const std::optional<double> &event_threshold() const {
    return options_.event_threshold;
  }
  const std::optional<double> &missing_value() const {
    return options_.missing_value;
  }
  const std::optional<double> &valid_min() const { return options_.valid_min; }
  const std::optional<double> &valid_max() const { return options_.valid_max; }
  ProbabilityPolicy probability_policy() const {
    return options_.probability_policy;
  }
  const Options &options() const { return options_; }

  size_t threshold_count() const { return options_.thresholds.size(); }
  bool has_probability_bins() const {
    return !options_.probability_bin_edges.empty();
  }
  size_t bin_count() const {
    return has_probability_bins() ? options_.probability_bin_edges.size() - 1
                                  : 0;
  }

  std::string describe() const;

  bool operator==(const AccumulatorConfig &other) const;
  bool operator!=(const AccumulatorConfig &other) const {
    return !(*this == other);
  }

private:
  // Only create() can name the tag, so every instance is validated
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  AccumulatorConfig(PrivateTag, Options options)
      : options_(std::move(options)) {}

private:
  Options options_;
};

using AccumulatorConfigPtr = std::shared_ptr<const AccumulatorConfig>;

// True when both point at equal configurations (or are the same pointer)
bool same_config(const AccumulatorConfigPtr &lhs,
                 const AccumulatorConfigPtr &rhs);

// Builds the accumulator setup of one [Variable:<NAME>] section.
AccumulatorConfigPtr make_accumulator_config(const Config::VariableConfig &var);

// Throws core::ConfigurationError when `variable` has no section.
AccumulatorConfigPtr make_accumulator_config(const Config::AppConfig &config,
                                             const std::string &variable);

} // namespace accumulation

#endif // ACCUMULATOR_CONFIG_HPP
