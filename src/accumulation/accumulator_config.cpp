#include "accumulator_config.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace accumulation {

const char *probability_policy_to_string(ProbabilityPolicy policy) {
  switch (policy) {
  case ProbabilityPolicy::REJECT:
    return "reject";
  case ProbabilityPolicy::CLIP:
    return "clip";
  }
  return "unknown";
}

std::shared_ptr<const AccumulatorConfig>
AccumulatorConfig::create(Options options) {
  const auto &thresholds = options.thresholds;
  for (size_t i = 0; i < thresholds.size(); ++i) {
    if (!std::isfinite(thresholds[i]))
      throw core::ConfigurationError("threshold must be finite");
    if (std::find(thresholds.begin(), thresholds.begin() + i, thresholds[i]) !=
        thresholds.begin() + i)
      throw core::ConfigurationError("duplicate threshold " +
                                     std::to_string(thresholds[i]));
  }

  const auto &edges = options.probability_bin_edges;
  if (!edges.empty()) {
    if (edges.size() < 2)
      throw core::ConfigurationError(
          "probability bins need at least two edges");
    for (size_t i = 0; i < edges.size(); ++i) {
      if (!(edges[i] >= 0.0 && edges[i] <= 1.0))
        throw core::ConfigurationError(
            "probability bin edges must lie within [0, 1]");
      if (i > 0 && !(edges[i] > edges[i - 1]))
        throw core::ConfigurationError(
            "probability bin edges must be strictly increasing");
    }
    if (!options.event_threshold)
      throw core::ConfigurationError(
          "probability bins require an event threshold");
  }

  if (options.event_threshold && !std::isfinite(*options.event_threshold))
    throw core::ConfigurationError("event threshold must be finite");

  if (options.missing_value && !std::isfinite(*options.missing_value))
    throw core::ConfigurationError(
        "missing value sentinel must be finite, non-finite values are always "
        "treated as missing");

  if (options.valid_min && options.valid_max &&
      *options.valid_min > *options.valid_max)
    throw core::ConfigurationError("valid range minimum exceeds maximum");

  return std::make_shared<const AccumulatorConfig>(PrivateTag{},
                                                   std::move(options));
}

std::string AccumulatorConfig::describe() const {
  std::ostringstream oss;
  oss << "thresholds=[";
  for (size_t i = 0; i < options_.thresholds.size(); ++i)
    oss << (i ? "," : "") << options_.thresholds[i];
  oss << "] bins=" << bin_count();
  if (options_.event_threshold)
    oss << " event>=" << *options_.event_threshold;
  oss << " policy=" << probability_policy_to_string(options_.probability_policy);
  return oss.str();
}

bool AccumulatorConfig::operator==(const AccumulatorConfig &other) const {
  return options_.thresholds == other.options_.thresholds &&
         options_.probability_bin_edges ==
             other.options_.probability_bin_edges &&
         options_.event_threshold == other.options_.event_threshold &&
         options_.missing_value == other.options_.missing_value &&
         options_.valid_min == other.options_.valid_min &&
         options_.valid_max == other.options_.valid_max &&
         options_.probability_policy == other.options_.probability_policy;
}

bool same_config(const AccumulatorConfigPtr &lhs,
                 const AccumulatorConfigPtr &rhs) {
  if (lhs == rhs)
    return true;
  if (!lhs || !rhs)
    return false;
  return *lhs == *rhs;
}

AccumulatorConfigPtr make_accumulator_config(const Config::VariableConfig &var) {
  AccumulatorConfig::Options options;
  options.thresholds = var.thresholds;
  options.probability_bin_edges = var.probability_bin_edges;
  options.event_threshold = var.event_threshold;
  options.missing_value = var.missing_value;
  options.valid_min = var.valid_min;
  options.valid_max = var.valid_max;

  if (var.probability_policy == "reject")
    options.probability_policy = ProbabilityPolicy::REJECT;
  else if (var.probability_policy == "clip")
    options.probability_policy = ProbabilityPolicy::CLIP;
  else
    throw core::ConfigurationError("unknown probability policy '" +
                                   var.probability_policy + "'");

  return AccumulatorConfig::create(std::move(options));
}

AccumulatorConfigPtr make_accumulator_config(const Config::AppConfig &config,
                                             const std::string &variable) {
  auto it = config.variables.find(variable);
  if (it == config.variables.end())
    throw core::ConfigurationError("no configuration for variable '" +
                                   variable + "'");
  return make_accumulator_config(it->second);
}

} // namespace accumulation
