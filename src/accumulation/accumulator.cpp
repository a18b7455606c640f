#include "accumulator.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "statistic_kernels.hpp"

#include <utility>

namespace accumulation {

namespace {
void check_config(const AccumulatorConfigPtr &config,
                  const std::string &variable) {
  if (!config)
    throw core::ConfigurationError("accumulator for '" + variable +
                                   "' has no configuration");
  if (variable.empty())
    throw core::ConfigurationError("accumulator variable name is empty");
}
} // namespace

Accumulator::Accumulator(EntityKey entity, std::string variable,
                         AccumulatorConfigPtr config)
    : entity_(std::move(entity)), variable_(std::move(variable)),
      config_(std::move(config)) {
  check_config(config_, variable_);
  state_ = AccumulatorState::identity(config_->threshold_count(),
                                      config_->bin_count());
}

Accumulator::Accumulator(EntityKey entity, std::string variable,
                         AccumulatorConfigPtr config, AccumulatorState state)
    : entity_(std::move(entity)), variable_(std::move(variable)),
      config_(std::move(config)), state_(std::move(state)) {
  check_config(config_, variable_);
  if (state_.contingency.size() != config_->threshold_count() ||
      state_.probability_bins.size() != config_->bin_count()) {
    throw core::ConfigurationError("restored state of " + key().to_string() +
                                   " does not match its configuration");
  }
}

UpdateResult Accumulator::update(const std::vector<double> &forecasts,
                                 const std::vector<double> &observations,
                                 const std::vector<double> *probabilities) {
  if (forecasts.size() != observations.size()) {
    throw core::ShapeMismatchError(
        key().to_string() + ": " + std::to_string(forecasts.size()) +
        " forecasts vs " + std::to_string(observations.size()) +
        " observations");
  }
  if (probabilities) {
    if (!config_->has_probability_bins())
      throw core::ConfigurationError(
          key().to_string() +
          ": probabilities supplied but no probability bins configured");
    if (probabilities->size() != forecasts.size())
      throw core::ShapeMismatchError(
          key().to_string() + ": " + std::to_string(probabilities->size()) +
          " probabilities vs " + std::to_string(forecasts.size()) +
          " forecasts");
  }

  AccumulatorState delta = AccumulatorState::identity(
      config_->threshold_count(), config_->bin_count());
  const auto counts = kernels::accumulate_batch(
      forecasts.data(), observations.data(),
      probabilities ? probabilities->data() : nullptr, forecasts.size(),
      *config_, delta);
  state_.combine(delta);

  LOG(LogLevel::TRACE, LogComponent::ACCUMULATION,
      key().to_string() << " accepted=" << counts.accepted
                        << " rejected=" << counts.rejected);
  return {counts.accepted, counts.rejected};
}

bool Accumulator::is_compatible_with(const Accumulator &other) const {
  return entity_.same_identity(other.entity_) && variable_ == other.variable_ &&
         same_config(config_, other.config_);
}

void Accumulator::merge(const Accumulator &other) {
  if (!entity_.same_identity(other.entity_) || variable_ != other.variable_) {
    throw core::IncompatibleAccumulatorError(
        "cannot merge " + other.key().to_string() + " into " +
        key().to_string());
  }
  if (!same_config(config_, other.config_)) {
    throw core::IncompatibleAccumulatorError(
        key().to_string() + ": configuration mismatch (" + config_->describe() +
        " vs " + other.config_->describe() + ")");
  }
  state_.combine(other.state_);
}

metrics::MetricsReport Accumulator::compute_metrics() const {
  return metrics::derive_report(entity_, variable_, state_, *config_);
}

Accumulator merged(const Accumulator &lhs, const Accumulator &rhs) {
  Accumulator result = lhs;
  result.merge(rhs);
  return result;
}

} // namespace accumulation
