#include "accumulator_state.hpp"
#include "core/compact_serialization.hpp"
#include "core/errors.hpp"

#include <stdexcept>
#include <string>

namespace accumulation {

AccumulatorState AccumulatorState::identity(size_t threshold_count,
                                            size_t bin_count) {
  AccumulatorState state;
  state.contingency.resize(threshold_count);
  state.probability_bins.resize(bin_count);
  return state;
}

AccumulatorState &AccumulatorState::combine(const AccumulatorState &other) {
  if (!same_shape(other)) {
    throw core::IncompatibleAccumulatorError(
        "cannot combine states of different shape: " +
        std::to_string(contingency.size()) + "/" +
        std::to_string(probability_bins.size()) + " vs " +
        std::to_string(other.contingency.size()) + "/" +
        std::to_string(other.probability_bins.size()));
  }

  sample_count += other.sample_count;
  missing_count += other.missing_count;

  sum_fcst += other.sum_fcst;
  sum_obs += other.sum_obs;
  sum_abs_error += other.sum_abs_error;
  sum_error += other.sum_error;
  sum_squared_error += other.sum_squared_error;
  moment_count += other.moment_count;
  sum_fcst_squared += other.sum_fcst_squared;
  sum_obs_squared += other.sum_obs_squared;
  sum_fcst_obs += other.sum_fcst_obs;

  for (size_t i = 0; i < contingency.size(); ++i)
    contingency[i] += other.contingency[i];
  for (size_t i = 0; i < probability_bins.size(); ++i)
    probability_bins[i] += other.probability_bins[i];
  sum_squared_prob_error += other.sum_squared_prob_error;

  return *this;
}

uint64_t AccumulatorState::probability_sample_count() const {
  uint64_t total = 0;
  for (const auto &bin : probability_bins)
    total += bin.bin_sample_count;
  return total;
}

uint64_t AccumulatorState::observed_event_count() const {
  uint64_t total = 0;
  for (const auto &bin : probability_bins)
    total += bin.observed_event_count;
  return total;
}

bool AccumulatorState::operator==(const AccumulatorState &other) const {
  return sample_count == other.sample_count &&
         missing_count == other.missing_count && sum_fcst == other.sum_fcst &&
         sum_obs == other.sum_obs && sum_abs_error == other.sum_abs_error &&
         sum_error == other.sum_error &&
         sum_squared_error == other.sum_squared_error &&
         moment_count == other.moment_count &&
         sum_fcst_squared == other.sum_fcst_squared &&
         sum_obs_squared == other.sum_obs_squared &&
         sum_fcst_obs == other.sum_fcst_obs &&
         contingency == other.contingency &&
         probability_bins == other.probability_bins &&
         sum_squared_prob_error == other.sum_squared_prob_error;
}

void AccumulatorState::serialize(core::BinarySerializer &out) const {
  out.write_varint64(sample_count);
  out.write_varint64(missing_count);

  out.write_double(sum_fcst);
  out.write_double(sum_obs);
  out.write_double(sum_abs_error);
  out.write_double(sum_error);
  out.write_double(sum_squared_error);
  out.write_varint64(moment_count);
  out.write_double(sum_fcst_squared);
  out.write_double(sum_obs_squared);
  out.write_double(sum_fcst_obs);

  out.write_varint32(static_cast<uint32_t>(contingency.size()));
  for (const auto &table : contingency) {
    out.write_varint64(table.hits);
    out.write_varint64(table.misses);
    out.write_varint64(table.false_alarms);
    out.write_varint64(table.correct_negatives);
  }

  out.write_varint32(static_cast<uint32_t>(probability_bins.size()));
  for (const auto &bin : probability_bins) {
    out.write_double(bin.forecast_prob_sum);
    out.write_varint64(bin.observed_event_count);
    out.write_varint64(bin.bin_sample_count);
  }
  out.write_double(sum_squared_prob_error);
}

AccumulatorState AccumulatorState::deserialize(core::BinaryDeserializer &in) {
  AccumulatorState state;
  state.sample_count = in.read_varint64();
  state.missing_count = in.read_varint64();

  state.sum_fcst = in.read_double();
  state.sum_obs = in.read_double();
  state.sum_abs_error = in.read_double();
  state.sum_error = in.read_double();
  state.sum_squared_error = in.read_double();
  state.moment_count = in.read_varint64();
  state.sum_fcst_squared = in.read_double();
  state.sum_obs_squared = in.read_double();
  state.sum_fcst_obs = in.read_double();

  uint32_t table_count = in.read_varint32();
  // each table is at least four bytes
  if (table_count > in.remaining() / 4)
    throw std::runtime_error("Contingency table count exceeds buffer");
  state.contingency.resize(table_count);
  for (auto &table : state.contingency) {
    table.hits = in.read_varint64();
    table.misses = in.read_varint64();
    table.false_alarms = in.read_varint64();
    table.correct_negatives = in.read_varint64();
  }

  uint32_t bin_count = in.read_varint32();
  if (bin_count > in.remaining() / 10)
    throw std::runtime_error("Probability bin count exceeds buffer");
  state.probability_bins.resize(bin_count);
  for (auto &bin : state.probability_bins) {
    bin.forecast_prob_sum = in.read_double();
    bin.observed_event_count = in.read_varint64();
    bin.bin_sample_count = in.read_varint64();
  }
  state.sum_squared_prob_error = in.read_double();

  return state;
}

AccumulatorState combine(AccumulatorState lhs, const AccumulatorState &rhs) {
  lhs.combine(rhs);
  return lhs;
}

} // namespace accumulation
