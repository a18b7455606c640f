#include "checkpoint_migration.hpp"
#include "checkpoint_store.hpp"
#include "core/compact_serialization.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <stdexcept>
#include <utility>

namespace storage {

namespace {

void copy_completed_ids(core::BinaryDeserializer &in,
                        core::BinarySerializer &out) {
  uint32_t count = in.read_varint32();
  out.write_varint32(count);
  for (uint32_t i = 0; i < count; ++i)
    out.write_string(in.read_string());
}

void upgrade_v1_accumulator(core::BinaryDeserializer &in,
                            core::BinarySerializer &out) {
  write_entity(out, read_entity(in));
  out.write_string(in.read_string()); // variable

  // v1 config: thresholds, bin edges, event threshold
  auto thresholds = in.read_doubles();
  auto edges = in.read_doubles();
  auto event_threshold = read_optional_double(in);
  out.write_doubles(thresholds);
  out.write_doubles(edges);
  write_optional_double(out, event_threshold);
  write_optional_double(out, std::nullopt); // missing_value
  write_optional_double(out, std::nullopt); // valid_min
  write_optional_double(out, std::nullopt); // valid_max
  out.write_enum(accumulation::ProbabilityPolicy::REJECT);

  accumulation::AccumulatorState state;
  state.sample_count = in.read_varint64();
  state.sum_fcst = in.read_double();
  state.sum_obs = in.read_double();
  state.sum_abs_error = in.read_double();
  state.sum_error = in.read_double();
  state.sum_squared_error = in.read_double();

  uint32_t table_count = in.read_varint32();
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

  state.serialize(out);
}

} // namespace

bool can_migrate(uint32_t from_version) {
  return from_version == 1 || from_version == CHECKPOINT_SCHEMA_VERSION;
}

std::vector<uint8_t> migrate_v1_to_v2(const std::vector<uint8_t> &payload,
                                      MigrationResult &result) {
  core::BinaryDeserializer in(payload.data(), payload.size());
  core::BinarySerializer out;

  try {
    copy_completed_ids(in, out);
    uint32_t count = in.read_varint32();
    out.write_varint32(count);
    for (uint32_t i = 0; i < count; ++i) {
      upgrade_v1_accumulator(in, out);
      ++result.accumulators_migrated;
    }
  } catch (const core::CheckpointCorruptError &) {
    throw;
  } catch (const std::runtime_error &e) {
    throw core::CheckpointCorruptError(
        std::string("schema 1 payload does not decode: ") + e.what());
  }
  if (in.has_more())
    throw core::CheckpointCorruptError("trailing bytes in schema 1 payload");

  result.changes_made.push_back("missing_count set to 0");
  result.changes_made.push_back(
      "second moments marked unavailable (moment_count 0)");
  result.changes_made.push_back(
      "QC settings defaulted (no sentinel, no valid range, reject policy)");
  return out.data();
}

MigrationResult migrate_payload(uint32_t from_version,
                                std::vector<uint8_t> &payload) {
  MigrationResult result;
  result.version_from = from_version;
  result.version_to = from_version;

  if (!can_migrate(from_version))
    throw core::CheckpointCorruptError("no migration from schema version " +
                                       std::to_string(from_version));

  if (result.version_to == 1) {
    payload = migrate_v1_to_v2(payload, result);
    result.version_to = 2;
    LOG(LogLevel::DEBUG, LogComponent::STATE_MIGRATE,
        "Applied schema 1 -> 2 migration to "
            << result.accumulators_migrated << " accumulators");
  }

  return result;
}

} // namespace storage
