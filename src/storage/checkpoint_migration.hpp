#ifndef CHECKPOINT_MIGRATION_HPP
#define CHECKPOINT_MIGRATION_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace storage {

struct MigrationResult {
  uint32_t version_from = 0;
  uint32_t version_to = 0;
  size_t accumulators_migrated = 0;
  std::vector<std::string> changes_made;
};

/**
 * Schema 1 payload (first release):
 *   completed ids    varint32 count, strings
 *   accumulators     varint32 count, then per accumulator
 *     entity         as in the current schema
 *     variable       string
 *     thresholds     vector<double>
 *     bin edges      vector<double>
 *     event thresh.  optional double (bool flag + value)
 *     state          varint64 sample_count, double sum_fcst, sum_obs,
 *                    sum_abs_error, sum_error, sum_squared_error,
 *                    tables and bins as in the current schema,
 *                    double sum_squared_prob_error
 *
 * Schema 1 has no missing_count, no second moments and no QC settings.
 * The upgrade sets missing_count and moment_count to 0, which keeps the
 * forecast/observation spread and correlation undefined for those states.
 */
std::vector<uint8_t> migrate_v1_to_v2(const std::vector<uint8_t> &payload,
                                      MigrationResult &result);

// Upgrades `payload` from `from_version` to the current schema in place.
// Throws core::CheckpointCorruptError for versions it cannot upgrade or a
// payload that does not decode under its declared version.
MigrationResult migrate_payload(uint32_t from_version,
                                std::vector<uint8_t> &payload);

bool can_migrate(uint32_t from_version);

} // namespace storage

#endif // CHECKPOINT_MIGRATION_HPP
