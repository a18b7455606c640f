#ifndef CHECKPOINT_STORE_HPP
#define CHECKPOINT_STORE_HPP

#include "accumulation/accumulator_config.hpp"
#include "accumulation/accumulator_set.hpp"
#include "accumulation/entity_key.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace core {
class BinarySerializer;
class BinaryDeserializer;
} // namespace core

namespace storage {

constexpr uint32_t CHECKPOINT_SCHEMA_VERSION = 2;
constexpr uint32_t DEFAULT_CHECKPOINT_MAGIC = 0xFCE57A7E;

/**
 * Fixed-size file header, little-endian:
 *   magic u32 | schema_version u32 | sequence u64 | payload_size u64 |
 *   payload_crc32 u32
 * followed by exactly payload_size payload bytes.
 */
struct CheckpointHeader {
  static constexpr size_t SIZE = 28;

  uint32_t magic = DEFAULT_CHECKPOINT_MAGIC;
  uint32_t schema_version = CHECKPOINT_SCHEMA_VERSION;
  uint64_t sequence_number = 0;
  uint64_t payload_size = 0;
  uint32_t payload_crc32 = 0;
};

struct CheckpointRecord {
  uint32_t schema_version = CHECKPOINT_SCHEMA_VERSION;
  // Version found on disk before any migration
  uint32_t source_schema_version = CHECKPOINT_SCHEMA_VERSION;
  uint64_t sequence_number = 0;
  std::set<std::string> completed_chunk_ids;
  accumulation::AccumulatorSet accumulators;
};

// Payload building blocks shared with the schema migrations
void write_entity(core::BinarySerializer &out,
                  const accumulation::EntityKey &entity);
accumulation::EntityKey read_entity(core::BinaryDeserializer &in);
void write_optional_double(core::BinarySerializer &out,
                           const std::optional<double> &value);
std::optional<double> read_optional_double(core::BinaryDeserializer &in);
void write_config(core::BinarySerializer &out,
                  const accumulation::AccumulatorConfig &config);
accumulation::AccumulatorConfig::Options
read_config(core::BinaryDeserializer &in);

// Current-schema payload codec. decode_payload throws
// core::CheckpointCorruptError on any malformed content.
std::vector<uint8_t>
encode_payload(const accumulation::AccumulatorSet &accumulators,
               const std::set<std::string> &completed_chunk_ids);
void decode_payload(const std::vector<uint8_t> &payload,
                    CheckpointRecord &record);

std::vector<uint8_t> encode_header(const CheckpointHeader &header);
CheckpointHeader decode_header(const uint8_t *data, size_t size);

/**
 * Single-file snapshot store.
 *
 * `save` writes `<path>.tmp` and renames it over `<path>`, so readers see
 * either the previous or the new snapshot, never a mix. Not thread-safe:
 * the caller quiesces all writers of the accumulator set first.
 */
class CheckpointStore {
public:
  explicit CheckpointStore(std::string path,
                           uint32_t magic = DEFAULT_CHECKPOINT_MAGIC);

  // Returns the sequence number written. Throws std::runtime_error when the
  // file cannot be written or renamed.
  uint64_t save(const accumulation::AccumulatorSet &accumulators,
                const std::set<std::string> &completed_chunk_ids);

  // std::nullopt when no checkpoint exists. Throws
  // core::CheckpointCorruptError when one exists but fails validation.
  std::optional<CheckpointRecord> load();

  bool exists() const;
  const std::string &path() const { return path_; }
  uint64_t last_sequence() const { return last_sequence_; }

private:
  std::optional<uint64_t> peek_sequence() const;

  std::string path_;
  uint32_t magic_;
  uint64_t last_sequence_ = 0;
  bool sequence_known_ = false;
};

} // namespace storage

#endif // CHECKPOINT_STORE_HPP
