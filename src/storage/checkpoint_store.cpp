#include "checkpoint_store.hpp"
#include "checkpoint_migration.hpp"
#include "core/compact_serialization.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace storage {

namespace {

bool sync_file(const std::string &path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0)
    return false;
  bool synced = ::fsync(fd) == 0;
  ::close(fd);
  return synced;
}

accumulation::AccumulatorConfigPtr
intern_config(std::vector<accumulation::AccumulatorConfigPtr> &interned,
              accumulation::AccumulatorConfig::Options options) {
  auto config = accumulation::AccumulatorConfig::create(std::move(options));
  for (const auto &existing : interned) {
    if (*existing == *config)
      return existing;
  }
  interned.push_back(config);
  return config;
}

void decode_payload_body(core::BinaryDeserializer &in,
                         CheckpointRecord &record) {
  uint32_t completed_count = in.read_varint32();
  for (uint32_t i = 0; i < completed_count; ++i) {
    if (!record.completed_chunk_ids.insert(in.read_string()).second)
      throw core::CheckpointCorruptError("duplicate completed chunk id");
  }

  std::vector<accumulation::AccumulatorConfigPtr> interned;
  uint32_t accumulator_count = in.read_varint32();
  for (uint32_t i = 0; i < accumulator_count; ++i) {
    accumulation::EntityKey entity = read_entity(in);
    std::string variable = in.read_string();
    auto config = intern_config(interned, read_config(in));
    auto state = accumulation::AccumulatorState::deserialize(in);

    accumulation::Accumulator accumulator(std::move(entity),
                                          std::move(variable), config,
                                          std::move(state));
    if (record.accumulators.find(accumulator.key()))
      throw core::CheckpointCorruptError("duplicate accumulator " +
                                         accumulator.key().to_string());
    record.accumulators.insert(accumulator);
  }

  if (in.has_more())
    throw core::CheckpointCorruptError(std::to_string(in.remaining()) +
                                       " trailing bytes after payload");
}

} // namespace

void write_entity(core::BinarySerializer &out,
                  const accumulation::EntityKey &entity) {
  out.write_enum(entity.kind);
  out.write_int32(entity.grid_i);
  out.write_int32(entity.grid_j);
  out.write_double(entity.lat);
  out.write_double(entity.lon);
  out.write_string(entity.id);
  out.write_string(entity.type);
  out.write_string(entity.name);
  write_optional_double(out, entity.elevation_m);
}

accumulation::EntityKey read_entity(core::BinaryDeserializer &in) {
  accumulation::EntityKey entity;
  uint8_t kind = in.read_uint8();
  if (kind > static_cast<uint8_t>(accumulation::EntityKind::STATION))
    throw core::CheckpointCorruptError("unknown entity kind " +
                                       std::to_string(kind));
  entity.kind = static_cast<accumulation::EntityKind>(kind);
  entity.grid_i = in.read_int32();
  entity.grid_j = in.read_int32();
  entity.lat = in.read_double();
  entity.lon = in.read_double();
  entity.id = in.read_string();
  entity.type = in.read_string();
  entity.name = in.read_string();
  entity.elevation_m = read_optional_double(in);
  return entity;
}

void write_optional_double(core::BinarySerializer &out,
                           const std::optional<double> &value) {
  out.write_bool(value.has_value());
  if (value)
    out.write_double(*value);
}

std::optional<double> read_optional_double(core::BinaryDeserializer &in) {
  if (!in.read_bool())
    return std::nullopt;
  return in.read_double();
}

void write_config(core::BinarySerializer &out,
                  const accumulation::AccumulatorConfig &config) {
  out.write_doubles(config.thresholds());
  out.write_doubles(config.probability_bin_edges());
  write_optional_double(out, config.event_threshold());
  write_optional_double(out, config.missing_value());
  write_optional_double(out, config.valid_min());
  write_optional_double(out, config.valid_max());
  out.write_enum(config.probability_policy());
}

accumulation::AccumulatorConfig::Options
read_config(core::BinaryDeserializer &in) {
  accumulation::AccumulatorConfig::Options options;
  options.thresholds = in.read_doubles();
  options.probability_bin_edges = in.read_doubles();
  options.event_threshold = read_optional_double(in);
  options.missing_value = read_optional_double(in);
  options.valid_min = read_optional_double(in);
  options.valid_max = read_optional_double(in);
  uint8_t policy = in.read_uint8();
  if (policy > static_cast<uint8_t>(accumulation::ProbabilityPolicy::CLIP))
    throw core::CheckpointCorruptError("unknown probability policy " +
                                       std::to_string(policy));
  options.probability_policy =
      static_cast<accumulation::ProbabilityPolicy>(policy);
  return options;
}

std::vector<uint8_t>
encode_payload(const accumulation::AccumulatorSet &accumulators,
               const std::set<std::string> &completed_chunk_ids) {
  core::BinarySerializer out;

  out.write_varint32(static_cast<uint32_t>(completed_chunk_ids.size()));
  for (const auto &chunk_id : completed_chunk_ids)
    out.write_string(chunk_id);

  out.write_varint32(static_cast<uint32_t>(accumulators.size()));
  for (const auto &entry : accumulators) {
    const auto &accumulator = entry.second;
    write_entity(out, accumulator.entity());
    out.write_string(accumulator.variable());
    write_config(out, *accumulator.config());
    accumulator.state().serialize(out);
  }
  return out.data();
}

void decode_payload(const std::vector<uint8_t> &payload,
                    CheckpointRecord &record) {
  core::BinaryDeserializer in(payload.data(), payload.size());
  try {
    decode_payload_body(in, record);
  } catch (const core::CheckpointCorruptError &) {
    throw;
  } catch (const core::VerificationError &e) {
    // Invalid configuration or state shape inside the snapshot
    throw core::CheckpointCorruptError(std::string("invalid record: ") +
                                       e.what());
  } catch (const std::runtime_error &e) {
    throw core::CheckpointCorruptError(std::string("malformed payload: ") +
                                       e.what());
  }
}

std::vector<uint8_t> encode_header(const CheckpointHeader &header) {
  core::BinarySerializer out;
  out.write_uint32(header.magic);
  out.write_uint32(header.schema_version);
  out.write_uint64(header.sequence_number);
  out.write_uint64(header.payload_size);
  out.write_uint32(header.payload_crc32);
  return out.data();
}

CheckpointHeader decode_header(const uint8_t *data, size_t size) {
  if (size < CheckpointHeader::SIZE)
    throw core::CheckpointCorruptError("truncated header (" +
                                       std::to_string(size) + " bytes)");
  core::BinaryDeserializer in(data, CheckpointHeader::SIZE);
  CheckpointHeader header;
  header.magic = in.read_uint32();
  header.schema_version = in.read_uint32();
  header.sequence_number = in.read_uint64();
  header.payload_size = in.read_uint64();
  header.payload_crc32 = in.read_uint32();
  return header;
}

CheckpointStore::CheckpointStore(std::string path, uint32_t magic)
    : path_(std::move(path)), magic_(magic) {}

bool CheckpointStore::exists() const {
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}

std::optional<uint64_t> CheckpointStore::peek_sequence() const {
  std::ifstream in(path_, std::ios::binary);
  if (!in)
    return std::nullopt;
  uint8_t buffer[CheckpointHeader::SIZE];
  in.read(reinterpret_cast<char *>(buffer), sizeof(buffer));
  if (in.gcount() != static_cast<std::streamsize>(sizeof(buffer)))
    return std::nullopt;
  CheckpointHeader header = decode_header(buffer, sizeof(buffer));
  if (header.magic != magic_)
    return std::nullopt;
  return header.sequence_number;
}

uint64_t CheckpointStore::save(const accumulation::AccumulatorSet &accumulators,
                               const std::set<std::string> &completed_chunk_ids) {
  LOG(LogLevel::TRACE, LogComponent::STATE_PERSIST,
      "Entering save to path: " << path_);

  if (!sequence_known_) {
    // Continue numbering after a snapshot left by an earlier process
    last_sequence_ = peek_sequence().value_or(0);
    sequence_known_ = true;
  }

  std::vector<uint8_t> payload =
      encode_payload(accumulators, completed_chunk_ids);

  CheckpointHeader header;
  header.magic = magic_;
  header.schema_version = CHECKPOINT_SCHEMA_VERSION;
  header.sequence_number = last_sequence_ + 1;
  header.payload_size = payload.size();
  header.payload_crc32 = core::crc32(payload.data(), payload.size());
  std::vector<uint8_t> header_bytes = encode_header(header);

  if (!Utils::create_directory_for_file(path_)) {
    throw std::runtime_error("Could not create directory for checkpoint " +
                             path_);
  }

  const std::string temp_path = path_ + ".tmp";
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
          "Could not open temporary checkpoint file for writing: "
              << temp_path);
      throw std::runtime_error("Could not open " + temp_path);
    }
    out.write(reinterpret_cast<const char *>(header_bytes.data()),
              static_cast<std::streamsize>(header_bytes.size()));
    out.write(reinterpret_cast<const char *>(payload.data()),
              static_cast<std::streamsize>(payload.size()));
    out.flush();
    if (!out) {
      out.close();
      std::remove(temp_path.c_str());
      throw std::runtime_error("Could not write checkpoint " + temp_path);
    }
  }

  // The data must be on disk before the rename makes it the checkpoint
  if (!sync_file(temp_path)) {
    LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
        "Could not sync temporary checkpoint file: " << temp_path);
    std::remove(temp_path.c_str());
    throw std::runtime_error("Could not sync checkpoint " + temp_path);
  }

  if (std::rename(temp_path.c_str(), path_.c_str()) != 0) {
    LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
        "Could not rename temporary checkpoint file to final path: " << path_);
    std::remove(temp_path.c_str());
    throw std::runtime_error("Could not rename checkpoint into " + path_);
  }

  last_sequence_ = header.sequence_number;
  LOG(LogLevel::INFO, LogComponent::STATE_PERSIST,
      "Checkpoint #" << last_sequence_ << " saved to " << path_ << " ("
                     << accumulators.size() << " accumulators, "
                     << completed_chunk_ids.size() << " completed chunks, "
                     << payload.size() << " payload bytes)");
  return last_sequence_;
}

std::optional<CheckpointRecord> CheckpointStore::load() {
  LOG(LogLevel::TRACE, LogComponent::STATE_PERSIST,
      "Entering load from path: " << path_);

  if (!exists()) {
    LOG(LogLevel::INFO, LogComponent::STATE_PERSIST,
        "No checkpoint found at: " << path_ << ". Starting fresh.");
    return std::nullopt;
  }

  auto bytes = Utils::read_file_bytes(path_);
  if (!bytes)
    throw core::CheckpointCorruptError("checkpoint " + path_ +
                                       " exists but cannot be read");

  CheckpointHeader header = decode_header(bytes->data(), bytes->size());
  if (header.magic != magic_)
    throw core::CheckpointCorruptError("bad magic in " + path_);
  if (header.schema_version > CHECKPOINT_SCHEMA_VERSION ||
      !can_migrate(header.schema_version))
    throw core::CheckpointCorruptError(
        "unsupported schema version " + std::to_string(header.schema_version) +
        " in " + path_);

  const uint64_t actual_payload = bytes->size() - CheckpointHeader::SIZE;
  if (header.payload_size != actual_payload)
    throw core::CheckpointCorruptError(
        "payload size mismatch in " + path_ + ": header says " +
        std::to_string(header.payload_size) + ", file has " +
        std::to_string(actual_payload));

  std::vector<uint8_t> payload(bytes->begin() + CheckpointHeader::SIZE,
                               bytes->end());
  if (core::crc32(payload.data(), payload.size()) != header.payload_crc32)
    throw core::CheckpointCorruptError("payload checksum mismatch in " + path_);

  CheckpointRecord record;
  record.source_schema_version = header.schema_version;
  record.sequence_number = header.sequence_number;

  if (header.schema_version != CHECKPOINT_SCHEMA_VERSION) {
    MigrationResult migration = migrate_payload(header.schema_version, payload);
    LOG(LogLevel::INFO, LogComponent::STATE_MIGRATE,
        "Upgraded checkpoint " << path_ << " from schema "
                               << migration.version_from << " to "
                               << migration.version_to << " ("
                               << migration.accumulators_migrated
                               << " accumulators)");
  }

  decode_payload(payload, record);

  last_sequence_ = std::max(last_sequence_, record.sequence_number);
  sequence_known_ = true;

  LOG(LogLevel::INFO, LogComponent::STATE_PERSIST,
      "Checkpoint #" << record.sequence_number << " loaded from " << path_
                     << " (" << record.accumulators.size()
                     << " accumulators, " << record.completed_chunk_ids.size()
                     << " completed chunks)");
  return record;
}

} // namespace storage
