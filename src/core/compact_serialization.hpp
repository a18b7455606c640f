#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace core {

/**
 * Checkpoint payload encoding.
 * - fixed-width integers and IEEE-754 doubles, little-endian, bit exact
 * - LEB128 varints for counts, lengths and tallies
 * - strings and double lists prefixed with a varint length
 */

// IEEE 802.3 CRC32 (reflected, polynomial 0xEDB88320). Pass the previous
// result as `seed` to checksum a buffer in pieces.
uint32_t crc32(const uint8_t *data, size_t size, uint32_t seed = 0);

class BinarySerializer {
public:
  void write_bool(bool value);
  void write_uint8(uint8_t value);
  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);
  void write_int32(int32_t value);
  void write_varint32(uint32_t value);
  void write_varint64(uint64_t value);
  void write_double(double value);
  void write_string(const std::string &str);
  void write_doubles(const std::vector<double> &values);

  // Enums are stored as one byte
  template <typename E> void write_enum(E value) {
    static_assert(std::is_enum_v<E>, "Type must be enum");
    write_uint8(static_cast<uint8_t>(value));
  }

  const std::vector<uint8_t> &data() const { return data_; }

private:
  void append(const void *bytes, size_t count);

  std::vector<uint8_t> data_;
};

/**
 * Bounds-checked reader over a borrowed buffer. Reading past the end or a
 * malformed varint throws std::runtime_error; the checkpoint layer turns that
 * into core::CheckpointCorruptError.
 */
class BinaryDeserializer {
public:
  BinaryDeserializer(const uint8_t *data, size_t size);

  bool read_bool();
  uint8_t read_uint8();
  uint32_t read_uint32();
  uint64_t read_uint64();
  int32_t read_int32();
  uint32_t read_varint32();
  uint64_t read_varint64();
  double read_double();
  std::string read_string();
  std::vector<double> read_doubles();

  size_t remaining() const { return size_ - position_; }
  bool has_more() const { return position_ < size_; }

private:
  void check_bounds(size_t bytes_needed) const;

  const uint8_t *data_;
  size_t size_;
  size_t position_ = 0;
};

} // namespace core
