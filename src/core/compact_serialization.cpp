#include "compact_serialization.hpp"

#include <array>
#include <cstring>
#include <stdexcept>

namespace core {

namespace {

std::array<uint32_t, 256> make_crc_table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t c = i;
    for (int k = 0; k < 8; ++k)
      c = (c & 1U) ? 0xEDB88320U ^ (c >> 1) : c >> 1;
    table[i] = c;
  }
  return table;
}

} // namespace

uint32_t crc32(const uint8_t *data, size_t size, uint32_t seed) {
  static const std::array<uint32_t, 256> table = make_crc_table();
  uint32_t c = seed ^ 0xFFFFFFFFU;
  for (size_t i = 0; i < size; ++i)
    c = table[(c ^ data[i]) & 0xFFU] ^ (c >> 8);
  return c ^ 0xFFFFFFFFU;
}

// --- BinarySerializer ---

void BinarySerializer::write_bool(bool value) { write_uint8(value ? 1 : 0); }

void BinarySerializer::write_uint8(uint8_t value) { data_.push_back(value); }

void BinarySerializer::write_uint32(uint32_t value) {
  for (int shift = 0; shift < 32; shift += 8)
    write_uint8(static_cast<uint8_t>(value >> shift));
}

void BinarySerializer::write_uint64(uint64_t value) {
  write_uint32(static_cast<uint32_t>(value));
  write_uint32(static_cast<uint32_t>(value >> 32));
}

void BinarySerializer::write_int32(int32_t value) {
  write_uint32(static_cast<uint32_t>(value));
}

void BinarySerializer::write_varint32(uint32_t value) { write_varint64(value); }

void BinarySerializer::write_varint64(uint64_t value) {
  while (value >= 0x80) {
    write_uint8(static_cast<uint8_t>(value | 0x80));
    value >>= 7;
  }
  write_uint8(static_cast<uint8_t>(value));
}

void BinarySerializer::write_double(double value) {
  static_assert(sizeof(double) == 8, "Double must be 8 bytes");
  uint64_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  write_uint64(bits);
}

void BinarySerializer::write_string(const std::string &str) {
  write_varint32(static_cast<uint32_t>(str.size()));
  append(str.data(), str.size());
}

void BinarySerializer::write_doubles(const std::vector<double> &values) {
  write_varint32(static_cast<uint32_t>(values.size()));
  for (double value : values)
    write_double(value);
}

void BinarySerializer::append(const void *bytes, size_t count) {
  const auto *begin = static_cast<const uint8_t *>(bytes);
  data_.insert(data_.end(), begin, begin + count);
}

// --- BinaryDeserializer ---

BinaryDeserializer::BinaryDeserializer(const uint8_t *data, size_t size)
    : data_(data), size_(size) {}

bool BinaryDeserializer::read_bool() {
  uint8_t value = read_uint8();
  if (value > 1)
    throw std::runtime_error("Invalid boolean encoding");
  return value != 0;
}

uint8_t BinaryDeserializer::read_uint8() {
  check_bounds(1);
  return data_[position_++];
}

uint32_t BinaryDeserializer::read_uint32() {
  check_bounds(4);
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i)
    value |= static_cast<uint32_t>(data_[position_++]) << (8 * i);
  return value;
}

uint64_t BinaryDeserializer::read_uint64() {
  uint64_t low = read_uint32();
  uint64_t high = read_uint32();
  return low | (high << 32);
}

int32_t BinaryDeserializer::read_int32() {
  return static_cast<int32_t>(read_uint32());
}

uint32_t BinaryDeserializer::read_varint32() {
  uint64_t value = read_varint64();
  if (value > UINT32_MAX)
    throw std::runtime_error("Varint32 overflow");
  return static_cast<uint32_t>(value);
}

uint64_t BinaryDeserializer::read_varint64() {
  uint64_t result = 0;
  for (uint32_t shift = 0; shift < 64; shift += 7) {
    uint8_t byte = read_uint8();
    result |= static_cast<uint64_t>(byte & 0x7F) << shift;
    if ((byte & 0x80) == 0)
      return result;
  }
  throw std::runtime_error("Varint decode overflow");
}

double BinaryDeserializer::read_double() {
  uint64_t bits = read_uint64();
  double value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

std::string BinaryDeserializer::read_string() {
  uint32_t length = read_varint32();
  check_bounds(length);
  std::string result(reinterpret_cast<const char *>(data_ + position_), length);
  position_ += length;
  return result;
}

std::vector<double> BinaryDeserializer::read_doubles() {
  uint32_t count = read_varint32();
  // Reject counts the remaining bytes cannot hold before allocating
  if (count > remaining() / sizeof(double))
    throw std::runtime_error("Buffer underflow in deserialization");
  std::vector<double> values;
  values.reserve(count);
  for (uint32_t i = 0; i < count; ++i)
    values.push_back(read_double());
  return values;
}

void BinaryDeserializer::check_bounds(size_t bytes_needed) const {
  if (bytes_needed > size_ - position_)
    throw std::runtime_error("Buffer underflow in deserialization");
}

} // namespace core
