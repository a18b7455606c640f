#include "utils/utils.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

// --- Tests for split_string ---
TEST(UtilsTest, SplitString) {
  auto parts = Utils::split_string("0.1,1.0,10", ',');
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0], "0.1");
  EXPECT_EQ(parts[2], "10");

  auto with_empty = Utils::split_string("a,,b", ',');
  ASSERT_EQ(with_empty.size(), 3u);
  EXPECT_EQ(with_empty[1], "");

  EXPECT_TRUE(Utils::split_string("", ',').empty());
}

// --- Tests for string_to_number ---
TEST(UtilsTest, StringToNumber) {
  EXPECT_EQ(Utils::string_to_number<int>("42"), 42);
  EXPECT_EQ(Utils::string_to_number<uint64_t>("18446744073709551615"),
            UINT64_MAX);
  EXPECT_DOUBLE_EQ(*Utils::string_to_number<double>("-273.15"), -273.15);
  EXPECT_DOUBLE_EQ(*Utils::string_to_number<double>("1e-3"), 0.001);

  EXPECT_FALSE(Utils::string_to_number<int>("12abc").has_value());
  EXPECT_FALSE(Utils::string_to_number<double>("nan?").has_value());
  EXPECT_FALSE(Utils::string_to_number<uint32_t>("-1").has_value());

  // Nothing to parse is not zero
  EXPECT_FALSE(Utils::string_to_number<double>("").has_value());
  EXPECT_FALSE(Utils::string_to_number<double>("-").has_value());
  EXPECT_FALSE(Utils::string_to_number<int>("-").has_value());
}

// --- Tests for trim helpers ---
TEST(UtilsTest, TrimCopy) {
  EXPECT_EQ(Utils::trim_copy("  t2m \t"), "t2m");
  EXPECT_EQ(Utils::trim_copy("\n\n"), "");
  EXPECT_EQ(Utils::trim_copy("a b"), "a b");
}

// --- Tests for format_double ---
TEST(UtilsTest, FormatDoubleRoundTrips) {
  double value = 0.1 + 0.2;
  auto parsed = Utils::string_to_number<double>(Utils::format_double(value));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, value);
}

// --- Tests for file helpers ---
TEST(UtilsTest, CreateDirectoryAndReadFile) {
  auto base = std::filesystem::temp_directory_path() / "fcstverif_utils_test";
  std::filesystem::remove_all(base);
  std::string file = (base / "nested" / "data.bin").string();

  ASSERT_TRUE(Utils::create_directory_for_file(file));
  EXPECT_TRUE(std::filesystem::is_directory(base / "nested"));

  {
    std::ofstream out(file, std::ios::binary);
    out.put(static_cast<char>(0x00));
    out.put(static_cast<char>(0xFF));
    out.put('x');
  }

  auto bytes = Utils::read_file_bytes(file);
  ASSERT_TRUE(bytes.has_value());
  ASSERT_EQ(bytes->size(), 3u);
  EXPECT_EQ((*bytes)[0], 0x00);
  EXPECT_EQ((*bytes)[1], 0xFF);
  EXPECT_EQ((*bytes)[2], 'x');

  EXPECT_FALSE(Utils::read_file_bytes((base / "missing.bin").string()));
  std::filesystem::remove_all(base);
}
