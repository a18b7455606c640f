#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace Utils {
std::vector<std::string> split_string(const std::string &text, char delimiter);

// Creates the parent directory of `filepath` if needed. Returns false when the
// directory does not exist afterwards.
bool create_directory_for_file(const std::string &filepath);

// Reads a whole file. std::nullopt when the file cannot be opened.
std::optional<std::vector<uint8_t>> read_file_bytes(const std::string &path);

// Formats a double with enough digits to round-trip exactly
std::string format_double(double value);

// std::nullopt unless the whole of `s` is one number; "" and "-" included
template <typename T> std::optional<T> string_to_number(std::string_view s) {
  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
