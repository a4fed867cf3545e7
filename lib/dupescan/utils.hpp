/**
 * @file utils.hpp
 * @brief Small helpers shared by the front ends
 *
 * Key utilities:
 * - safe_at: Bounds-checked vector element access
 * - formatBytes: Human-readable file size formatting
 * - parseByteCount: Strict parsing of a byte count argument
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <charconv>
#include <cstddef> // size_t
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Safely accesses a vector element with bounds checking
 *
 * @return Pointer to the element, or nullptr if @p index is out of bounds
 */
template <typename T>
const T *safe_at(const std::vector<T> &vec, int index) {
  if (index < 0 || static_cast<size_t>(index) >= vec.size())
    return nullptr;
  return &vec[static_cast<size_t>(index)];
}

/**
 * @brief Formats byte count into human-readable size string
 *
 * Uses binary units (1024 bytes = 1 KB) and one decimal place:
 * - formatBytes(0) → "0 B"
 * - formatBytes(512) → "512.0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1048576) → "1.0 MB"
 */
inline std::string formatBytes(std::uintmax_t bytes) {
  if (bytes == 0)
    return "0 B";

  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f %s", size, units[unit]);
  return std::string(buf);
}

/**
 * @brief Parses a non-negative decimal byte count
 *
 * Only digits are accepted. A sign, whitespace, trailing text or a value
 * that does not fit uintmax_t gives std::nullopt, so "-5" is rejected
 * instead of wrapping around.
 */
inline std::optional<std::uintmax_t> parseByteCount(const std::string &text) {
  if (text.empty() || text[0] < '0' || text[0] > '9')
    return std::nullopt;

  std::uintmax_t value = 0;
  const char *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc() || ptr != end)
    return std::nullopt;
  return value;
}

#endif // UTILS_HPP
