/**
 * @file utils.hpp
 * @brief Helpers shared by the console and terminal front-ends
 *
 * Key utilities:
 * - safe_at: Bounds-checked vector element access
 * - formatBytes: Human-readable file size formatting
 * - displayPath: Path shown relative to its scan root
 * - parseAnswerKey: Prompt key to Answer
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstddef> // size_t
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "decisionengine.hpp"

/**
 * @brief Safely accesses a vector element with bounds checking
 *
 * @return Pointer to the element, or nullptr if @p index is negative or
 *         past the end
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
 * Uses binary units (1024 bytes = 1 KB) with one decimal place:
 * - formatBytes(0) → "0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1048576) → "1.0 MB"
 */
inline std::string formatBytes(unsigned long long bytes) {
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
 * @brief Path for display: "<root name>/<relative path>"
 *
 * Falls back to the full path when @p path is not below @p root.
 */
inline std::string displayPath(const std::filesystem::path &path,
                               const std::filesystem::path &root) {
  auto rel = path.lexically_relative(root);
  if (rel.empty() || *rel.begin() == "..")
    return path.string();
  return (root.filename() / rel).string();
}

/**
 * @brief Maps a prompt key to an Answer
 *
 * y = yes, n = no, a = yes to all of this kind, s = skip all of this kind.
 * Upper case is accepted.
 */
inline std::optional<Answer> parseAnswerKey(char key) {
  switch (key) {
  case 'y':
  case 'Y':
    return Answer::Yes;
  case 'n':
  case 'N':
    return Answer::No;
  case 'a':
  case 'A':
    return Answer::YesToAll;
  case 's':
  case 'S':
    return Answer::NoToAll;
  default:
    return std::nullopt;
  }
}

#endif // UTILS_HPP
