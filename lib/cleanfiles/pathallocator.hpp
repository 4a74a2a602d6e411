#ifndef PATHALLOCATOR_HPP
#define PATHALLOCATOR_HPP

#include "ifilesystem.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>

/**
 * @brief Hands out collision-free destination paths before execution starts
 *
 * Candidates are tried as "name", "stem_1.ext", "stem_2.ext", ... A candidate
 * is taken when it was already handed out, or when something exists at that
 * path on disk and is not scheduled for removal.
 *
 * Allocation is sequential, so the same proposals in the same order always
 * get the same paths.
 */
class PathAllocator {
private:
  const IFileSystem &m_fs;
  std::set<std::filesystem::path> m_pendingRemovals;
  std::set<std::filesystem::path> m_reserved;

public:
  /** @brief Candidates tried per name before giving up */
  static constexpr int MAX_ATTEMPTS = 10000;

  /**
   * @param fs Used to check what exists on disk
   * @param pendingRemovals Paths proposed for deletion; they count as free
   */
  PathAllocator(const IFileSystem &fs,
                std::set<std::filesystem::path> pendingRemovals)
      : m_fs(fs), m_pendingRemovals(std::move(pendingRemovals)) {}

  /**
   * @brief Reserves and returns the first free candidate in dir
   *
   * @return std::nullopt if dir cannot be inspected (stat fails with
   *         ScanError) or MAX_ATTEMPTS candidates are all taken
   */
  std::optional<std::filesystem::path>
  allocate(const std::filesystem::path &dir, const std::string &name);

  /** @throws ScanError if the path cannot be checked */
  bool isOccupied(const std::filesystem::path &path) const;

  /** @brief "a.txt", 2 -> "a_2.txt"; 0 returns the name unchanged */
  static std::string candidateName(const std::string &name, int attempt);
};

#endif // PATHALLOCATOR_HPP
