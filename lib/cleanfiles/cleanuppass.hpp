/**
 * @file cleanuppass.hpp
 * @brief Removes directories left empty after execution
 */

#ifndef CLEANUPPASS_HPP
#define CLEANUPPASS_HPP

#include "ifilesystem.hpp"

#include <filesystem>
#include <string>
#include <vector>

struct CleanupReport {
  /** @brief Directories removed, deepest first */
  std::vector<std::filesystem::path> removed;
  std::vector<std::string> warnings;
};

/**
 * @class CleanupPass
 * @brief Bottom-up pruning of empty directories under the scanned roots
 *
 * A directory is removed when it holds no entries after its subdirectories
 * were pruned. Any remaining entry (a file, a symlink, a directory that could
 * not be removed) keeps it. Source roots are removed themselves when they end
 * up empty. The canonical root and every directory that contains it are
 * never removed.
 */
class CleanupPass {
private:
  IFileSystem &m_fs;
  std::filesystem::path m_canonicalRoot;

public:
  /**
   * @param fs Filesystem capability
   * @param canonicalRoot Directory that must survive the pass
   */
  CleanupPass(IFileSystem &fs, std::filesystem::path canonicalRoot)
      : m_fs(fs), m_canonicalRoot(std::move(canonicalRoot)) {}

  /**
   * @brief Prunes every root
   * @param roots Scanned roots; the canonical root may be among them
   */
  CleanupReport prune(const std::vector<std::filesystem::path> &roots);

  /** @brief Whether removing @p dir would remove the canonical root */
  bool isProtected(const std::filesystem::path &dir) const;

private:
  /** @return true if @p dir was removed */
  bool pruneDir(const std::filesystem::path &dir, CleanupReport &report);
};

#endif // CLEANUPPASS_HPP
