/**
 * @file filescanner.hpp
 * @brief Recursive collection of FileRecords across the scanned roots
 *
 * This header defines the FileScanner class which walks the canonical root
 * and every source root and emits one FileRecord per regular file.
 */

#ifndef FILESCANNER_HPP
#define FILESCANNER_HPP

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

#include "filerecord.hpp"
#include "ifilesystem.hpp"

/**
 * @brief Output of FileScanner::scanRoots()
 */
struct ScanResult {
  /** @brief All regular files, sorted by path */
  std::vector<FileRecord> records;

  /** @brief Roots actually scanned; the first one is canonical */
  std::vector<std::filesystem::path> roots;

  /** @brief One message per skipped root, subtree or file */
  std::vector<std::string> warnings;

  /** @brief Number of roots that could be listed */
  std::size_t readableRoots = 0;
};

/**
 * @class FileScanner
 * @brief Walks root directories and builds FileRecords
 *
 * Key behavior:
 * - The first root is tagged RootKind::Canonical, all others RootKind::Source
 * - Symbolic links are never followed and never reported, so link cycles
 *   cannot trap the walk
 * - Hidden files are included; deciding their fate is the classifier's job
 * - An unreadable directory is reported in ScanResult::warnings and its
 *   subtree is skipped; the rest of the scan continues
 * - A root nested inside another root belongs only to itself: the outer walk
 *   does not descend into it
 * - Each root is walked in its own std::async task; the results are merged
 *   and sorted once every task has finished
 *
 * Hashing is not done here. FingerprintIndex hashes only the files that need
 * it.
 *
 * @see FileRecord
 * @see FingerprintIndex
 */
class FileScanner {
private:
  /** @brief Filesystem capability used for listing and stat'ing */
  const IFileSystem &m_fs;

  /** @brief Optional atomic counter for thread-safe progress tracking */
  std::atomic<int> *m_progress_counter = nullptr;

  struct RootScan {
    std::vector<FileRecord> records;
    std::vector<std::string> warnings;
    bool readable = false;
  };

public:
  /**
   * @param fs Filesystem capability; must outlive the scanner
   */
  explicit FileScanner(const IFileSystem &fs) : m_fs(fs) {}

  /**
   * @brief Sets an atomic counter incremented once per regular file found
   *
   * The counter is shared by all per-root tasks. It is not reset by the
   * scanner; the caller manages initialization.
   *
   * @param counter Pointer to atomic integer counter, or nullptr to disable
   */
  void setProgressCounter(std::atomic<int> *counter) {
    m_progress_counter = counter;
  }

  /**
   * @brief Scans every root and returns the merged records
   *
   * Roots are normalized (lexically, trailing separator dropped). A root
   * given twice, or a source root equal to the canonical root, is scanned
   * once and reported as a warning.
   *
   * @param roots Absolute directories; roots[0] is the canonical root
   * @return ScanResult with records sorted by path
   */
  ScanResult scanRoots(const std::vector<std::filesystem::path> &roots);

  /** @brief Lexically normalized path without a trailing separator */
  static std::filesystem::path normalizeRoot(const std::filesystem::path &p);

private:
  /**
   * @brief Depth-first walk of one root
   *
   * @param root Root directory to walk
   * @param kind Tag for every record produced
   * @param otherRoots Directories the walk must not descend into
   */
  RootScan scanRoot(const std::filesystem::path &root, RootKind kind,
                    const std::vector<std::filesystem::path> &otherRoots) const;

  void sortRecords(std::vector<FileRecord> &records);
};

#endif // FILESCANNER_HPP
