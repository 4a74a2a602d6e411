/**
 * @file filescanner.cpp
 * @brief Implementation of the multi-root directory scanner
 */

#include "filescanner.hpp"
#include "errors.hpp"

#include <algorithm>
#include <future>

namespace fs = std::filesystem;

fs::path FileScanner::normalizeRoot(const fs::path &p) {
  fs::path normal = p.lexically_normal();
  if (!normal.has_filename() && normal.has_relative_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

/**
 * @brief Scans all roots concurrently and merges the results
 *
 * Duplicate roots are removed first so that no file can be reported twice.
 * Each remaining root is handed to scanRoot() in a separate std::async task;
 * the other roots are passed along so nested roots are skipped by the outer
 * walk. Results are merged in root order and then sorted by path.
 */
ScanResult FileScanner::scanRoots(const std::vector<fs::path> &roots) {
  ScanResult result;

  for (const auto &raw : roots) {
    fs::path root = normalizeRoot(raw);
    if (std::find(result.roots.begin(), result.roots.end(), root) !=
        result.roots.end()) {
      result.warnings.push_back("Directory listed more than once, scanning it once: " +
                                root.string());
      continue;
    }
    result.roots.push_back(root);
  }

  std::vector<std::future<RootScan>> tasks;
  tasks.reserve(result.roots.size());

  for (std::size_t i = 0; i < result.roots.size(); ++i) {
    std::vector<fs::path> others;
    for (std::size_t j = 0; j < result.roots.size(); ++j) {
      if (j != i)
        others.push_back(result.roots[j]);
    }

    RootKind kind = (i == 0) ? RootKind::Canonical : RootKind::Source;
    tasks.push_back(std::async(std::launch::async,
                               [this, root = result.roots[i], kind,
                                others = std::move(others)]() {
                                 return scanRoot(root, kind, others);
                               }));
  }

  // Fingerprinting needs the complete set: wait for every walk
  for (auto &task : tasks) {
    RootScan partial = task.get();
    if (partial.readable)
      ++result.readableRoots;

    std::move(partial.records.begin(), partial.records.end(),
              std::back_inserter(result.records));
    std::move(partial.warnings.begin(), partial.warnings.end(),
              std::back_inserter(result.warnings));
  }

  sortRecords(result.records);
  return result;
}

FileScanner::RootScan
FileScanner::scanRoot(const fs::path &root, RootKind kind,
                      const std::vector<fs::path> &otherRoots) const {
  RootScan scan;

  try {
    auto st = m_fs.stat(root);
    if (!st || st->type != EntryType::Directory) {
      scan.warnings.push_back("Not a directory, skipped: " + root.string());
      return scan;
    }
  } catch (const ScanError &e) {
    scan.warnings.push_back(e.what());
    return scan;
  }

  std::vector<fs::path> pending{root};
  bool first = true;

  while (!pending.empty()) {
    fs::path dir = std::move(pending.back());
    pending.pop_back();

    std::vector<DirEntry> entries;
    try {
      entries = m_fs.listEntries(dir);
    } catch (const ScanError &e) {
      scan.warnings.push_back(e.what());
      first = false;
      continue;
    }

    if (first) {
      scan.readable = true;
      first = false;
    }

    for (const auto &entry : entries) {
      switch (entry.type) {
      case EntryType::Directory:
        // Nested root: it is walked as its own root
        if (std::find(otherRoots.begin(), otherRoots.end(), entry.path) ==
            otherRoots.end()) {
          pending.push_back(entry.path);
        }
        break;

      case EntryType::Regular:
        try {
          auto st = m_fs.stat(entry.path);
          if (!st || st->type != EntryType::Regular) {
            break; // vanished or replaced since listing
          }
          scan.records.emplace_back(entry.path, root, kind, st->size,
                                    st->mtime, st->permissions);
          if (m_progress_counter) {
            ++(*m_progress_counter);
          }
        } catch (const ScanError &e) {
          scan.warnings.push_back(e.what());
        }
        break;

      case EntryType::Symlink:
      case EntryType::Other:
        break;
      }
    }
  }

  return scan;
}

void FileScanner::sortRecords(std::vector<FileRecord> &records) {
  std::sort(records.begin(), records.end(),
            [](const FileRecord &a, const FileRecord &b) {
              return a.getPath() < b.getPath();
            });
}
