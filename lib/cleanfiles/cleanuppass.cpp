#include "cleanuppass.hpp"
#include "errors.hpp"

namespace fs = std::filesystem;

CleanupReport CleanupPass::prune(const std::vector<fs::path> &roots) {
  CleanupReport report;

  for (const auto &root : roots) {
    try {
      // A nested root may already be gone with its parent
      if (!m_fs.stat(root))
        continue;
    } catch (const ScanError &e) {
      report.warnings.push_back(e.what());
      continue;
    }
    pruneDir(root, report);
  }

  return report;
}

bool CleanupPass::isProtected(const fs::path &dir) const {
  const fs::path d = dir.lexically_normal();
  const fs::path c = m_canonicalRoot.lexically_normal();

  auto dIt = d.begin();
  auto cIt = c.begin();
  for (; dIt != d.end() && cIt != c.end(); ++dIt, ++cIt) {
    if (dIt->empty())
      break; // trailing separator
    if (*dIt != *cIt)
      return false;
  }
  return dIt == d.end() || dIt->empty();
}

bool CleanupPass::pruneDir(const fs::path &dir, CleanupReport &report) {
  std::vector<DirEntry> entries;
  try {
    entries = m_fs.listEntries(dir);
  } catch (const ScanError &e) {
    report.warnings.push_back(e.what());
    return false;
  }

  bool keep = false;
  for (const auto &entry : entries) {
    if (entry.type == EntryType::Directory) {
      if (!pruneDir(entry.path, report))
        keep = true;
    } else {
      keep = true;
    }
  }

  if (keep || isProtected(dir))
    return false;

  try {
    m_fs.removeEmptyDir(dir);
  } catch (const ActionError &e) {
    report.warnings.push_back(e.what());
    return false;
  }
  report.removed.push_back(dir);
  return true;
}
