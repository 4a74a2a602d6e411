#include "pathallocator.hpp"
#include "errors.hpp"

namespace fs = std::filesystem;

std::optional<fs::path> PathAllocator::allocate(const fs::path &dir,
                                                const std::string &name) {
  for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
    fs::path candidate = dir / candidateName(name, attempt);
    try {
      if (isOccupied(candidate))
        continue;
    } catch (const ScanError &) {
      // the directory cannot be inspected, so no candidate is known to be free
      return std::nullopt;
    }
    m_reserved.insert(candidate);
    return candidate;
  }
  return std::nullopt;
}

bool PathAllocator::isOccupied(const fs::path &path) const {
  if (m_reserved.count(path))
    return true;

  if (!m_fs.stat(path))
    return false;

  return m_pendingRemovals.count(path) == 0;
}

std::string PathAllocator::candidateName(const std::string &name, int attempt) {
  if (attempt == 0)
    return name;

  fs::path p(name);
  return p.stem().string() + "_" + std::to_string(attempt) +
         p.extension().string();
}
