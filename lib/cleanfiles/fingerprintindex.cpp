#include "fingerprintindex.hpp"
#include "errors.hpp"

#include <algorithm>
#include <unordered_map>

namespace {

const FingerprintIndex::Group kEmptyGroup;

bool isCandidate(const FileRecord &record, const Config &config) {
  return !record.zeroFile() && !config.matchTempSuffix(record.getName());
}

} // namespace

FingerprintIndex FingerprintIndex::build(std::vector<FileRecord> &records,
                                         const IHashCalculator &hasher,
                                         const Config &config) {
  FingerprintIndex index;

  // Count sizes and names among candidates to find who needs a hash
  std::unordered_map<std::uintmax_t, int> sizeCount;
  std::unordered_map<std::string, int> nameCount;
  for (const auto &record : records) {
    if (isCandidate(record, config)) {
      ++sizeCount[record.getFileSize()];
      ++nameCount[record.getName()];
    }
  }

  for (auto &record : records) {
    if (!isCandidate(record, config))
      continue;

    bool sharesSize = sizeCount[record.getFileSize()] > 1;
    bool sharesName = nameCount[record.getName()] > 1;
    if (!sharesSize && !sharesName)
      continue; // unique by size and name: cannot be compared with anything

    try {
      record.setHash(hasher.calculateHash(record.getPath()));
      ++index.m_hashedCount;
    } catch (const HashError &e) {
      index.m_hashFailures.push_back(&record);
      index.m_warnings.push_back(std::string(e.what()) +
                                 " (treated as unique)");
      continue;
    }

    index.m_byHash[record.getHash()].push_back(&record);
    if (sharesName) {
      index.m_byName[record.getName()].push_back(&record);
    }
  }

  // A name whose other members all failed to hash is no longer a group
  for (auto it = index.m_byName.begin(); it != index.m_byName.end();) {
    if (it->second.size() < 2) {
      it = index.m_byName.erase(it);
    } else {
      ++it;
    }
  }

  return index;
}

const FingerprintIndex::Group &
FingerprintIndex::contentGroup(const FileRecord &record) const {
  if (!record.hasHash())
    return kEmptyGroup;
  auto it = m_byHash.find(record.getHash());
  return it == m_byHash.end() ? kEmptyGroup : it->second;
}

const FingerprintIndex::Group &
FingerprintIndex::nameGroup(const FileRecord &record) const {
  auto it = m_byName.find(record.getName());
  if (it == m_byName.end())
    return kEmptyGroup;

  // Failed records are not in the group; do not report one for them
  const auto &group = it->second;
  if (std::find(group.begin(), group.end(), &record) == group.end())
    return kEmptyGroup;
  return group;
}

bool FingerprintIndex::isHashFailure(const FileRecord &record) const {
  return std::find(m_hashFailures.begin(), m_hashFailures.end(), &record) !=
         m_hashFailures.end();
}
