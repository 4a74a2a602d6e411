#ifndef FINGERPRINTINDEX_HPP
#define FINGERPRINTINDEX_HPP

#include "config.hpp"
#include "filerecord.hpp"
#include "ihashcalculator.hpp"

#include <map>
#include <string>
#include <vector>

/**
 * @brief Content and name groupings over the complete scan
 *
 * FingerprintIndex groups FileRecords by content hash (duplicate candidates)
 * and by base name (version conflict candidates). It is built once, after the
 * scan has finished, and is read-only afterwards.
 *
 * Hashing is deferred: a file is hashed only when it could take part in a
 * comparison, i.e. it is non-empty, not a temp file, and shares its size or
 * its base name with another such file. Everything else keeps an empty hash.
 *
 * A file whose content cannot be read is listed in hashFailures() and left
 * out of both groupings, so it is treated as unique.
 *
 * @note The index stores pointers into the record vector passed to build().
 *       That vector must outlive the index and must not be resized.
 *
 * Example usage:
 * @code
 * ScanResult scan = scanner.scanRoots(roots);
 * Sha256Hasher hasher(localFs);
 * auto index = FingerprintIndex::build(scan.records, hasher, config);
 * for (const auto& [hash, group] : index.byHash()) {
 *     if (group.size() > 1) { ... }
 * }
 * @endcode
 */
class FingerprintIndex {
public:
  using Group = std::vector<const FileRecord *>;

  /**
   * @brief Hashes the candidate records and builds both groupings
   * @param records Complete scan result (hashes are stored into it)
   * @param hasher Content hash implementation
   * @param config Temp suffixes decide which files are never hashed
   */
  static FingerprintIndex build(std::vector<FileRecord> &records,
                                const IHashCalculator &hasher,
                                const Config &config);

  /** @brief hash -> records with that content (only hashed records) */
  const std::map<std::string, Group> &byHash() const { return m_byHash; }

  /** @brief base name -> records sharing that name (groups of two or more) */
  const std::map<std::string, Group> &byName() const { return m_byName; }

  /** @brief Members of the record's content group, including itself */
  const Group &contentGroup(const FileRecord &record) const;

  /** @brief Members of the record's name group, including itself */
  const Group &nameGroup(const FileRecord &record) const;

  const std::vector<const FileRecord *> &hashFailures() const {
    return m_hashFailures;
  }

  bool isHashFailure(const FileRecord &record) const;

  /** @brief One message per file that could not be hashed */
  const std::vector<std::string> &warnings() const { return m_warnings; }

  /** @brief Number of files whose content was read */
  std::size_t hashedCount() const { return m_hashedCount; }

private:
  std::map<std::string, Group> m_byHash;
  std::map<std::string, Group> m_byName;
  std::vector<const FileRecord *> m_hashFailures;
  std::vector<std::string> m_warnings;
  std::size_t m_hashedCount = 0;
};

#endif // FINGERPRINTINDEX_HPP
