/**
 * @file classifier.hpp
 * @brief Turns the scanned files into a coherent set of proposed actions
 */

#ifndef CLASSIFIER_HPP
#define CLASSIFIER_HPP

#include "config.hpp"
#include "fingerprintindex.hpp"
#include "ifilesystem.hpp"
#include "proposedaction.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @class Classifier
 * @brief Applies the cleanup rules to every FileRecord
 *
 * Rules, in precedence order:
 * 1. EMPTY_FILE: size == 0, delete. Nothing else applies.
 * 2. TEMP_FILE: name ends with a configured temp suffix, delete. Nothing
 *    else applies.
 * 3. DUPLICATE: content shared with other files. One survivor per content
 *    group (canonical root first, then oldest mtime, then smallest path);
 *    every other member is deleted.
 * 4. VERSION_CONFLICT: same base name as other surviving files with
 *    different content. The newest is kept, older ones are deleted. When
 *    the older file is also the surviving copy of differently named
 *    duplicates, those paths are listed in the proposal so the operator
 *    sees that the content goes with it.
 * 5. MOVE_ORIGINAL: a surviving file under a source root moves into the
 *    canonical root.
 * 6. RENAME: troublesome characters are replaced by the substitute.
 * 7. PERMISSIONS: rwx bits differ from the configured value.
 *
 * Rules 5-7 stack on each other but never on a deletion. Destination names
 * for 5 and 6 are allocated by PathAllocator before anything is executed.
 *
 * The classifier only reads the index and the records it is given. The
 * records must be the vector the index was built from.
 *
 * @see FingerprintIndex
 * @see PathAllocator
 */
class Classifier {
private:
  const Config &m_config;
  const FingerprintIndex &m_index;
  const IFileSystem &m_fs;
  std::filesystem::path m_canonicalRoot;

public:
  Classifier(const Config &config, const FingerprintIndex &index,
             const IFileSystem &fs, std::filesystem::path canonicalRoot)
      : m_config(config), m_index(index), m_fs(fs),
        m_canonicalRoot(std::move(canonicalRoot)) {}

  /**
   * @brief Classifies all records
   *
   * A rename or move whose destination directory cannot be inspected is
   * dropped and reported in @p warnings.
   *
   * @return Proposals sorted by DECISION_ORDER, then by path
   */
  std::vector<ProposedAction>
  classify(const std::vector<FileRecord> &records,
           std::vector<std::string> &warnings) const;

  /**
   * @brief Name with troublesome characters replaced
   *
   * Only the stem is rewritten. The extension (last ".suffix") and the
   * leading dot of a hidden file are kept as they are.
   *
   * @return std::nullopt if the name is already clean
   */
  std::optional<std::string> sanitizedName(const std::string &name) const;

  /** @brief Duplicate survivor: canonical, then oldest, then smallest path */
  static const FileRecord *chooseSurvivor(const FingerprintIndex::Group &group);

  /** @brief Version keeper: newest, then canonical, then smallest path */
  static const FileRecord *chooseKeeper(const FingerprintIndex::Group &group);

private:
  /** @brief Paths with the record's content under a different file name */
  std::vector<std::filesystem::path>
  otherNamesWithContent(const FileRecord &record) const;
};

#endif // CLASSIFIER_HPP
