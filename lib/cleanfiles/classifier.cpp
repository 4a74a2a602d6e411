/**
 * @file classifier.cpp
 * @brief Implementation of the classification rules
 *
 * classify() runs in two passes. The first decides every removal (empty,
 * temp, duplicate, older version) so that the second pass knows which files
 * survive and which paths are about to become free. The second pass then
 * allocates rename and move destinations for the survivors in path order
 * and adds permission fixes.
 */

#include "classifier.hpp"
#include "pathallocator.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <unordered_set>

namespace fs = std::filesystem;

std::vector<ProposedAction>
Classifier::classify(const std::vector<FileRecord> &records,
                     std::vector<std::string> &warnings) const {
  std::vector<ProposedAction> proposals;
  std::unordered_set<const FileRecord *> removed;

  // Rules 1 and 2: trivially removable files; they are never hashed
  for (const auto &record : records) {
    if (record.zeroFile()) {
      proposals.emplace_back(ActionKind::EmptyFile, record, EmptyFilePayload{});
      removed.insert(&record);
    } else if (auto suffix = m_config.matchTempSuffix(record.getName())) {
      proposals.emplace_back(ActionKind::TempFile, record,
                             TempFilePayload{*suffix});
      removed.insert(&record);
    }
  }

  // Rule 3: one survivor per content group
  for (const auto &[hash, group] : m_index.byHash()) {
    if (group.size() < 2)
      continue;

    const FileRecord *survivor = chooseSurvivor(group);
    for (const FileRecord *member : group) {
      if (member == survivor)
        continue;
      proposals.emplace_back(ActionKind::Duplicate, *member,
                             DuplicatePayload{survivor->getPath()});
      removed.insert(member);
    }
  }

  // Rule 4: among same-named survivors (all different content by now),
  // keep the newest
  for (const auto &[name, group] : m_index.byName()) {
    FingerprintIndex::Group remaining;
    std::copy_if(group.begin(), group.end(), std::back_inserter(remaining),
                 [&removed](const FileRecord *r) { return !removed.count(r); });
    if (remaining.size() < 2)
      continue;

    const FileRecord *keeper = chooseKeeper(remaining);
    for (const FileRecord *member : remaining) {
      if (member == keeper)
        continue;
      VersionConflictPayload conflict;
      conflict.keeper = keeper->getPath();
      conflict.alsoKeeps = otherNamesWithContent(*member);
      proposals.emplace_back(ActionKind::VersionConflict, *member,
                             std::move(conflict));
      removed.insert(member);
    }
  }

  // Rules 5-7 for every surviving file, in path order so allocation is
  // deterministic
  std::set<fs::path> pendingRemovals;
  for (const FileRecord *r : removed) {
    pendingRemovals.insert(r->getPath());
  }
  PathAllocator allocator(m_fs, std::move(pendingRemovals));

  std::vector<const FileRecord *> survivors;
  for (const auto &record : records) {
    if (!removed.count(&record))
      survivors.push_back(&record);
  }
  std::sort(survivors.begin(), survivors.end(),
            [](const FileRecord *a, const FileRecord *b) {
              return a->getPath().string() < b->getPath().string();
            });

  for (const FileRecord *record : survivors) {
    std::optional<fs::path> renamed;
    if (auto newName = sanitizedName(record->getName())) {
      renamed = allocator.allocate(record->getDir(), *newName);
      if (renamed) {
        proposals.emplace_back(ActionKind::Rename, *record,
                               RenamePayload{*renamed});
      } else {
        warnings.push_back("No free name for " + *newName + " in " +
                           record->getDir().string() + ", rename skipped");
      }
    }

    if (!record->isCanonical()) {
      MoveOriginalPayload move;
      auto destination = allocator.allocate(m_canonicalRoot, record->getName());
      std::optional<fs::path> renamedDestination;
      if (destination && renamed) {
        // the file arrives under the name its rename was given
        renamedDestination =
            allocator.allocate(m_canonicalRoot, renamed->filename().string());
      }

      if (destination && (!renamed || renamedDestination)) {
        move.destination = *destination;
        move.renamedDestination = renamedDestination;
        proposals.emplace_back(ActionKind::MoveOriginal, *record,
                               std::move(move));
      } else {
        warnings.push_back("No free name in " + m_canonicalRoot.string() +
                           " for " + record->getPath().string() +
                           ", move skipped");
      }
    }

    if (record->getPermissions() != m_config.suggestedPermissions) {
      proposals.emplace_back(
          ActionKind::Permissions, *record,
          PermissionsPayload{record->getPermissions(),
                             m_config.suggestedPermissions});
    }
  }

  std::stable_sort(proposals.begin(), proposals.end(),
                   [](const ProposedAction &a, const ProposedAction &b) {
                     auto ra = decisionRank(a.getKind());
                     auto rb = decisionRank(b.getKind());
                     if (ra != rb)
                       return ra < rb;
                     return a.getTarget().getPath().string() <
                            b.getTarget().getPath().string();
                   });
  return proposals;
}

std::optional<std::string>
Classifier::sanitizedName(const std::string &name) const {
  fs::path p(name);
  std::string stem = p.stem().string();
  std::string ext = p.extension().string();

  // Only the stem is rewritten; the leading dot of a hidden file stays
  std::size_t from = (!stem.empty() && stem[0] == '.') ? 1 : 0;
  for (std::size_t i = from; i < stem.size(); ++i) {
    if (m_config.isTroublesome(stem[i]))
      stem[i] = m_config.substitute;
  }

  std::string result = stem + ext;
  if (result == name)
    return std::nullopt;
  return result;
}

const FileRecord *
Classifier::chooseSurvivor(const FingerprintIndex::Group &group) {
  return *std::min_element(
      group.begin(), group.end(), [](const FileRecord *a, const FileRecord *b) {
        if (a->isCanonical() != b->isCanonical())
          return a->isCanonical();
        if (a->getMtime() != b->getMtime())
          return a->getMtime() < b->getMtime();
        return a->getPath().string() < b->getPath().string();
      });
}

const FileRecord *
Classifier::chooseKeeper(const FingerprintIndex::Group &group) {
  return *std::min_element(
      group.begin(), group.end(), [](const FileRecord *a, const FileRecord *b) {
        if (a->getMtime() != b->getMtime())
          return a->getMtime() > b->getMtime();
        if (a->isCanonical() != b->isCanonical())
          return a->isCanonical();
        return a->getPath().string() < b->getPath().string();
      });
}

std::vector<fs::path>
Classifier::otherNamesWithContent(const FileRecord &record) const {
  std::vector<fs::path> others;
  for (const FileRecord *other : m_index.contentGroup(record)) {
    if (other->getName() != record.getName())
      others.push_back(other->getPath());
  }
  return others;
}
