/**
 * @file executor.hpp
 * @brief Applies approved actions to the filesystem
 */

#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP

#include "ifilesystem.hpp"
#include "proposedaction.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Result of one applied (or attempted) action
 */
struct ActionOutcome {
  ProposedAction action;
  bool success = false;
  /** @brief What happened, or why it failed */
  std::string message;
  /** @brief Where the file lives after the action (empty once deleted) */
  std::filesystem::path finalPath;
};

/**
 * @brief Everything the Executor did, in execution order
 */
struct ExecutionReport {
  std::vector<ActionOutcome> outcomes;

  std::size_t succeeded() const;
  std::vector<const ActionOutcome *> failures() const;
};

/**
 * @class Executor
 * @brief Applies ApprovedActions in EXECUTION_ORDER
 *
 * Deletions run first, then renames, then permission changes, then moves, so
 * a file is chmod'ed and moved under its new name. Each action is applied on
 * its own: a failure is recorded in the report and the next action runs.
 * Nothing is retried or rolled back.
 *
 * Renames and moves never overwrite. If the destination exists at execution
 * time the action fails.
 */
class Executor {
private:
  IFileSystem &m_fs;

  /** @brief Original path -> current path for files relocated in this run */
  std::map<std::filesystem::path, std::filesystem::path> m_current;
  /** @brief Original paths whose RENAME was applied */
  std::set<std::filesystem::path> m_renamed;

public:
  explicit Executor(IFileSystem &fs) : m_fs(fs) {}

  /**
   * @brief Runs all actions
   * @param approved Actions in any order; they are re-ordered here
   */
  ExecutionReport execute(const std::vector<ApprovedAction> &approved);

  /** @brief Approved actions sorted by EXECUTION_ORDER (stable per kind) */
  static std::vector<const ApprovedAction *>
  executionOrder(const std::vector<ApprovedAction> &approved);

private:
  /**
   * @brief Applies one action
   * @return Outcome message
   * @throws CleanError on failure
   */
  std::string apply(const ProposedAction &action,
                    std::filesystem::path &finalPath);

  std::filesystem::path currentPath(const std::filesystem::path &original) const;

  void requireAbsent(const std::filesystem::path &destination) const;
  void requirePresent(const std::filesystem::path &path,
                      const std::string &role) const;
};

#endif // EXECUTOR_HPP
