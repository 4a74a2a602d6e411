/**
 * @file proposedaction.hpp
 * @brief Classification outcomes and the kind tables that order them
 */

#ifndef PROPOSEDACTION_HPP
#define PROPOSEDACTION_HPP

#include "filerecord.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * @enum ActionKind
 * @brief What the classifier proposes for a file
 *
 * The numeric order matches the alternatives of ActionPayload.
 */
enum class ActionKind {
  EmptyFile,
  TempFile,
  Duplicate,
  VersionConflict,
  Rename,
  Permissions,
  MoveOriginal
};

inline constexpr std::size_t ACTION_KIND_COUNT = 7;

/**
 * @brief Order in which kinds are presented to the operator
 *
 * Follows the classification precedence: removals first, then relocation,
 * then the independent name and permission fixes.
 */
inline constexpr std::array<ActionKind, ACTION_KIND_COUNT> DECISION_ORDER = {
    ActionKind::EmptyFile,   ActionKind::TempFile,     ActionKind::Duplicate,
    ActionKind::VersionConflict, ActionKind::MoveOriginal, ActionKind::Rename,
    ActionKind::Permissions};

/**
 * @brief Order in which kinds are applied to the filesystem
 *
 * delete -> rename -> chmod -> move. Renames run before moves so a file that
 * gets both arrives in the canonical directory under its new name; chmod
 * runs after the rename so it follows the file to its new path.
 */
inline constexpr std::array<ActionKind, ACTION_KIND_COUNT> EXECUTION_ORDER = {
    ActionKind::EmptyFile,   ActionKind::TempFile, ActionKind::Duplicate,
    ActionKind::VersionConflict, ActionKind::Rename, ActionKind::Permissions,
    ActionKind::MoveOriginal};

struct EmptyFilePayload {};

struct TempFilePayload {
  std::string suffix;
};

struct DuplicatePayload {
  std::filesystem::path survivor;
};

struct VersionConflictPayload {
  std::filesystem::path keeper;
  /** @brief Duplicates under other names whose only remaining copy this is */
  std::vector<std::filesystem::path> alsoKeeps;
};

struct RenamePayload {
  std::filesystem::path newPath;
};

struct PermissionsPayload {
  unsigned from = 0;
  unsigned to = 0;
};

struct MoveOriginalPayload {
  /** @brief Destination keeping the current file name */
  std::filesystem::path destination;
  /** @brief Destination to use when the file's RENAME was applied first */
  std::optional<std::filesystem::path> renamedDestination;
};

using ActionPayload =
    std::variant<EmptyFilePayload, TempFilePayload, DuplicatePayload,
                 VersionConflictPayload, RenamePayload, PermissionsPayload,
                 MoveOriginalPayload>;

/**
 * @brief One classification outcome for one file
 *
 * The payload alternative must match the kind; the constructor rejects a
 * mismatch or an incomplete payload with std::invalid_argument.
 */
class ProposedAction {
private:
  ActionKind m_kind;
  FileRecord m_target;
  ActionPayload m_payload;

public:
  ProposedAction(ActionKind kind, const FileRecord &target,
                 ActionPayload data);

  ActionKind getKind() const { return m_kind; }
  const FileRecord &getTarget() const { return m_target; }
  const ActionPayload &getPayload() const { return m_payload; }

  /** @brief Typed payload access; the kind must match */
  template <typename T> const T &payload() const {
    return std::get<T>(m_payload);
  }

  /** @brief One-line explanation, e.g. "identical to /x/a.txt" */
  std::string describe() const;
};

/**
 * @brief A ProposedAction accepted by the operator
 *
 * Only DecisionEngine creates these.
 */
class ApprovedAction {
private:
  ProposedAction m_action;

  explicit ApprovedAction(ProposedAction action) : m_action(std::move(action)) {}

  friend class DecisionEngine;

public:
  const ProposedAction &action() const { return m_action; }
  ActionKind getKind() const { return m_action.getKind(); }
};

/** @brief "EMPTY_FILE", "TEMP_FILE", ... */
std::string actionKindName(ActionKind kind);

/** @brief True for kinds that delete the file */
bool isRemoval(ActionKind kind);

/** @brief Position of a kind in DECISION_ORDER */
std::size_t decisionRank(ActionKind kind);

/** @brief Position of a kind in EXECUTION_ORDER */
std::size_t executionRank(ActionKind kind);

#endif // PROPOSEDACTION_HPP
