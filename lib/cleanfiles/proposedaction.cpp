#include "proposedaction.hpp"
#include "config.hpp"

#include <algorithm>
#include <stdexcept>

ProposedAction::ProposedAction(ActionKind kind, const FileRecord &target,
                               ActionPayload data)
    : m_kind(kind), m_target(target), m_payload(std::move(data)) {
  if (m_payload.index() != static_cast<std::size_t>(kind)) {
    throw std::invalid_argument("Payload does not match action kind " +
                                actionKindName(kind) + " for " +
                                target.getPath().string());
  }

  switch (kind) {
  case ActionKind::Duplicate:
    if (payload<DuplicatePayload>().survivor.empty() ||
        payload<DuplicatePayload>().survivor == target.getPath()) {
      throw std::invalid_argument("DUPLICATE needs a survivor other than " +
                                  target.getPath().string());
    }
    break;
  case ActionKind::VersionConflict:
    if (payload<VersionConflictPayload>().keeper.empty() ||
        payload<VersionConflictPayload>().keeper == target.getPath()) {
      throw std::invalid_argument("VERSION_CONFLICT needs a keeper other than " +
                                  target.getPath().string());
    }
    break;
  case ActionKind::Rename: {
    const auto &to = payload<RenamePayload>().newPath;
    if (to.parent_path() != target.getDir() || to == target.getPath()) {
      throw std::invalid_argument("RENAME must change the name within " +
                                  target.getDir().string());
    }
    break;
  }
  case ActionKind::Permissions:
    if (payload<PermissionsPayload>().to > 0777) {
      throw std::invalid_argument("PERMISSIONS bits out of range");
    }
    break;
  case ActionKind::MoveOriginal:
    if (payload<MoveOriginalPayload>().destination.empty()) {
      throw std::invalid_argument("MOVE_ORIGINAL needs a destination");
    }
    break;
  case ActionKind::EmptyFile:
  case ActionKind::TempFile:
    break;
  }
}

std::string ProposedAction::describe() const {
  switch (m_kind) {
  case ActionKind::EmptyFile:
    return "empty file (size = 0)";
  case ActionKind::TempFile:
    return "temporary file (" + payload<TempFilePayload>().suffix + ")";
  case ActionKind::Duplicate:
    return "identical content, original: " +
           payload<DuplicatePayload>().survivor.string();
  case ActionKind::VersionConflict: {
    const auto &p = payload<VersionConflictPayload>();
    std::string text = "older version, newest: " + p.keeper.string();
    if (!p.alsoKeeps.empty()) {
      text += "; last copy of the content of";
      for (const auto &other : p.alsoKeeps) {
        text += " " + other.string();
      }
    }
    return text;
  }
  case ActionKind::Rename:
    return "troublesome characters, new name: " +
           payload<RenamePayload>().newPath.filename().string();
  case ActionKind::Permissions: {
    const auto &p = payload<PermissionsPayload>();
    return "permissions " + ConfigLoader::formatPermissions(p.from) + " -> " +
           ConfigLoader::formatPermissions(p.to);
  }
  case ActionKind::MoveOriginal:
    return "original outside canonical directory, move to: " +
           payload<MoveOriginalPayload>().destination.string();
  }
  return "unknown action";
}

std::string actionKindName(ActionKind kind) {
  switch (kind) {
  case ActionKind::EmptyFile:
    return "EMPTY_FILE";
  case ActionKind::TempFile:
    return "TEMP_FILE";
  case ActionKind::Duplicate:
    return "DUPLICATE";
  case ActionKind::VersionConflict:
    return "VERSION_CONFLICT";
  case ActionKind::Rename:
    return "RENAME";
  case ActionKind::Permissions:
    return "PERMISSIONS";
  case ActionKind::MoveOriginal:
    return "MOVE_ORIGINAL";
  }
  return "UNKNOWN";
}

bool isRemoval(ActionKind kind) {
  return kind == ActionKind::EmptyFile || kind == ActionKind::TempFile ||
         kind == ActionKind::Duplicate || kind == ActionKind::VersionConflict;
}

std::size_t decisionRank(ActionKind kind) {
  return static_cast<std::size_t>(
      std::find(DECISION_ORDER.begin(), DECISION_ORDER.end(), kind) -
      DECISION_ORDER.begin());
}

std::size_t executionRank(ActionKind kind) {
  return static_cast<std::size_t>(
      std::find(EXECUTION_ORDER.begin(), EXECUTION_ORDER.end(), kind) -
      EXECUTION_ORDER.begin());
}
