#include "executor.hpp"
#include "errors.hpp"

#include <algorithm>
#include <sstream>

namespace fs = std::filesystem;

std::size_t ExecutionReport::succeeded() const {
  return std::count_if(outcomes.begin(), outcomes.end(),
                       [](const ActionOutcome &o) { return o.success; });
}

std::vector<const ActionOutcome *> ExecutionReport::failures() const {
  std::vector<const ActionOutcome *> failed;
  for (const auto &outcome : outcomes) {
    if (!outcome.success)
      failed.push_back(&outcome);
  }
  return failed;
}

std::vector<const ApprovedAction *>
Executor::executionOrder(const std::vector<ApprovedAction> &approved) {
  std::vector<const ApprovedAction *> ordered;
  ordered.reserve(approved.size());
  for (const auto &a : approved) {
    ordered.push_back(&a);
  }
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const ApprovedAction *a, const ApprovedAction *b) {
                     return executionRank(a->getKind()) <
                            executionRank(b->getKind());
                   });
  return ordered;
}

ExecutionReport Executor::execute(const std::vector<ApprovedAction> &approved) {
  ExecutionReport report;
  m_current.clear();
  m_renamed.clear();

  for (const ApprovedAction *approvedAction : executionOrder(approved)) {
    const ProposedAction &action = approvedAction->action();
    ActionOutcome outcome{action, false, "", {}};

    try {
      outcome.message = apply(action, outcome.finalPath);
      outcome.success = true;
    } catch (const CleanError &e) {
      outcome.message = e.what();
      outcome.finalPath = currentPath(action.getTarget().getPath());
    }

    report.outcomes.push_back(std::move(outcome));
  }

  return report;
}

std::string Executor::apply(const ProposedAction &action, fs::path &finalPath) {
  const fs::path &original = action.getTarget().getPath();
  const fs::path current = currentPath(original);
  std::ostringstream msg;

  switch (action.getKind()) {
  case ActionKind::EmptyFile:
  case ActionKind::TempFile:
    m_fs.remove(current);
    msg << "deleted";
    break;

  case ActionKind::Duplicate: {
    const auto &survivor = action.payload<DuplicatePayload>().survivor;
    requirePresent(survivor, "surviving copy");
    m_fs.remove(current);
    msg << "deleted, copy kept at " << survivor.string();
    break;
  }

  case ActionKind::VersionConflict: {
    const auto &keeper = action.payload<VersionConflictPayload>().keeper;
    requirePresent(keeper, "newer version");
    m_fs.remove(current);
    msg << "deleted, newer version kept at " << keeper.string();
    break;
  }

  case ActionKind::Rename: {
    const auto &destination = action.payload<RenamePayload>().newPath;
    requireAbsent(destination);
    m_fs.rename(current, destination);
    m_current[original] = destination;
    m_renamed.insert(original);
    finalPath = destination;
    msg << "renamed to " << destination.filename().string();
    break;
  }

  case ActionKind::Permissions: {
    const auto &perms = action.payload<PermissionsPayload>();
    m_fs.setPermissions(current, perms.to);
    finalPath = current;
    msg << "permissions set to " << std::oct << perms.to;
    break;
  }

  case ActionKind::MoveOriginal: {
    const auto &move = action.payload<MoveOriginalPayload>();
    fs::path destination = move.destination;
    if (m_renamed.count(original) && move.renamedDestination) {
      destination = *move.renamedDestination;
    }
    requireAbsent(destination);
    m_fs.move(current, destination);
    m_current[original] = destination;
    finalPath = destination;
    msg << "moved to " << destination.string();
    break;
  }
  }

  return msg.str();
}

fs::path Executor::currentPath(const fs::path &original) const {
  auto it = m_current.find(original);
  return it != m_current.end() ? it->second : original;
}

void Executor::requireAbsent(const fs::path &destination) const {
  if (m_fs.stat(destination)) {
    throw ActionError("Destination already exists: " + destination.string());
  }
}

void Executor::requirePresent(const fs::path &path,
                              const std::string &role) const {
  if (!m_fs.stat(path)) {
    throw ActionError("The " + role + " is missing: " + path.string());
  }
}
