/**
 * @file decisionengine.hpp
 * @brief Operator confirmation with "apply to all of this type" shortcuts
 */

#ifndef DECISIONENGINE_HPP
#define DECISIONENGINE_HPP

#include "proposedaction.hpp"

#include <array>
#include <cstddef>
#include <vector>

/**
 * @enum DecisionMode
 * @brief Standing decision for one action kind
 */
enum class DecisionMode { Unset, AlwaysYes, AlwaysNo };

/**
 * @brief Standing decisions of one run, one entry per ActionKind
 *
 * Created fresh for each run and passed to DecisionEngine::decide(); nothing
 * survives the run.
 */
class DecisionState {
private:
  std::array<DecisionMode, ACTION_KIND_COUNT> m_modes{};

public:
  DecisionMode get(ActionKind kind) const {
    return m_modes[static_cast<std::size_t>(kind)];
  }

  void set(ActionKind kind, DecisionMode mode) {
    m_modes[static_cast<std::size_t>(kind)] = mode;
  }

  /** @brief Every kind preset to AlwaysYes (non-interactive runs) */
  static DecisionState approveAll() {
    DecisionState state;
    state.m_modes.fill(DecisionMode::AlwaysYes);
    return state;
  }
};

/**
 * @enum Answer
 * @brief Operator response to a single prompt
 */
enum class Answer {
  Yes,      ///< approve this action only
  No,       ///< reject this action only
  YesToAll, ///< approve this and every later action of the same kind
  NoToAll   ///< reject this and every later action of the same kind
};

/**
 * @brief Front-end hook that asks the operator about one action
 */
class IDecisionPrompter {
public:
  virtual ~IDecisionPrompter() = default;

  /**
   * @param action The action awaiting a decision
   * @param position 1-based index in the ordered proposal list
   * @param total Number of proposals in the run
   */
  virtual Answer ask(const ProposedAction &action, std::size_t position,
                     std::size_t total) = 0;

  /** @brief Called instead of ask() when a standing decision applies */
  virtual void autoResolved(const ProposedAction &, bool /*approved*/) {}
};

/**
 * @brief Per-kind counters of one decide() call
 */
struct DecisionSummary {
  std::array<std::size_t, ACTION_KIND_COUNT> approved{};
  std::array<std::size_t, ACTION_KIND_COUNT> rejected{};
  std::size_t prompts = 0;

  std::size_t approvedCount(ActionKind kind) const {
    return approved[static_cast<std::size_t>(kind)];
  }
  std::size_t rejectedCount(ActionKind kind) const {
    return rejected[static_cast<std::size_t>(kind)];
  }
};

struct DecisionResult {
  /** @brief Accepted actions in presentation order */
  std::vector<ApprovedAction> approved;
  DecisionSummary summary;
};

/**
 * @class DecisionEngine
 * @brief Sequential confirmation loop over the proposals
 *
 * Proposals are presented grouped by kind in DECISION_ORDER (stable within a
 * kind). For each one the standing decision of its kind is checked first:
 * AlwaysYes/AlwaysNo resolve it without a prompt. Otherwise the prompter is
 * asked; YesToAll and NoToAll also fix the standing decision, so that kind
 * is never prompted again in this run.
 *
 * Rejecting everything is the way to cancel a run before execution.
 */
class DecisionEngine {
private:
  IDecisionPrompter &m_prompter;

public:
  explicit DecisionEngine(IDecisionPrompter &prompter) : m_prompter(prompter) {}

  DecisionResult decide(const std::vector<ProposedAction> &proposals,
                        DecisionState &state);

  /** @brief Proposals in presentation order */
  static std::vector<ProposedAction>
  presentationOrder(const std::vector<ProposedAction> &proposals);
};

#endif // DECISIONENGINE_HPP
