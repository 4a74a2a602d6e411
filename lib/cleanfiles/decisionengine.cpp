#include "decisionengine.hpp"

#include <algorithm>

std::vector<ProposedAction> DecisionEngine::presentationOrder(
    const std::vector<ProposedAction> &proposals) {
  std::vector<ProposedAction> ordered = proposals;
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const ProposedAction &a, const ProposedAction &b) {
                     return decisionRank(a.getKind()) < decisionRank(b.getKind());
                   });
  return ordered;
}

DecisionResult DecisionEngine::decide(const std::vector<ProposedAction> &proposals,
                                      DecisionState &state) {
  DecisionResult result;
  std::vector<ProposedAction> ordered = presentationOrder(proposals);

  for (std::size_t i = 0; i < ordered.size(); ++i) {
    const ProposedAction &action = ordered[i];
    const auto slot = static_cast<std::size_t>(action.getKind());
    bool approve = false;

    switch (state.get(action.getKind())) {
    case DecisionMode::AlwaysYes:
      approve = true;
      m_prompter.autoResolved(action, true);
      break;

    case DecisionMode::AlwaysNo:
      approve = false;
      m_prompter.autoResolved(action, false);
      break;

    case DecisionMode::Unset:
      ++result.summary.prompts;
      switch (m_prompter.ask(action, i + 1, ordered.size())) {
      case Answer::Yes:
        approve = true;
        break;
      case Answer::No:
        approve = false;
        break;
      case Answer::YesToAll:
        approve = true;
        state.set(action.getKind(), DecisionMode::AlwaysYes);
        break;
      case Answer::NoToAll:
        approve = false;
        state.set(action.getKind(), DecisionMode::AlwaysNo);
        break;
      }
      break;
    }

    if (approve) {
      result.approved.push_back(ApprovedAction(action));
      ++result.summary.approved[slot];
    } else {
      ++result.summary.rejected[slot];
    }
  }

  return result;
}
