/**
 * @file uicontrol.hpp
 * @brief Menu actions and keyboard shortcuts of the terminal UI
 *
 * Central mapping between:
 * - Action identifiers (ActionID enum)
 * - Keyboard shortcuts (single character keys)
 * - Menu display strings (with shortcut hints)
 *
 * The answer keys of the per-action dialog (y, n, a, s) are handled by
 * parseAnswerKey() in utils.hpp and are not menu actions.
 */

#ifndef UI_CONTROL_HPP
#define UI_CONTROL_HPP

#include <map>
#include <string>
#include <vector>

/**
 * @struct ActionInfo
 * @brief Shortcut and menu title of one UI action
 */
struct ActionInfo {
  /** @brief Single character keyboard shortcut for this action */
  char m_shortcut;

  /** @brief Menu title including the shortcut hint (e.g., "(q) Quit") */
  std::string m_menu_title;
};

/**
 * @enum ActionID
 * @brief Actions available from the top menu
 */
enum class ActionID {
  /** @brief Walk through the proposals and apply the approved ones ('x') */
  ReviewAndApply,

  /** @brief Toggle between full paths and root-relative paths ('p') */
  TogglePaths,

  /** @brief Leave the UI; before execution nothing is changed ('q') */
  Quit
};

/**
 * @brief Global mapping of actions to their shortcuts and menu titles
 *
 * @note Shortcuts are case-sensitive
 */
inline const std::map<ActionID, ActionInfo> ActionMap = {
    {ActionID::ReviewAndApply, {'x', "(x) Review & Apply"}},
    {ActionID::TogglePaths, {'p', "(p) Full Paths"}},
    {ActionID::Quit, {'q', "(q) Quit"}}};

/**
 * @brief Menu titles from ActionMap, in ActionID order
 */
inline std::vector<std::string> getMenuEntries() {
  std::vector<std::string> entries;
  entries.reserve(ActionMap.size());
  for (const auto &[id, info] : ActionMap) {
    entries.push_back(info.m_menu_title);
  }
  return entries;
}

#endif // UI_CONTROL_HPP
