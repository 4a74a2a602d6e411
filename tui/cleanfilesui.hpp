/**
 * @file cleanfilesui.hpp
 * @brief Terminal user interface for a cleanup run using FTXUI
 *
 * Key features:
 * - Asynchronous analysis with a spinner and a live file count
 * - Color-coded list of the proposed actions
 * - Confirmation dialog per action with "all of this kind" shortcuts
 * - Execution report with per-action success or failure
 *
 * @see CleanRun
 * @see DecisionEngine
 */

#ifndef CLEANFILESUI_HPP
#define CLEANFILESUI_HPP

#include "cleanrun.hpp"
#include "uicontrol.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <atomic>
#include <future>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "utils.hpp"

using namespace ftxui;

/**
 * @class CleanFilesUI
 * @brief Full-screen front-end driving one CleanRun
 *
 * The UI goes through three phases:
 * - Loading: CleanRun::analyze() runs in a background thread
 * - Review: the proposals are listed; 'x' starts the decisions
 * - Done: the execution report is listed
 *
 * The UI is itself the IDecisionPrompter of the run: every prompt opens a
 * modal dialog with the keys y, n, a and s (ESC answers n). Quitting before
 * 'x' leaves the filesystem untouched.
 */
class CleanFilesUI : public IDecisionPrompter {
private:
  enum class Phase { Loading, Review, Done };

  CleanRun &m_run;
  bool m_assume_yes;
  bool m_dry_run;

  Phase m_phase = Phase::Loading;

  // ===== List State =====

  /** @brief Index of the selected list entry */
  int m_selected = 0;

  /** @brief Show absolute paths instead of root-relative ones */
  bool m_show_full_paths = false;

  /** @brief Rendered list entries (proposals or outcomes) */
  std::vector<std::string> m_entries;

  /** @brief Color of each entry, same index as m_entries */
  std::vector<Color> m_entry_colors;

  /** @brief Title above the list */
  std::string m_panel_title;

  std::string m_current_status = "Ready.";

  /** @brief Exit code reported by exitCode() */
  int m_exit_code = 0;

  // ===== Results =====

  DecisionSummary m_decision_summary;
  std::optional<ExecutionReport> m_report;
  CleanupReport m_cleanup;

  // ===== UI Components =====

  Component m_top_menu;
  Component m_menu;
  Component m_main_view;
  Component m_document;

  std::vector<std::string> m_menu_entries;
  int m_top_menu_selected = 0;

  /** @brief FTXUI fullscreen terminal screen instance */
  ScreenInteractive m_screen = ScreenInteractive::Fullscreen();

  // ===== Threading and Async Operations =====

  std::future<void> m_analyze_future;
  std::atomic<bool> m_loading{false};

  /** @brief Files found so far, incremented by the scanner threads */
  std::atomic<int> m_scanned_count{0};

  std::thread m_animation_thread;
  std::atomic<bool> m_animating{false};

  // ===== Setup =====

  void setupTopMenu();
  void setupListPanel();
  void setupMainLayout();

  /**
   * @brief Renderer for the list panel (spinner while loading)
   */
  Component createListPanel();

  // ===== Phases =====

  /**
   * @brief Starts CleanRun::analyze() in a background thread
   *
   * Results are handed to the UI thread with ScreenInteractive::Post().
   */
  void analyzeAsync();

  /** @brief Fills the list with the proposals */
  void showProposals();

  /**
   * @brief Runs decisions, execution and cleanup, then shows the report
   *
   * Runs on the UI thread; prompts open nested dialog screens.
   */
  void reviewAndApply();

  /** @brief Fills the list with the execution report */
  void showReport();

  /** @brief Rebuilds m_entries for the current phase and path mode */
  void rebuildEntries();

  bool handleGlobalShortcut(char key);
  ActionID getActionIdByIndex(int index) const;

  std::string labelFor(const FileRecord &record) const;
  static Color kindColor(ActionKind kind);

  // ===== Animation Thread =====

  void startAnimation();
  void stopAnimation();

public:
  /**
   * @param run The run to drive; must outlive the UI
   * @param assumeYes Approve everything without dialogs
   * @param dryRun Only list the proposals
   */
  CleanFilesUI(CleanRun &run, bool assumeYes, bool dryRun)
      : m_run(run), m_assume_yes(assumeYes), m_dry_run(dryRun) {}

  ~CleanFilesUI();

  /**
   * @brief Builds the components and starts the analysis
   *
   * Must be called before run().
   */
  void initialize();

  /**
   * @brief Blocking FTXUI loop; returns when the user quits
   */
  void run();

  int exitCode() const { return m_exit_code; }

  /** @brief Opens the confirmation dialog for one action */
  Answer ask(const ProposedAction &action, std::size_t position,
             std::size_t total) override;
};

#endif // CLEANFILESUI_HPP
