/**
 * @file cleanfilesui.cpp
 * @brief Implementation of the FTXUI front-end
 */

#include "cleanfilesui.hpp"

#include <ftxui/screen/terminal.hpp>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

CleanFilesUI::~CleanFilesUI() {
  if (m_analyze_future.valid()) {
    m_analyze_future.wait();
  }
  stopAnimation();
}

// ============================================================================
// ANALYSIS
// ============================================================================

/**
 * @brief Starts the analysis of all roots in a background thread
 *
 * The scanner threads increment m_scanned_count, which the loading panel
 * shows while the spinner runs. When analyze() returns, the proposals are
 * handed to the UI thread via Post().
 *
 * @see showProposals()
 */
void CleanFilesUI::analyzeAsync() {
  m_phase = Phase::Loading;
  m_loading = true;
  m_scanned_count = 0;
  m_panel_title = "Analyzing...";
  m_run.setProgressCounter(&m_scanned_count);

  startAnimation();

  m_analyze_future = std::async(std::launch::async, [this]() {
    try {
      m_run.analyze();

      m_screen.Post([this]() {
        m_loading = false;
        stopAnimation();
        showProposals();
      });
    } catch (const std::exception &e) {
      std::string message = e.what();
      m_screen.Post([this, message]() {
        m_loading = false;
        stopAnimation();
        m_phase = Phase::Done;
        m_exit_code = 1;
        m_current_status = "✗ Analysis failed: " + message;
      });
    }
  });
}

void CleanFilesUI::showProposals() {
  m_phase = Phase::Review;
  m_selected = 0;
  rebuildEntries();

  const auto &scan = m_run.scan();
  const auto &proposals = m_run.proposals();
  m_panel_title = std::to_string(proposals.size()) + " proposed actions, " +
                  std::to_string(scan.records.size()) + " files scanned";

  if (scan.readableRoots == 0) {
    m_phase = Phase::Done;
    m_exit_code = 1;
    m_current_status = "✗ None of the directories could be read.";
  } else if (proposals.empty()) {
    m_current_status = "✓ Nothing to do. Everything is in order.";
  } else if (m_dry_run) {
    m_current_status = "Dry run: nothing will be changed. (q) Quit";
  } else {
    m_current_status = "(x) review and apply, (q) quit without changes";
  }
}

// ============================================================================
// DECISIONS AND EXECUTION
// ============================================================================

/**
 * @brief Asks about every proposal, applies the approved ones and prunes
 *
 * With --yes every kind is preset to AlwaysYes and no dialog is shown.
 * When nothing is approved the filesystem is left alone and the UI stays in
 * the review phase.
 */
void CleanFilesUI::reviewAndApply() {
  if (m_phase == Phase::Loading) {
    m_current_status = "Still analyzing...";
    return;
  }
  if (m_phase == Phase::Done) {
    m_current_status = "Run finished. (q) Quit";
    return;
  }
  if (m_dry_run) {
    m_current_status = "Dry run: nothing is applied.";
    return;
  }
  if (m_run.proposals().empty()) {
    m_current_status = "Nothing to do.";
    return;
  }

  DecisionState state =
      m_assume_yes ? DecisionState::approveAll() : DecisionState();
  DecisionResult decision = m_run.decide(*this, state);
  m_decision_summary = decision.summary;

  if (decision.approved.empty()) {
    m_current_status = "Nothing approved. No changes made.";
    return;
  }

  m_report = m_run.execute(decision.approved);
  m_cleanup = m_run.cleanup();
  showReport();
}

void CleanFilesUI::showReport() {
  m_phase = Phase::Done;
  m_selected = 0;
  rebuildEntries();

  std::size_t approved = 0;
  std::size_t rejected = 0;
  for (ActionKind kind : DECISION_ORDER) {
    approved += m_decision_summary.approvedCount(kind);
    rejected += m_decision_summary.rejectedCount(kind);
  }

  m_panel_title = "Execution report (" + std::to_string(approved) +
                  " approved, " + std::to_string(rejected) + " rejected)";

  auto failures = m_report ? m_report->failures().size() : 0;
  auto succeeded = m_report ? m_report->succeeded() : 0;
  m_current_status = std::to_string(succeeded) + " applied, " +
                     std::to_string(failures) + " failed, " +
                     std::to_string(m_cleanup.removed.size()) +
                     " empty directories removed. (q) Quit";
}

void CleanFilesUI::rebuildEntries() {
  m_entries.clear();
  m_entry_colors.clear();

  auto add = [this](const std::string &label, Color c) {
    m_entries.push_back(label);
    m_entry_colors.push_back(c);
  };

  if (m_phase == Phase::Review) {
    for (const auto &warning : m_run.warnings()) {
      add("⚠️ " + warning, Color::Magenta);
    }
    for (const auto &action : m_run.proposals()) {
      std::ostringstream label;
      label << std::left << std::setw(17) << actionKindName(action.getKind())
            << labelFor(action.getTarget()) << "  " << action.describe();
      add(label.str(), kindColor(action.getKind()));
    }
  } else if (m_phase == Phase::Done && m_report) {
    for (const auto &outcome : m_report->outcomes) {
      std::ostringstream label;
      label << (outcome.success ? "✓ " : "✗ ") << std::left << std::setw(17)
            << actionKindName(outcome.action.getKind())
            << labelFor(outcome.action.getTarget()) << "  " << outcome.message;
      add(label.str(), outcome.success ? Color::Green : Color::Red);
    }
    for (const auto &dir : m_cleanup.removed) {
      add("✓ removed empty directory " + dir.string(), Color::GrayLight);
    }
    for (const auto &warning : m_cleanup.warnings) {
      add("⚠️ " + warning, Color::Yellow);
    }
  }

  if (m_selected >= static_cast<int>(m_entries.size())) {
    m_selected = std::max(0, static_cast<int>(m_entries.size()) - 1);
  }
}

/**
 * @brief Modal confirmation dialog for one action
 *
 * Keys:
 * - 'y' approve, 'n' or ESC reject
 * - 'a' approve this and all further actions of this kind
 * - 's' reject this and all further actions of this kind
 */
Answer CleanFilesUI::ask(const ProposedAction &action, std::size_t position,
                         std::size_t total) {
  Answer answer = Answer::No;
  auto dialog_screen = ScreenInteractive::TerminalOutput();
  const FileRecord &target = action.getTarget();

  auto dialog_renderer = Renderer([&] {
    std::vector<Element> content = {
        text(actionKindName(action.getKind()) + "  [" +
             std::to_string(position) + "/" + std::to_string(total) + "]") |
            bold | color(kindColor(action.getKind())) | hcenter,
        separator(),
        text("File: " + target.getPath().string()) | color(Color::Yellow),
        text("Size: " + formatBytes(target.getFileSize())),
        text(action.describe())};

    if (isRemoval(action.getKind())) {
      content.push_back(separator());
      content.push_back(text("The file will be DELETED") | color(Color::Red) |
                        bold);
    }

    content.push_back(separator());
    content.push_back(
        hbox({text("'y'") | bold | color(Color::Green),
              text(" yes   ") | color(Color::GrayLight),
              text("'n'") | bold | color(Color::Red),
              text(" no   ") | color(Color::GrayLight),
              text("'a'") | bold | color(Color::Green),
              text(" all of this kind   ") | color(Color::GrayLight),
              text("'s'") | bold | color(Color::Red),
              text(" skip all of this kind") | color(Color::GrayLight)}) |
        hcenter);

    return vbox(content) | border | center;
  });

  auto dialog_handler = CatchEvent(dialog_renderer, [&](Event event) {
    if (event == Event::Escape) {
      answer = Answer::No;
      dialog_screen.Exit();
      return true;
    }
    if (event.is_character()) {
      if (auto parsed = parseAnswerKey(event.character()[0])) {
        answer = *parsed;
        dialog_screen.Exit();
        return true;
      }
    }
    return false;
  });

  dialog_screen.Loop(dialog_handler);
  return answer;
}

// ============================================================================
// UI SETUP
// ============================================================================

void CleanFilesUI::initialize() {
  setupTopMenu();
  setupListPanel();
  setupMainLayout();

  analyzeAsync();
}

void CleanFilesUI::setupTopMenu() {
  m_menu_entries = ::getMenuEntries(); // from uicontrol.hpp
  m_top_menu =
      Menu(&m_menu_entries, &m_top_menu_selected, MenuOption::Horizontal());

  m_top_menu = m_top_menu | CatchEvent([this](Event event) {
                 if (event == Event::Return) {
                   ActionID id = getActionIdByIndex(m_top_menu_selected);
                   return handleGlobalShortcut(ActionMap.at(id).m_shortcut);
                 }
                 return false;
               });
}

/**
 * @brief Creates the list of proposals / outcomes
 *
 * Entries are colored per action kind (or green/red for outcomes) and the
 * focused entry is inverted.
 */
void CleanFilesUI::setupListPanel() {
  auto menu_option = MenuOption::Vertical();
  menu_option.entries_option.transform = [this](EntryState state) {
    auto row = text(state.label);

    if (const Color *c = safe_at(m_entry_colors, state.index)) {
      row = row | color(*c);
    }

    if (state.focused) {
      row = row | inverted | bold;
    }
    return row;
  };

  m_menu = Menu(&m_entries, &m_selected, menu_option);
  m_main_view = createListPanel();
}

Component CleanFilesUI::createListPanel() {
  return Renderer(m_menu, [this] {
    int terminal_height = Terminal::Size().dimy;
    int available_height = std::max(5, terminal_height - 7);

    // LOADING STATE
    if (m_loading) {
      static const std::vector<std::string> spinner = {"⠋", "⠙", "⠹", "⠸", "⠼",
                                                       "⠴", "⠦", "⠧", "⠇", "⠏"};
      static size_t frame = 0;
      frame = (frame + 1) % spinner.size();

      return vbox({text(m_panel_title) | bold | color(Color::Green), separator(),
                   vbox({text("") | flex,
                         hbox({text(spinner[frame]) | color(Color::Cyan) |
                                   bold | size(WIDTH, EQUAL, 2),
                               text("Scanning and fingerprinting...") |
                                   color(Color::GrayLight)}) |
                             center,
                         text("") | size(HEIGHT, EQUAL, 1),
                         text("Files found: " +
                              std::to_string(m_scanned_count.load())) |
                             color(Color::Yellow) | center,
                         text("") | flex}) |
                       flex}) |
             border;
    }

    return vbox({text(m_panel_title) | bold | color(Color::Green), separator(),
                 m_menu->Render() | vscroll_indicator | frame |
                     size(HEIGHT, EQUAL, available_height)}) |
           border;
  });
}

void CleanFilesUI::setupMainLayout() {
  m_document =
      Container::Vertical({m_top_menu, Renderer([] { return separator(); }),
                           m_main_view | flex, Renderer([this] {
                             return text("STATUS: " + m_current_status) |
                                    color(Color::GrayLight) | hcenter;
                           })});
}

// ============================================================================
// MAIN LOOP
// ============================================================================

void CleanFilesUI::run() {
  auto global_handler = CatchEvent(m_document, [this](Event event) {
    if (event.is_character()) {
      return handleGlobalShortcut(event.character()[0]);
    }
    return false;
  });

  m_screen.Loop(global_handler);
}

ActionID CleanFilesUI::getActionIdByIndex(int index) const {
  int i = 0;
  for (const auto &pair : ActionMap) {
    if (i++ == index) {
      return pair.first;
    }
  }
  return ActionID::Quit;
}

bool CleanFilesUI::handleGlobalShortcut(char key_pressed) {
  for (const auto &pair : ActionMap) {
    if (key_pressed != pair.second.m_shortcut) {
      continue;
    }

    switch (pair.first) {
    case ActionID::Quit:
      m_screen.Exit();
      return true;

    case ActionID::ReviewAndApply:
      reviewAndApply();
      return true;

    case ActionID::TogglePaths:
      m_show_full_paths = !m_show_full_paths;
      rebuildEntries();
      return true;
    }
  }
  return false;
}

// ============================================================================
// HELPERS
// ============================================================================

std::string CleanFilesUI::labelFor(const FileRecord &record) const {
  if (m_show_full_paths) {
    return record.getPath().string();
  }
  return displayPath(record.getPath(), record.getRoot());
}

Color CleanFilesUI::kindColor(ActionKind kind) {
  switch (kind) {
  case ActionKind::EmptyFile:
    return Color::Red;
  case ActionKind::TempFile:
    return Color::Magenta;
  case ActionKind::Duplicate:
    return Color::Yellow;
  case ActionKind::VersionConflict:
    return Color::Blue;
  case ActionKind::MoveOriginal:
    return Color::Cyan;
  case ActionKind::Rename:
    return Color::Green;
  case ActionKind::Permissions:
    return Color::GrayLight;
  }
  return Color::Default;
}

// ============================================================================
// ANIMATION THREAD
// ============================================================================

/**
 * @brief Requests a frame every 10ms while the spinner is shown
 */
void CleanFilesUI::startAnimation() {
  if (m_animating)
    return;

  m_animating = true;
  m_animation_thread = std::thread([this]() {
    while (m_animating) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      if (m_animating) {
        m_screen.RequestAnimationFrame();
      }
    }
  });
}

void CleanFilesUI::stopAnimation() {
  m_animating = false;
  if (m_animation_thread.joinable()) {
    m_animation_thread.join();
  }

  // Final redraw, otherwise the last spinner frame stays visible
  m_screen.RequestAnimationFrame();
}
