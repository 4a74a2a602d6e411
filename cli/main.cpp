#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cleanrun.hpp"
#include "commandline.hpp"
#include "errors.hpp"
#include "localfilesystem.hpp"
#include "sha256hasher.hpp"
#include "utils.hpp"

/**
 * @class ConsolePrompter
 * @brief Line-based prompt on stdin/stdout
 *
 * Accepts y, n, a (yes to all of this kind) and s (skip all of this kind).
 * Anything else repeats the question. End of input answers No, so a closed
 * stdin never approves anything.
 */
class ConsolePrompter : public IDecisionPrompter {
private:
  std::istream &m_in;
  std::ostream &m_out;
  bool m_quiet;

public:
  ConsolePrompter(std::istream &in, std::ostream &out, bool quiet)
      : m_in(in), m_out(out), m_quiet(quiet) {}

  Answer ask(const ProposedAction &action, std::size_t position,
             std::size_t total) override {
    const FileRecord &target = action.getTarget();

    m_out << "\n[" << position << "/" << total << "] "
          << actionKindName(action.getKind()) << ": "
          << displayPath(target.getPath(), target.getRoot()) << "\n"
          << "    " << action.describe() << "\n";

    while (true) {
      m_out << "    Apply? [y]es / [n]o / [a]ll of this kind / [s]kip all of "
               "this kind: "
            << std::flush;

      std::string line;
      if (!std::getline(m_in, line)) {
        m_out << "\n";
        return Answer::No;
      }

      // exactly one key, surrounding blanks allowed
      auto first = line.find_first_not_of(" \t");
      auto last = line.find_last_not_of(" \t");
      if (first != std::string::npos && first == last) {
        if (auto answer = parseAnswerKey(line[first])) {
          return *answer;
        }
      }
      m_out << "    Please answer y, n, a or s.\n";
    }
  }

  void autoResolved(const ProposedAction &action, bool approved) override {
    if (m_quiet)
      return;
    const FileRecord &target = action.getTarget();
    m_out << "⚡ " << actionKindName(action.getKind()) << " "
          << displayPath(target.getPath(), target.getRoot())
          << (approved ? ": approved (all of this kind)"
                       : ": skipped (all of this kind)")
          << "\n";
  }
};

/**
 * @class Application
 * @brief Console front-end: analyze, list, confirm, execute, prune
 *
 * Output goes to stdout, warnings and failures to stderr. run() returns the
 * process exit code:
 *  - 0: finished (individual actions may still have failed)
 *  - 1: usage error, or no usable root
 *  - 2: configuration error
 */
class Application {
private:
  std::string m_program;

public:
  explicit Application(std::string program) : m_program(std::move(program)) {}

  int run(int argc, char *argv[]) {
    CommandLine cmd;
    try {
      cmd = CommandLine::parse(argc, argv);
    } catch (const std::invalid_argument &e) {
      std::cerr << "✗ " << e.what() << "\n\n" << CommandLine::usage(m_program);
      return 1;
    }

    if (cmd.showHelp) {
      std::cout << CommandLine::usage(m_program);
      return 0;
    }

    std::vector<std::string> configWarnings;
    Config config;
    try {
      config = loadRunConfig(cmd.configPath, configWarnings);
    } catch (const ConfigError &e) {
      std::cerr << "✗ Configuration error: " << e.what() << std::endl;
      return 2;
    }
    printWarnings(configWarnings);

    RootSelection selection = selectRoots(cmd.roots);
    printWarnings(selection.warnings);
    if (!selection.ok()) {
      for (const auto &error : selection.errors) {
        std::cerr << "✗ " << error << std::endl;
      }
      return 1;
    }

    LocalFileSystem fs;
    Sha256Hasher hasher(fs);
    CleanRun cleanRun(fs, hasher, config, selection.roots);

    std::cout << "Canonical directory: " << selection.roots.front().string()
              << std::endl;
    for (std::size_t i = 1; i < selection.roots.size(); ++i) {
      std::cout << "Source directory:    " << selection.roots[i].string()
                << std::endl;
    }

    std::cout << "\n--- Scanning ---" << std::endl;
    const auto &proposals = cleanRun.analyze();
    printWarnings(cleanRun.warnings());

    if (cleanRun.scan().readableRoots == 0) {
      std::cerr << "✗ None of the directories could be read." << std::endl;
      return 1;
    }

    std::cout << "Scan finished. " << cleanRun.scan().records.size()
              << " files found, " << cleanRun.hashedCount() << " hashed."
              << std::endl;

    if (proposals.empty()) {
      std::cout << "\n✓ Nothing to do. Everything is in order." << std::endl;
      return 0;
    }

    printProposals(proposals);

    if (cmd.dryRun) {
      std::cout << "\nDry run: no changes made." << std::endl;
      return 0;
    }

    if (!cmd.assumeYes && !confirmStart()) {
      std::cout << "Cancelled. No changes made." << std::endl;
      return 0;
    }

    DecisionState state =
        cmd.assumeYes ? DecisionState::approveAll() : DecisionState();
    ConsolePrompter prompter(std::cin, std::cout, cmd.assumeYes);
    DecisionResult decision = cleanRun.decide(prompter, state);
    printDecisionSummary(decision.summary);

    if (decision.approved.empty()) {
      std::cout << "Nothing approved. No changes made." << std::endl;
      return 0;
    }

    std::cout << "\n--- Executing ---" << std::endl;
    ExecutionReport report = cleanRun.execute(decision.approved);
    printReport(report);

    CleanupReport cleanup = cleanRun.cleanup();
    for (const auto &dir : cleanup.removed) {
      std::cout << "✓ Removed empty directory " << dir.string() << std::endl;
    }
    printWarnings(cleanup.warnings);

    printFailureSummary(report);
    return 0;
  }

private:
  static void printWarnings(const std::vector<std::string> &warnings) {
    for (const auto &w : warnings) {
      std::cerr << "⚠️ " << w << std::endl;
    }
  }

  static void printProposals(const std::vector<ProposedAction> &proposals) {
    std::cout << "\n--- Proposed actions (" << proposals.size() << ") ---"
              << std::endl;

    int number = 0;
    bool first = true;
    ActionKind currentKind = proposals.front().getKind();
    for (const auto &action : proposals) {
      if (first || action.getKind() != currentKind) {
        currentKind = action.getKind();
        first = false;
        std::cout << "\n# " << actionKindName(currentKind) << std::endl;
      }

      const FileRecord &target = action.getTarget();
      std::cout << std::setw(4) << ++number << ". "
                << displayPath(target.getPath(), target.getRoot()) << " ("
                << formatBytes(target.getFileSize()) << ")\n"
                << "      " << action.describe() << std::endl;
    }
  }

  static bool confirmStart() {
    std::cout << "\nStart interactive phase? [y/N] " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
      std::cout << std::endl;
      return false;
    }
    return line == "y" || line == "Y" || line == "yes";
  }

  static void printDecisionSummary(const DecisionSummary &summary) {
    std::cout << "\n--- Decisions ---" << std::endl;
    for (ActionKind kind : DECISION_ORDER) {
      auto approved = summary.approvedCount(kind);
      auto rejected = summary.rejectedCount(kind);
      if (approved + rejected == 0)
        continue;
      std::cout << std::left << std::setw(18) << actionKindName(kind)
                << std::right << " approved: " << approved
                << ", rejected: " << rejected << std::endl;
    }
  }

  static void printReport(const ExecutionReport &report) {
    for (const auto &outcome : report.outcomes) {
      const auto &action = outcome.action;
      std::ostream &os = outcome.success ? std::cout : std::cerr;
      os << (outcome.success ? "✓ " : "✗ ") << actionKindName(action.getKind())
         << " " << action.getTarget().getPath().string() << ": "
         << outcome.message << std::endl;
    }
  }

  static void printFailureSummary(const ExecutionReport &report) {
    auto failures = report.failures();
    std::cout << "\n--- Summary ---\n"
              << report.succeeded() << " of " << report.outcomes.size()
              << " actions applied." << std::endl;

    if (failures.empty())
      return;

    std::cerr << failures.size() << " actions failed:" << std::endl;
    for (const ActionOutcome *failure : failures) {
      std::cerr << "  ✗ " << actionKindName(failure->action.getKind()) << " "
                << failure->action.getTarget().getPath().string() << ": "
                << failure->message << std::endl;
    }
  }
};

int main(int argc, char *argv[]) {
  std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string()
                                 : "cleanfiles";
  Application app(program);
  return app.run(argc, argv);
}
