/**
 * @file cleanrun.hpp
 * @brief One cleanup run: analyze, decide, execute, prune
 */

#ifndef CLEANRUN_HPP
#define CLEANRUN_HPP

#include "cleanuppass.hpp"
#include "config.hpp"
#include "decisionengine.hpp"
#include "executor.hpp"
#include "filescanner.hpp"
#include "fingerprintindex.hpp"
#include "ifilesystem.hpp"
#include "ihashcalculator.hpp"
#include "proposedaction.hpp"

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @class CleanRun
 * @brief Facade the front-ends drive, stage by stage
 *
 * @code
 * LocalFileSystem fs;
 * Sha256Hasher hasher(fs);
 * CleanRun run(fs, hasher, config, {canonical, source});
 * const auto &proposals = run.analyze();
 * DecisionState state;
 * auto decision = run.decide(prompter, state);
 * auto report = run.execute(decision.approved);
 * auto cleanup = run.cleanup();
 * @endcode
 *
 * The stages must be called in this order. The run owns the scanned records
 * and the index that points into them, so it is neither copyable nor
 * movable.
 */
class CleanRun {
private:
  IFileSystem &m_fs;
  const IHashCalculator &m_hasher;
  Config m_config;
  std::vector<std::filesystem::path> m_roots;
  std::atomic<int> *m_progress_counter = nullptr;

  ScanResult m_scan;
  std::optional<FingerprintIndex> m_index;
  std::vector<ProposedAction> m_proposals;
  std::vector<std::string> m_classify_warnings;

public:
  /**
   * @param fs Filesystem capability, also used by the hasher
   * @param hasher Content hasher
   * @param config Settings of this run
   * @param roots roots[0] is the canonical root, the rest are source roots
   */
  CleanRun(IFileSystem &fs, const IHashCalculator &hasher, Config config,
           std::vector<std::filesystem::path> roots)
      : m_fs(fs), m_hasher(hasher), m_config(std::move(config)),
        m_roots(std::move(roots)) {}

  CleanRun(const CleanRun &) = delete;
  CleanRun &operator=(const CleanRun &) = delete;

  /** @brief Counter incremented per scanned file (may be nullptr) */
  void setProgressCounter(std::atomic<int> *counter) {
    m_progress_counter = counter;
  }

  /**
   * @brief Scans, fingerprints and classifies
   * @return Proposals in DECISION_ORDER, then path order
   */
  const std::vector<ProposedAction> &analyze();

  /** @brief Runs the Decision Engine over the proposals of analyze() */
  DecisionResult decide(IDecisionPrompter &prompter, DecisionState &state);

  ExecutionReport execute(const std::vector<ApprovedAction> &approved);

  /** @brief Prunes empty directories under every scanned root */
  CleanupReport cleanup();

  std::filesystem::path canonicalRoot() const;
  const ScanResult &scan() const { return m_scan; }
  const std::vector<ProposedAction> &proposals() const { return m_proposals; }
  const Config &config() const { return m_config; }

  /** @brief Scan, hashing and classification warnings of analyze() */
  std::vector<std::string> warnings() const;

  /** @brief Number of files that were hashed */
  std::size_t hashedCount() const;
};

#endif // CLEANRUN_HPP
