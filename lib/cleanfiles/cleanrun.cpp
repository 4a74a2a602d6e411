#include "cleanrun.hpp"
#include "classifier.hpp"

namespace fs = std::filesystem;

const std::vector<ProposedAction> &CleanRun::analyze() {
  FileScanner scanner(m_fs);
  scanner.setProgressCounter(m_progress_counter);
  m_scan = scanner.scanRoots(m_roots);

  // Fingerprinting needs the complete record set
  m_index.emplace(FingerprintIndex::build(m_scan.records, m_hasher, m_config));

  Classifier classifier(m_config, *m_index, m_fs, canonicalRoot());
  m_classify_warnings.clear();
  m_proposals = classifier.classify(m_scan.records, m_classify_warnings);
  return m_proposals;
}

DecisionResult CleanRun::decide(IDecisionPrompter &prompter,
                                DecisionState &state) {
  DecisionEngine engine(prompter);
  return engine.decide(m_proposals, state);
}

ExecutionReport CleanRun::execute(const std::vector<ApprovedAction> &approved) {
  Executor executor(m_fs);
  return executor.execute(approved);
}

CleanupReport CleanRun::cleanup() {
  CleanupPass pass(m_fs, canonicalRoot());
  return pass.prune(m_scan.roots);
}

fs::path CleanRun::canonicalRoot() const {
  if (!m_scan.roots.empty())
    return m_scan.roots.front();
  return m_roots.empty() ? fs::path() : FileScanner::normalizeRoot(m_roots.front());
}

std::vector<std::string> CleanRun::warnings() const {
  std::vector<std::string> all = m_scan.warnings;
  if (m_index) {
    all.insert(all.end(), m_index->warnings().begin(), m_index->warnings().end());
  }
  all.insert(all.end(), m_classify_warnings.begin(), m_classify_warnings.end());
  return all;
}

std::size_t CleanRun::hashedCount() const {
  return m_index ? m_index->hashedCount() : 0;
}
