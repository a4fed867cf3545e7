#include "duplicatescanner.hpp"
#include "contentfingerprinter.hpp"
#include "duplicategrouper.hpp"
#include "sizebucketindex.hpp"

#include <chrono>
#include <cmath>
#include <limits>

DuplicateScanner::DuplicateScanner(std::vector<std::filesystem::path> roots,
                                   const IHashCalculator &calculator,
                                   const ScanPolicy &policy)
    : m_roots(std::move(roots)), m_calculator(calculator), m_policy(policy),
      m_deleter(policy) {}

/**
 * @brief Performs one complete scan
 *
 * Phases:
 * 1. Walk all roots and bucket qualifying files by exact size
 * 2. Fingerprint only members of buckets holding two or more files
 * 3. Group each bucket by fingerprint, keeping groups of two or more
 * 4. Rank, total and truncate for presentation
 */
ScanResult DuplicateScanner::scan(std::uintmax_t minSizeBytes) const {
  const auto start = std::chrono::steady_clock::now();

  DirectoryWalker walker(m_roots, minSizeBytes, m_policy);
  walker.setProgressCallback(m_progress);
  walker.setProblemCallback(m_problem);

  SizeBucketIndex index;
  while (auto record = walker.next()) {
    index.add(std::move(*record));
  }

  ContentFingerprinter fingerprinter(m_calculator, m_problem);
  std::vector<DuplicateGroup> groups;
  for (const auto &bucket : index.candidateBuckets()) {
    auto bucketGroups =
        DuplicateGrouper::groupBucket(bucket.size, fingerprinter.fingerprint(bucket));
    for (auto &group : bucketGroups) {
      groups.push_back(std::move(group));
    }
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  RankingPresenter presenter(m_policy.maxPresentedGroups);
  return presenter.present(std::move(groups), walker.filesScanned(), elapsed);
}

DuplicateScanner::BulkDeleteReport
DuplicateScanner::deleteAllDuplicates(const ScanResult &result,
                                      bool verify) const {
  BulkDeleteReport report;

  for (const auto &group : result.groups) {
    if (group.files.size() < 2) {
      continue;
    }
    const std::string &keeper = group.files.front().path;

    for (std::size_t i = 1; i < group.files.size(); ++i) {
      const FilePresentation &file = group.files[i];
      SafeDeleter::DeleteResult outcome =
          verify ? m_deleter.removeVerified(file.path, keeper)
                 : m_deleter.remove(file.path);

      if (outcome.ok()) {
        ++report.deleted;
        report.reclaimedBytes += file.size;
      } else {
        ++report.failed;
      }
      report.messages.push_back(std::move(outcome.message));
    }
  }

  return report;
}

std::uintmax_t DuplicateScanner::megabytesToBytes(double megabytes) {
  if (!(megabytes > 0.0)) {
    return 0;
  }
  const double bytes = std::floor(megabytes * 1048576.0);
  const std::uintmax_t limit = std::numeric_limits<std::uintmax_t>::max();
  if (bytes >= static_cast<double>(limit)) {
    return limit;
  }
  return static_cast<std::uintmax_t>(bytes);
}
