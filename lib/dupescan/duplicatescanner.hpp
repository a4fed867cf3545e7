/**
 * @file duplicatescanner.hpp
 * @brief Entry point of the duplicate detection engine
 */

#ifndef DUPLICATESCANNER_HPP
#define DUPLICATESCANNER_HPP

#include "directorywalker.hpp"
#include "ihashcalculator.hpp"
#include "rankingpresenter.hpp"
#include "safedeleter.hpp"
#include "scanpolicy.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @class DuplicateScanner
 * @brief Runs walk, size bucketing, fingerprinting, grouping and ranking
 *
 * A scan is synchronous and single-threaded; callers that must stay
 * responsive run it on a worker thread. Concurrent scans or deletes on the
 * same tree are not coordinated. Nothing is cached between scans.
 *
 * Example usage:
 * @code
 * SampledHash hasher;
 * DuplicateScanner scanner({"/home/me/Downloads"}, hasher);
 * ScanResult result = scanner.scan(DuplicateScanner::megabytesToBytes(1.0));
 * std::cout << formatBytes(result.totalWasted) << " wasted\n";
 * @endcode
 *
 * @see DirectoryWalker
 * @see SizeBucketIndex
 * @see ContentFingerprinter
 * @see DuplicateGrouper
 * @see RankingPresenter
 * @see SafeDeleter
 */
class DuplicateScanner {
public:
  using ProgressCallback = DirectoryWalker::ProgressCallback;
  using ProblemCallback = DirectoryWalker::ProblemCallback;

  /** @brief Outcome of deleting every redundant copy of a result */
  struct BulkDeleteReport {
    std::size_t deleted = 0;
    std::size_t failed = 0;
    std::uintmax_t reclaimedBytes = 0;
    /** @brief One line per attempted delete, in order */
    std::vector<std::string> messages;
  };

  /**
   * @param roots Directories to scan, typically the user's well-known folders
   * @param calculator Fingerprint strategy; must outlive the scanner
   * @param policy Exclusions, depth, protected paths and display cap
   */
  DuplicateScanner(std::vector<std::filesystem::path> roots,
                   const IHashCalculator &calculator,
                   const ScanPolicy &policy = ScanPolicy::defaults());

  void setProgressCallback(ProgressCallback progress) {
    m_progress = std::move(progress);
  }

  void setProblemCallback(ProblemCallback problem) {
    m_problem = std::move(problem);
  }

  /**
   * @brief Scans the roots for files of at least @p minSizeBytes bytes
   *
   * Never fails: unreadable directories and files are skipped and reported
   * through the problem callback.
   */
  ScanResult scan(std::uintmax_t minSizeBytes) const;

  /** @brief Deletes one file through the SafeDeleter */
  SafeDeleter::DeleteResult deleteFile(const std::string &path) const {
    return m_deleter.remove(path);
  }

  /**
   * @brief Keeps the first file of every group and deletes the others
   *
   * With @p verify set (the default) a file is only removed when its full
   * contents equal the kept file, so a sampled-fingerprint false positive is
   * reported as a mismatch and left on disk.
   *
   * @param verify Compare full contents with the kept file before each delete
   */
  BulkDeleteReport deleteAllDuplicates(const ScanResult &result,
                                       bool verify = true) const;

  /**
   * @brief Megabytes (2^20 bytes) to bytes, truncated
   *
   * Negative and NaN give 0; values beyond the range of uintmax_t saturate.
   */
  static std::uintmax_t megabytesToBytes(double megabytes);

  const std::vector<std::filesystem::path> &roots() const { return m_roots; }
  const ScanPolicy &policy() const { return m_policy; }
  const IHashCalculator &calculator() const { return m_calculator; }

private:
  std::vector<std::filesystem::path> m_roots;
  const IHashCalculator &m_calculator;
  ScanPolicy m_policy;
  SafeDeleter m_deleter;

  ProgressCallback m_progress;
  ProblemCallback m_problem;
};

#endif // DUPLICATESCANNER_HPP
