/**
 * @file directorywalker.hpp
 * @brief Bounded, non-recursive enumeration of candidate files
 *
 * This header defines the DirectoryWalker class which yields one FileRecord
 * per regular file found below a set of roots, honouring a depth limit, an
 * exclusion policy and a minimum file size.
 */

#ifndef DIRECTORYWALKER_HPP
#define DIRECTORYWALKER_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "filerecord.hpp"
#include "scanpolicy.hpp"

/**
 * @class DirectoryWalker
 * @brief Pull-style walker over several directory trees
 *
 * Directories waiting to be read are kept in an explicit work list (an arena
 * of pending entries plus a cursor) instead of on the call stack, so deep or
 * unbalanced trees cannot exhaust the stack. The walker is a finite,
 * non-restartable sequence: call next() until it returns nullopt.
 *
 * Behaviour:
 * - Depth is counted from each root independently; the root is depth 0 and
 *   subdirectories deeper than ScanPolicy::maxDepth are silently not entered
 * - Directories rejected by ScanPolicy::isExcludedDirectory() are pruned
 *   with everything below them
 * - Symbolic links are neither followed nor reported
 * - Files smaller than the minimum size are skipped and not counted
 * - A directory that cannot be opened or read is skipped; the walk goes on
 * - A file reachable from two overlapping roots is reported once
 *
 * @see FileRecord
 * @see ScanPolicy
 */
class DirectoryWalker {
public:
  /** @brief Called with the number of counted files so far */
  using ProgressCallback = std::function<void(int count)>;

  /** @brief Called for every swallowed error: (path, reason) */
  using ProblemCallback =
      std::function<void(const std::string &path, const std::string &reason)>;

  /**
   * @brief Prepares a walk; nothing is read until next() is called
   *
   * @param roots Directories to walk. Missing roots are reported through the
   *              problem callback and skipped.
   * @param minSize Minimum file size in bytes for a file to be yielded
   * @param policy Exclusion and depth settings; copied
   */
  DirectoryWalker(const std::vector<std::filesystem::path> &roots,
                  std::uintmax_t minSize, const ScanPolicy &policy);

  void setProgressCallback(ProgressCallback progress) {
    m_progress = std::move(progress);
  }

  void setProblemCallback(ProblemCallback problem) {
    m_problem = std::move(problem);
  }

  /**
   * @brief Yields the next qualifying file, or nullopt when the walk is over
   *
   * Once nullopt has been returned every further call returns nullopt.
   */
  std::optional<FileRecord> next();

  /** @brief Drains the remaining sequence into a vector */
  std::vector<FileRecord> collect();

  /** @brief Number of files yielded so far (files passing the size filter) */
  std::size_t filesScanned() const { return m_scanned; }

private:
  struct PendingDir {
    std::filesystem::path path;
    int depth;
  };

  /** @brief Pending directories; entries before m_cursor are done */
  std::vector<PendingDir> m_pending;
  std::size_t m_cursor = 0;

  std::filesystem::directory_iterator m_iter;
  bool m_open = false;
  std::filesystem::path m_currentDir;
  int m_currentDepth = 0;
  bool m_finished = false;

  std::uintmax_t m_minSize;
  ScanPolicy m_policy;

  std::size_t m_scanned = 0;
  std::unordered_set<std::string> m_seen;

  ProgressCallback m_progress;
  ProblemCallback m_problem;

  bool openNextDirectory();
  void advance();
  void report(const std::string &path, const std::string &reason) const;
  void compactPending();
};

#endif // DIRECTORYWALKER_HPP
