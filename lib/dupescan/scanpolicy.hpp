/**
 * @file scanpolicy.hpp
 * @brief Immutable configuration injected into the duplicate scanner
 *
 * ScanPolicy collects the tables the engine consults: which directories are
 * pruned during a walk, which path fragments may never be deleted, how deep a
 * walk descends, and how the sampled fingerprint and the presenter are sized.
 */

#ifndef SCANPOLICY_HPP
#define SCANPOLICY_HPP

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @struct ScanPolicy
 * @brief Tuning and safety tables for one engine instance
 *
 * The engine never embeds these values. Tests build their own policy;
 * applications start from defaults() and adjust what they need.
 *
 * @see DirectoryWalker
 * @see SafeDeleter
 * @see SampledHash
 */
struct ScanPolicy {
  /** @brief Maximum directory depth below each root (root itself is 0) */
  int maxDepth = 4;

  /** @brief Prune directories whose name begins with '.' */
  bool skipHiddenDirectories = true;

  /** @brief Directory names pruned entirely (VCS, dependency caches, ...) */
  std::unordered_set<std::string> excludedDirectoryNames;

  /**
   * @brief Lowercase substrings that mark a path as protected from deletion
   *
   * A path whose lowercase form contains any fragment is refused by
   * SafeDeleter before the filesystem is touched.
   */
  std::vector<std::string> protectedPathFragments;

  /**
   * @brief Absolute directory prefixes protected from deletion
   *
   * Matched case-sensitively against the start of the absolute, normalized
   * path, so "/usr/" protects /usr/bin/ls but not ~/Downloads/usr/notes.txt.
   */
  std::vector<std::string> protectedPathPrefixes;

  /** @brief Number of groups returned by a scan; totals ignore this cap */
  std::size_t maxPresentedGroups = 100;

  /** @brief Bytes read from the head (and tail) of a file when sampling */
  std::size_t sampleBytes = 8192;

  /** @brief Files strictly larger than this also get their tail sampled */
  std::size_t tailThreshold = 16384;

  /**
   * @brief Default policy used by the command line and terminal front ends
   *
   * - Depth 4, hidden directories skipped
   * - Excludes .git, .svn, .hg, node_modules, AppData
   * - Protects the Windows, Program Files and System32 trees anywhere in a
   *   path, and the POSIX /etc, /boot, /usr, /opt, /bin and /sbin trees by
   *   prefix
   * - 100 presented groups, 8 KiB samples, tail sampled above 16 KiB
   */
  static ScanPolicy defaults();

  /** @brief True if @p name must not be descended into */
  bool isExcludedDirectory(const std::string &name) const;
};

#endif // SCANPOLICY_HPP
