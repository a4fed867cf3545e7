/**
 * @file rankingpresenter.hpp
 * @brief Ordering, aggregation and truncation of duplicate groups
 */

#ifndef RANKINGPRESENTER_HPP
#define RANKINGPRESENTER_HPP

#include "duplicategrouper.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One file of a presented group
 */
struct FilePresentation {
  std::string path;
  std::uintmax_t size = 0;
  /** @brief "today", "12d ago", "3mo ago", "2y ago" or "unknown" */
  std::string age;
  /** @brief Extension without the dot, empty if none */
  std::string extension;
};

/**
 * @brief A duplicate group as handed to a front end
 */
struct PresentedGroup {
  /** @brief First 16 hex characters of the fingerprint */
  std::string fingerprint;
  std::uintmax_t size = 0;
  std::size_t count = 0;
  std::uintmax_t wastedBytes = 0;
  std::vector<FilePresentation> files;
};

/**
 * @brief Outcome of one scan
 *
 * totalDuplicates and totalWasted cover every group found, even when
 * @c groups was truncated.
 */
struct ScanResult {
  std::vector<PresentedGroup> groups;
  std::size_t totalDuplicates = 0;
  std::uintmax_t totalWasted = 0;
  std::size_t filesScanned = 0;
  std::chrono::milliseconds elapsed{0};
};

/**
 * @class RankingPresenter
 * @brief Builds a ScanResult from the full list of duplicate groups
 *
 * Steps:
 * 1. Totals are computed over all groups
 * 2. Groups are stably sorted by descending wasted bytes
 * 3. Only the first maxGroups are converted for display
 */
class RankingPresenter {
public:
  using Clock = std::filesystem::file_time_type::clock;

  explicit RankingPresenter(std::size_t maxGroups = 100)
      : m_maxGroups(maxGroups) {}

  /**
   * @param groups Every group found by the scan (consumed)
   * @param filesScanned Files that passed the size filter
   * @param elapsed Wall time of the scan
   * @param now Reference time for the age labels
   */
  ScanResult present(std::vector<DuplicateGroup> groups,
                     std::size_t filesScanned,
                     std::chrono::milliseconds elapsed,
                     std::filesystem::file_time_type now = Clock::now()) const;

  /**
   * @brief Relative age of a modification time
   *
   * Whole days elapsed: < 1 "today", < 30 "Nd ago", < 365 "Nmo ago" with
   * N = days / 30, otherwise "Ny ago" with N = days / 365. Times in the
   * future count as today; a missing time is "unknown".
   */
  static std::string
  ageLabel(const std::optional<std::filesystem::file_time_type> &modified,
           std::filesystem::file_time_type now);

  /** @brief Shortens a fingerprint to its 16-character display form */
  static std::string displayFingerprint(const std::string &fingerprint);

private:
  std::size_t m_maxGroups;

  static FilePresentation presentFile(const FileRecord &record,
                                      std::filesystem::file_time_type now);
};

#endif // RANKINGPRESENTER_HPP
