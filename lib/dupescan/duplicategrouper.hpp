#ifndef DUPLICATEGROUPER_HPP
#define DUPLICATEGROUPER_HPP

#include "contentfingerprinter.hpp"
#include "filerecord.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Two or more files that share a size and a fingerprint
 *
 * Invariant: files.size() >= 2. Every member has exactly @c size bytes.
 */
struct DuplicateGroup {
  std::string fingerprint;
  std::uintmax_t size = 0;
  std::vector<FileRecord> files;

  std::size_t count() const { return files.size(); }

  /** @brief Bytes reclaimable by keeping a single copy */
  std::uintmax_t wastedBytes() const {
    return files.empty() ? 0 : size * (files.size() - 1);
  }
};

/**
 * @brief Service that turns fingerprinted bucket members into groups
 *
 * DuplicateGrouper works on one size bucket at a time, so members never need
 * their sizes re-checked. Fingerprints seen only once are dropped.
 *
 * Example usage:
 * @code
 * ContentFingerprinter fingerprinter(hasher);
 * for (const auto &bucket : index.candidateBuckets()) {
 *   auto groups = DuplicateGrouper::groupBucket(
 *       bucket.size, fingerprinter.fingerprint(bucket));
 *   ...
 * }
 * @endcode
 */
class DuplicateGrouper {
public:
  /**
   * @brief Groups one bucket's files by fingerprint
   *
   * Groups are returned in the order their fingerprint first appears and
   * members keep their input order.
   *
   * @param size Byte size shared by every file of the bucket
   * @param files Fingerprinted members of the bucket
   * @return Groups with at least two members
   */
  static std::vector<DuplicateGroup>
  groupBucket(std::uintmax_t size, const std::vector<FingerprintedFile> &files) {
    std::unordered_map<std::string, std::size_t> indexByHash;
    std::vector<DuplicateGroup> candidates;

    for (const auto &file : files) {
      if (file.fingerprint.empty()) {
        continue;
      }

      auto [it, inserted] =
          indexByHash.emplace(file.fingerprint, candidates.size());
      if (inserted) {
        DuplicateGroup group;
        group.fingerprint = file.fingerprint;
        group.size = size;
        candidates.push_back(std::move(group));
      }
      candidates[it->second].files.push_back(file.record);
    }

    std::vector<DuplicateGroup> groups;
    for (auto &group : candidates) {
      if (group.files.size() > 1) {
        groups.push_back(std::move(group));
      }
    }

    return groups;
  }

  /**
   * @brief Sum of wasted bytes over @p groups
   */
  static std::uintmax_t
  calculateWastedSpace(const std::vector<DuplicateGroup> &groups) {
    std::uintmax_t total = 0;
    for (const auto &group : groups) {
      total += group.wastedBytes();
    }
    return total;
  }

  /**
   * @brief Number of redundant copies, i.e. the sum of (count - 1)
   */
  static std::size_t countDuplicates(const std::vector<DuplicateGroup> &groups) {
    std::size_t total = 0;
    for (const auto &group : groups) {
      total += group.count() - 1;
    }
    return total;
  }
};

#endif // DUPLICATEGROUPER_HPP
