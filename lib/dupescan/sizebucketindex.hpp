#ifndef SIZEBUCKETINDEX_HPP
#define SIZEBUCKETINDEX_HPP

#include "filerecord.hpp"
#include <cstdint>
#include <map>
#include <vector>

/**
 * @brief Files sharing one exact byte length
 */
struct SizeBucket {
  std::uintmax_t size = 0;
  std::vector<FileRecord> files;
};

/**
 * @brief Partitions walked files by exact size
 *
 * The cheap pre-filter in front of fingerprinting: a file whose size is
 * unique cannot have a duplicate, so it is never read. Buckets are kept in
 * ascending size order and files keep their insertion order, which makes the
 * downstream grouping deterministic for a given walk.
 */
class SizeBucketIndex {
public:
  void add(FileRecord record) {
    const std::uintmax_t size = record.getFileSize();
    m_buckets[size].push_back(std::move(record));
  }

  /** @brief Number of distinct sizes seen */
  std::size_t bucketCount() const { return m_buckets.size(); }

  /**
   * @brief Buckets with at least two members, ascending by size
   *
   * Singletons are dropped here and never reach the fingerprinter.
   */
  std::vector<SizeBucket> candidateBuckets() const {
    std::vector<SizeBucket> candidates;
    for (const auto &[size, files] : m_buckets) {
      if (files.size() > 1) {
        candidates.push_back({size, files});
      }
    }
    return candidates;
  }

private:
  std::map<std::uintmax_t, std::vector<FileRecord>> m_buckets;
};

#endif // SIZEBUCKETINDEX_HPP
