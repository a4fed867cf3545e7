#ifndef SAMPLEDHASH_HPP
#define SAMPLEDHASH_HPP

#include "ihashcalculator.hpp"
#include <cstddef>

/**
 * @brief Default fingerprint: file size plus the first and last 8 KiB
 *
 * The byte stream fed into SipHash-1-3 (zero keys) is
 *
 *   u64le(size) | u64le(len(head)) | head
 *   [ | u64le(len(tail)) | tail ]      only if size > tailThreshold
 *
 * where head is the first min(sampleBytes, size) bytes and tail is the last
 * sampleBytes bytes. The result is 16 lowercase hex digits.
 *
 * This is deliberately not a content hash: two files of equal size with the
 * same head and tail but a different middle get the same fingerprint. Use
 * FNV1A or Sha256Hash, or verify before deleting, when that matters.
 *
 * @note The layout must stay stable; fingerprints are compared against
 *       results produced by earlier releases.
 */
class SampledHash : public IHashCalculator {
public:
  explicit SampledHash(std::size_t sampleBytes = 8192,
                       std::size_t tailThreshold = 16384)
      : m_sampleBytes(sampleBytes), m_tailThreshold(tailThreshold) {}

  std::string calculateHash(const std::string &filePath) const override;

  std::string name() const override { return "sampled"; }

private:
  std::size_t m_sampleBytes;
  std::size_t m_tailThreshold;
};

#endif // SAMPLEDHASH_HPP
