#ifndef CONTENTFINGERPRINTER_HPP
#define CONTENTFINGERPRINTER_HPP

#include "filerecord.hpp"
#include "ihashcalculator.hpp"
#include "sizebucketindex.hpp"
#include <functional>
#include <string>
#include <vector>

/**
 * @brief A file together with its fingerprint
 */
struct FingerprintedFile {
  FileRecord record;
  std::string fingerprint;
};

/**
 * @brief Applies a fingerprint strategy to the members of a size bucket
 *
 * Unreadable files (empty fingerprint) are reported and left out; they never
 * abort the scan.
 *
 * @see IHashCalculator
 */
class ContentFingerprinter {
public:
  using ProblemCallback =
      std::function<void(const std::string &path, const std::string &reason)>;

  /**
   * @param calculator Strategy to use; must outlive the fingerprinter
   * @param problem Optional sink for unreadable files
   */
  explicit ContentFingerprinter(const IHashCalculator &calculator,
                                ProblemCallback problem = nullptr)
      : m_calculator(calculator), m_problem(std::move(problem)) {}

  std::vector<FingerprintedFile> fingerprint(const SizeBucket &bucket) const {
    std::vector<FingerprintedFile> result;
    result.reserve(bucket.files.size());

    for (const auto &record : bucket.files) {
      std::string hash = m_calculator.calculateHash(record.getPath());
      if (hash.empty()) {
        if (m_problem) {
          m_problem(record.getPath(), "unreadable");
        }
        continue;
      }
      result.push_back({record, std::move(hash)});
    }

    return result;
  }

  const IHashCalculator &calculator() const { return m_calculator; }

private:
  const IHashCalculator &m_calculator;
  ProblemCallback m_problem;
};

#endif // CONTENTFINGERPRINTER_HPP
