#include "hashmode.hpp"
#include "fnv1a.hpp"
#include "sampledhash.hpp"
#include "sha256hash.hpp"

std::optional<HashMode> parseHashMode(const std::string &text) {
  if (text == "sampled")
    return HashMode::Sampled;
  if (text == "full")
    return HashMode::FullContent;
  if (text == "sha256")
    return HashMode::Sha256;
  return std::nullopt;
}

std::unique_ptr<IHashCalculator> makeHashCalculator(HashMode mode,
                                                    const ScanPolicy &policy) {
  switch (mode) {
  case HashMode::FullContent:
    return std::make_unique<FNV1A>();
  case HashMode::Sha256:
    return std::make_unique<Sha256Hash>();
  case HashMode::Sampled:
  default:
    return std::make_unique<SampledHash>(policy.sampleBytes,
                                         policy.tailThreshold);
  }
}
