#ifndef HASHMODE_HPP
#define HASHMODE_HPP

#include "ihashcalculator.hpp"
#include "scanpolicy.hpp"
#include <memory>
#include <optional>
#include <string>

/**
 * @enum HashMode
 * @brief Fingerprint strategy selectable from the front ends
 *
 * - Sampled: size + first/last 8 KiB (SampledHash), the default
 * - FullContent: every byte through FNV-1a (FNV1A)
 * - Sha256: every byte through SHA-256 (Sha256Hash)
 */
enum class HashMode { Sampled, FullContent, Sha256 };

/** @brief Parses "sampled", "full" or "sha256"; nullopt otherwise */
std::optional<HashMode> parseHashMode(const std::string &text);

/** @brief Builds the strategy for @p mode, sized from @p policy */
std::unique_ptr<IHashCalculator> makeHashCalculator(HashMode mode,
                                                    const ScanPolicy &policy);

#endif // HASHMODE_HPP
