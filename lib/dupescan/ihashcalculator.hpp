#ifndef IHASHCALCULATOR_HPP
#define IHASHCALCULATOR_HPP

#include <string>

/**
 * @brief Fingerprint strategy used to split a size bucket into groups
 *
 * calculateHash() returns a lowercase hex token, or an empty string when the
 * file cannot be read (locked, permission revoked, vanished since the walk).
 * Files with an empty fingerprint are never grouped.
 *
 * @see SampledHash
 * @see FNV1A
 * @see Sha256Hash
 */
class IHashCalculator {
public:
    virtual std::string calculateHash(const std::string& filePath) const = 0;

    /** @brief Short name shown in reports ("sampled", "full", "sha256") */
    virtual std::string name() const = 0;

    virtual ~IHashCalculator() = default;
};

#endif // IHASHCALCULATOR_HPP
