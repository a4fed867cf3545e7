#ifndef SHA256HASH_HPP
#define SHA256HASH_HPP

#include "ihashcalculator.hpp"

/**
 * @brief Full-content SHA-256 fingerprint (OpenSSL EVP)
 *
 * The slowest and strongest strategy. Produces 64 lowercase hex digits.
 */
class Sha256Hash : public IHashCalculator {
public:
  std::string calculateHash(const std::string &filePath) const override;

  std::string name() const override { return "sha256"; }
};

#endif // SHA256HASH_HPP
