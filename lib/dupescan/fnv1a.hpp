#ifndef FNV1A_HPP
#define FNV1A_HPP

#include "ihashcalculator.hpp"
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

/**
 * @brief Full-content fingerprint using 64-bit FNV-1a
 *
 * Reads every byte of the file, so it does not share the blind spot of
 * SampledHash (identical head and tail, different middle). Still a
 * non-cryptographic hash:
 * - FNV prime: 2^40 + 2^8 + 0xb3 (1099511628211)
 * - FNV offset basis: 14695981039346656037
 *
 * @see http://www.isthe.com/chongo/tech/comp/fnv/
 */
class FNV1A : public IHashCalculator {
public:
  std::string calculateHash(const std::string &filePath) const override {
    const uint64_t FNV_prime = 1099511628211u;
    uint64_t hash = 14695981039346656037u;

    std::ifstream file(filePath, std::ios::binary);
    if (!file)
      return "";

    std::vector<char> buffer(64 * 1024);
    while (file) {
      file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      const std::streamsize got = file.gcount();
      for (std::streamsize i = 0; i < got; ++i) {
        hash ^= static_cast<unsigned char>(buffer[static_cast<std::size_t>(i)]);
        hash *= FNV_prime;
      }
    }

    // Stopped by something other than end of file
    if (file.bad())
      return "";

    std::stringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return ss.str();
  }

  std::string name() const override { return "full"; }
};

#endif // FNV1A_HPP
