#include "sampledhash.hpp"
#include "siphash.hpp"

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

/**
 * @brief Computes the sampled fingerprint of a file
 *
 * The size is taken from the opened stream, not from the walk, so a file
 * that changed length since it was bucketed still hashes consistently with
 * its current content. Any open, seek or short read failure yields "".
 */
std::string SampledHash::calculateHash(const std::string &filePath) const {
  std::ifstream file(filePath, std::ios::binary | std::ios::ate);
  if (!file)
    return "";

  const std::streamoff end = file.tellg();
  if (end < 0)
    return "";
  const auto size = static_cast<uint64_t>(end);
  file.seekg(0, std::ios::beg);

  SipHasher13 hasher;
  hasher.updateU64(size);

  const std::size_t headLen =
      size < m_sampleBytes ? static_cast<std::size_t>(size) : m_sampleBytes;
  std::vector<char> buffer(headLen);
  if (headLen > 0 && !file.read(buffer.data(), headLen))
    return "";
  hasher.updateU64(headLen);
  hasher.update(buffer.data(), headLen);

  if (size > m_tailThreshold) {
    buffer.resize(m_sampleBytes);
    file.seekg(-static_cast<std::streamoff>(m_sampleBytes), std::ios::end);
    if (!file || !file.read(buffer.data(), m_sampleBytes))
      return "";
    hasher.updateU64(m_sampleBytes);
    hasher.update(buffer.data(), m_sampleBytes);
  }

  std::stringstream ss;
  ss << std::hex << std::setw(16) << std::setfill('0') << hasher.finish();
  return ss.str();
}
