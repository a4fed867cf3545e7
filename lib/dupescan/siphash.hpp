#ifndef SIPHASH_HPP
#define SIPHASH_HPP

#include <cstddef>
#include <cstdint>

/**
 * @brief Streaming SipHash with configurable compression/finalization rounds
 *
 * SipHasher<2, 4> is the reference SipHash-2-4; SipHasher<1, 3> is the
 * faster variant used for the sampled fingerprint. Feeding data in several
 * update() calls yields the same result as feeding the concatenation once.
 *
 * Not collision resistant against an adversary with the key; here the key is
 * zero, so the result is a plain non-cryptographic 64-bit hash.
 *
 * @see https://www.aumasson.jp/siphash/siphash.pdf
 */
template <int CRounds, int DRounds> class SipHasher {
public:
  explicit SipHasher(uint64_t k0 = 0, uint64_t k1 = 0)
      : v0(k0 ^ 0x736f6d6570736575ULL), v1(k1 ^ 0x646f72616e646f6dULL),
        v2(k0 ^ 0x6c7967656e657261ULL), v3(k1 ^ 0x7465646279746573ULL) {}

  void update(const void *data, std::size_t len) {
    const auto *p = static_cast<const unsigned char *>(data);
    m_length += len;

    // Complete a pending partial word first
    while (len > 0 && m_tailLen > 0) {
      m_tail |= static_cast<uint64_t>(*p++) << (8 * m_tailLen);
      --len;
      if (++m_tailLen == 8) {
        compress(m_tail);
        m_tail = 0;
        m_tailLen = 0;
      }
    }

    while (len >= 8) {
      compress(load64(p));
      p += 8;
      len -= 8;
    }

    for (std::size_t i = 0; i < len; ++i) {
      m_tail |= static_cast<uint64_t>(p[i]) << (8 * m_tailLen);
      ++m_tailLen;
    }
  }

  /** @brief Mixes a 64-bit integer in little-endian byte order */
  void updateU64(uint64_t value) {
    unsigned char bytes[8];
    for (int i = 0; i < 8; ++i)
      bytes[i] = static_cast<unsigned char>(value >> (8 * i));
    update(bytes, sizeof(bytes));
  }

  uint64_t finish() const {
    uint64_t a = v0, b = v1, c = v2, d = v3;
    const uint64_t last = (static_cast<uint64_t>(m_length & 0xff) << 56) | m_tail;

    d ^= last;
    for (int i = 0; i < CRounds; ++i)
      round(a, b, c, d);
    a ^= last;

    c ^= 0xff;
    for (int i = 0; i < DRounds; ++i)
      round(a, b, c, d);

    return a ^ b ^ c ^ d;
  }

private:
  uint64_t v0, v1, v2, v3;
  uint64_t m_tail = 0;
  std::size_t m_tailLen = 0;
  uint64_t m_length = 0;

  static uint64_t rotl(uint64_t x, int b) { return (x << b) | (x >> (64 - b)); }

  static uint64_t load64(const unsigned char *p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i)
      v = (v << 8) | p[i];
    return v;
  }

  static void round(uint64_t &a, uint64_t &b, uint64_t &c, uint64_t &d) {
    a += b;
    b = rotl(b, 13);
    b ^= a;
    a = rotl(a, 32);
    c += d;
    d = rotl(d, 16);
    d ^= c;
    a += d;
    d = rotl(d, 21);
    d ^= a;
    c += b;
    b = rotl(b, 17);
    b ^= c;
    c = rotl(c, 32);
  }

  void compress(uint64_t m) {
    v3 ^= m;
    for (int i = 0; i < CRounds; ++i)
      round(v0, v1, v2, v3);
    v0 ^= m;
  }
};

using SipHasher13 = SipHasher<1, 3>;
using SipHasher24 = SipHasher<2, 4>;

#endif // SIPHASH_HPP
