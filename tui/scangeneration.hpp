/**
 * @file scangeneration.hpp
 * @brief Ticket counter that tells results of the latest scan from stale ones
 *
 * @see DuplicateBrowserUI
 */

#ifndef SCAN_GENERATION_HPP
#define SCAN_GENERATION_HPP

#include <atomic>
#include <cstdint>

/**
 * @class ScanGeneration
 * @brief Monotonic scan counter shared between the UI and scan threads
 *
 * Every scan takes a ticket when it starts and carries it into the closures
 * it posts back to the UI thread. A closure whose ticket is no longer
 * current belongs to a scan that has been superseded and must not touch the
 * UI state.
 *
 * Usage:
 * @code
 * auto ticket = generation.advance();
 * // ... later, on the UI thread
 * if (!generation.isCurrent(ticket)) return;
 * @endcode
 */
class ScanGeneration {
public:
  using Ticket = std::uint64_t;

  /** @brief Starts a new scan; every earlier ticket becomes stale */
  Ticket advance() { return ++m_current; }

  bool isCurrent(Ticket ticket) const { return ticket == m_current.load(); }

  Ticket current() const { return m_current.load(); }

private:
  std::atomic<Ticket> m_current{0};
};

#endif // SCAN_GENERATION_HPP
