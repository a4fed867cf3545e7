/**
 * @file directorywalker.cpp
 * @brief Implementation of the work-list based directory walk
 */

#include "directorywalker.hpp"

namespace fs = std::filesystem;

DirectoryWalker::DirectoryWalker(const std::vector<fs::path> &roots,
                                 std::uintmax_t minSize,
                                 const ScanPolicy &policy)
    : m_minSize(minSize), m_policy(policy) {
  m_pending.reserve(roots.size());
  for (const auto &root : roots) {
    // Canonical roots make overlapping trees produce identical path strings
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(root, ec);
    m_pending.push_back({ec ? root : canonical, 0});
  }
}

/**
 * @brief Yields the next file that passes the size filter
 *
 * Processing of one directory entry:
 * 1. Entries whose status cannot be read are reported and skipped
 * 2. Directories are queued at depth + 1 unless excluded or too deep
 * 3. Anything that is not a regular file (symlinks included) is ignored
 * 4. Regular files below the minimum size are ignored
 * 5. The rest is counted and returned
 */
std::optional<FileRecord> DirectoryWalker::next() {
  while (!m_finished) {
    if (!m_open) {
      if (!openNextDirectory()) {
        m_finished = true;
        if (m_progress) {
          m_progress(static_cast<int>(m_scanned));
        }
        break;
      }
      continue;
    }

    if (m_iter == fs::directory_iterator()) {
      m_open = false;
      continue;
    }

    const fs::directory_entry entry = *m_iter;
    advance();

    std::error_code ec;
    const fs::file_status status = entry.symlink_status(ec);
    if (ec) {
      report(entry.path().string(), ec.message());
      continue;
    }

    if (fs::is_directory(status)) {
      const std::string name = entry.path().filename().string();
      if (m_policy.isExcludedDirectory(name)) {
        continue;
      }
      if (m_currentDepth + 1 <= m_policy.maxDepth) {
        m_pending.push_back({entry.path(), m_currentDepth + 1});
      }
      continue;
    }

    if (!fs::is_regular_file(status)) {
      continue;
    }

    const std::uintmax_t size = entry.file_size(ec);
    if (ec) {
      report(entry.path().string(), ec.message());
      continue;
    }
    if (size < m_minSize) {
      continue;
    }

    std::string path = entry.path().string();
    if (!m_seen.insert(path).second) {
      continue;
    }

    std::optional<fs::file_time_type> modified;
    const fs::file_time_type mtime = entry.last_write_time(ec);
    if (!ec) {
      modified = mtime;
    }

    ++m_scanned;
    if (m_progress && m_scanned % 100 == 0) {
      m_progress(static_cast<int>(m_scanned));
    }

    return FileRecord(path, size, modified);
  }

  return std::nullopt;
}

std::vector<FileRecord> DirectoryWalker::collect() {
  std::vector<FileRecord> records;
  while (auto record = next()) {
    records.push_back(std::move(*record));
  }
  return records;
}

/**
 * @brief Opens the next pending directory
 *
 * Directories that cannot be opened are reported and skipped.
 *
 * @return false once the work list is exhausted
 */
bool DirectoryWalker::openNextDirectory() {
  while (m_cursor < m_pending.size()) {
    const PendingDir dir = m_pending[m_cursor++];
    compactPending();

    std::error_code ec;
    fs::directory_iterator it(dir.path, ec);
    if (ec) {
      report(dir.path.string(), ec.message());
      continue;
    }

    m_iter = std::move(it);
    m_currentDir = dir.path;
    m_currentDepth = dir.depth;
    m_open = true;
    return true;
  }

  m_pending.clear();
  m_cursor = 0;
  return false;
}

/**
 * @brief Steps the open directory iterator
 *
 * A failed increment abandons the rest of the directory.
 */
void DirectoryWalker::advance() {
  std::error_code ec;
  m_iter.increment(ec);
  if (ec) {
    report(m_currentDir.string(), ec.message());
    m_iter = fs::directory_iterator();
    m_open = false;
  }
}

void DirectoryWalker::report(const std::string &path,
                             const std::string &reason) const {
  if (m_problem) {
    m_problem(path, reason);
  }
}

/**
 * @brief Drops finished entries once they dominate the work list
 */
void DirectoryWalker::compactPending() {
  if (m_cursor >= 1024 && m_cursor * 2 >= m_pending.size()) {
    m_pending.erase(m_pending.begin(),
                    m_pending.begin() + static_cast<std::ptrdiff_t>(m_cursor));
    m_cursor = 0;
  }
}
