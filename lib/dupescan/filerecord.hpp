#ifndef FILE_RECORD_HPP
#define FILE_RECORD_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

/**
 * @brief One regular file discovered by the DirectoryWalker
 *
 * A FileRecord is produced during a walk, consumed while bucketing and
 * fingerprinting, and discarded when the scan returns. Nothing about it is
 * persisted.
 *
 * @see DirectoryWalker
 * @see SizeBucketIndex
 */
class FileRecord {
private:
  std::string m_path;
  std::uintmax_t m_size;
  std::optional<std::filesystem::file_time_type> m_modified;

public:
  FileRecord(const std::string &path, std::uintmax_t size,
             std::optional<std::filesystem::file_time_type> modified =
                 std::nullopt)
      : m_path(path), m_size(size), m_modified(modified) {}

  const std::string &getPath() const { return m_path; }
  std::uintmax_t getFileSize() const { return m_size; }

  /** @brief Last write time, or nullopt if it could not be read */
  const std::optional<std::filesystem::file_time_type> &getModified() const {
    return m_modified;
  }

  std::string getFileName() const {
    return std::filesystem::path(m_path).filename().string();
  }

  /**
   * @brief Extension without the leading dot ("mp4", "gz")
   *
   * Dotfiles such as ".bashrc" have no extension.
   */
  std::string getExtension() const {
    std::string ext = std::filesystem::path(m_path).extension().string();
    if (!ext.empty() && ext[0] == '.')
      ext.erase(0, 1);
    return ext;
  }
};

#endif // FILE_RECORD_HPP
