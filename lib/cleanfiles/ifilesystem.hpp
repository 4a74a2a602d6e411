/**
 * @file ifilesystem.hpp
 * @brief Filesystem capability used by every cleanfiles stage
 *
 * The scanner, fingerprint index, executor and cleanup pass never touch the
 * disk directly. They go through this interface so tests can wrap the real
 * filesystem (e.g. to inject failures) without changing the core.
 *
 * @see LocalFileSystem
 */

#ifndef IFILESYSTEM_HPP
#define IFILESYSTEM_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

/**
 * @brief Type of a directory entry as seen without following links
 */
enum class EntryType { Regular, Directory, Symlink, Other };

struct DirEntry {
  std::filesystem::path path;
  EntryType type = EntryType::Other;
};

/**
 * @brief Subset of stat(2) the classifier needs
 */
struct FileStat {
  EntryType type = EntryType::Other;
  std::uintmax_t size = 0;
  std::filesystem::file_time_type mtime;
  /** @brief The nine rwx bits (e.g. 0644) */
  unsigned permissions = 0;
};

class IFileSystem {
public:
  /** @brief Receives consecutive chunks of file content */
  using ChunkSink = std::function<void(const char *data, std::size_t size)>;

  virtual ~IFileSystem() = default;

  /**
   * @brief Lists the direct children of a directory
   * @throws ScanError if the directory cannot be opened or read
   */
  virtual std::vector<DirEntry>
  listEntries(const std::filesystem::path &dir) const = 0;

  /**
   * @brief Stats a path without following a final symlink
   * @return std::nullopt if nothing exists at the path
   * @throws ScanError on any other failure
   */
  virtual std::optional<FileStat>
  stat(const std::filesystem::path &path) const = 0;

  /**
   * @brief Streams the full content of a file into a sink
   * @throws HashError if the file cannot be opened or read
   */
  virtual void readBytes(const std::filesystem::path &path,
                         const ChunkSink &sink) const = 0;

  /** @throws ActionError */
  virtual void remove(const std::filesystem::path &path) = 0;

  /** @brief Renames within one directory. @throws ActionError */
  virtual void rename(const std::filesystem::path &from,
                      const std::filesystem::path &to) = 0;

  /** @throws ActionError */
  virtual void setPermissions(const std::filesystem::path &path,
                              unsigned bits) = 0;

  /**
   * @brief Relocates a file, creating the destination directory if needed
   *
   * Works across filesystems (falls back to copy + remove).
   *
   * @throws ActionError
   */
  virtual void move(const std::filesystem::path &from,
                    const std::filesystem::path &to) = 0;

  /** @brief Removes a directory that must already be empty. @throws ActionError */
  virtual void removeEmptyDir(const std::filesystem::path &dir) = 0;
};

#endif // IFILESYSTEM_HPP
