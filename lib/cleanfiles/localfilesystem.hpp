#ifndef LOCALFILESYSTEM_HPP
#define LOCALFILESYSTEM_HPP

#include "ifilesystem.hpp"

/**
 * @brief IFileSystem backed by std::filesystem and the local disk
 *
 * Every std::filesystem::filesystem_error is translated into the matching
 * cleanfiles error (ScanError, HashError or ActionError) with the path in the
 * message.
 */
class LocalFileSystem : public IFileSystem {
public:
  std::vector<DirEntry>
  listEntries(const std::filesystem::path &dir) const override;

  std::optional<FileStat>
  stat(const std::filesystem::path &path) const override;

  void readBytes(const std::filesystem::path &path,
                 const ChunkSink &sink) const override;

  void remove(const std::filesystem::path &path) override;

  void rename(const std::filesystem::path &from,
              const std::filesystem::path &to) override;

  void setPermissions(const std::filesystem::path &path,
                      unsigned bits) override;

  void move(const std::filesystem::path &from,
            const std::filesystem::path &to) override;

  void removeEmptyDir(const std::filesystem::path &dir) override;

private:
  /** @brief Read buffer size used by readBytes() */
  static constexpr std::size_t CHUNK_SIZE = 64 * 1024;
};

#endif // LOCALFILESYSTEM_HPP
