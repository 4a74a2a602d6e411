#ifndef FILE_RECORD_HPP
#define FILE_RECORD_HPP

#include <cstdint>
#include <filesystem>
#include <string>

/**
 * @brief Whether a scanned root is the canonical target or a source
 */
enum class RootKind { Canonical, Source };

/**
 * @brief One regular file found by the scanner
 *
 * Metadata is fixed at scan time. The content hash is filled in once by
 * FingerprintIndex and stays empty for files that never needed hashing
 * (empty files, temp files, files without a size or name match) or whose
 * content could not be read.
 */
class FileRecord {
private:
  std::filesystem::path m_path;
  std::filesystem::path m_root;
  RootKind m_rootKind;
  std::uintmax_t m_size;
  std::filesystem::file_time_type m_mtime;
  unsigned m_permissions;
  std::string m_hash;

public:
  FileRecord(const std::filesystem::path &path,
             const std::filesystem::path &root, RootKind kind,
             std::uintmax_t size, std::filesystem::file_time_type mtime,
             unsigned permissions)
      : m_path(path), m_root(root), m_rootKind(kind), m_size(size),
        m_mtime(mtime), m_permissions(permissions) {}

  const std::filesystem::path &getPath() const { return m_path; }
  const std::filesystem::path &getRoot() const { return m_root; }
  RootKind getRootKind() const { return m_rootKind; }
  bool isCanonical() const { return m_rootKind == RootKind::Canonical; }

  std::uintmax_t getFileSize() const { return m_size; }
  std::filesystem::file_time_type getMtime() const { return m_mtime; }
  unsigned getPermissions() const { return m_permissions; }

  std::string getName() const { return m_path.filename().string(); }
  std::filesystem::path getDir() const { return m_path.parent_path(); }

  const std::string &getHash() const { return m_hash; }
  bool hasHash() const { return !m_hash.empty(); }
  void setHash(const std::string &hash) { m_hash = hash; }

  bool zeroFile() const { return m_size == 0; }
};

#endif // FILE_RECORD_HPP
