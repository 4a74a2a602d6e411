#ifndef SHA256HASHER_HPP
#define SHA256HASHER_HPP

#include "ifilesystem.hpp"
#include "ihashcalculator.hpp"

/**
 * @brief SHA-256 content hash computed with the OpenSSL EVP digest API
 *
 * Content is streamed through IFileSystem::readBytes(), so files of any size
 * are hashed without being loaded into memory.
 *
 * @note The filesystem reference must outlive the hasher
 */
class Sha256Hasher : public IHashCalculator {
private:
  const IFileSystem &m_fs;

public:
  explicit Sha256Hasher(const IFileSystem &fs) : m_fs(fs) {}

  std::string calculateHash(const std::filesystem::path &filePath) const override;
};

#endif // SHA256HASHER_HPP
