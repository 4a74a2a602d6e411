/**
 * @file localfilesystem.cpp
 * @brief std::filesystem implementation of the IFileSystem capability
 */

#include "localfilesystem.hpp"
#include "errors.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

EntryType toEntryType(const fs::file_status &status) {
  if (fs::is_symlink(status))
    return EntryType::Symlink;
  if (fs::is_regular_file(status))
    return EntryType::Regular;
  if (fs::is_directory(status))
    return EntryType::Directory;
  return EntryType::Other;
}

} // namespace

std::vector<DirEntry>
LocalFileSystem::listEntries(const fs::path &dir) const {
  std::vector<DirEntry> entries;

  try {
    for (const auto &entry : fs::directory_iterator(dir)) {
      // symlink_status: links are reported as links, never followed
      entries.push_back({entry.path(), toEntryType(entry.symlink_status())});
    }
  } catch (const fs::filesystem_error &e) {
    throw ScanError("Cannot read directory " + dir.string() + ": " +
                    e.code().message());
  }

  return entries;
}

std::optional<FileStat> LocalFileSystem::stat(const fs::path &path) const {
  std::error_code ec;
  auto status = fs::symlink_status(path, ec);

  if (ec || !fs::exists(status)) {
    if (!ec || ec == std::errc::no_such_file_or_directory ||
        ec == std::errc::not_a_directory) {
      return std::nullopt;
    }
    throw ScanError("Cannot stat " + path.string() + ": " + ec.message());
  }

  FileStat result;
  result.type = toEntryType(status);
  result.permissions =
      static_cast<unsigned>(status.permissions() & fs::perms::all);

  try {
    if (result.type == EntryType::Regular) {
      result.size = fs::file_size(path);
    }
    if (result.type != EntryType::Symlink) {
      result.mtime = fs::last_write_time(path);
    }
  } catch (const fs::filesystem_error &e) {
    throw ScanError("Cannot stat " + path.string() + ": " +
                    e.code().message());
  }

  return result;
}

void LocalFileSystem::readBytes(const fs::path &path,
                                const ChunkSink &sink) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw HashError("Cannot open " + path.string() + " for reading");
  }

  std::vector<char> buffer(CHUNK_SIZE);
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = file.gcount();
    if (got > 0) {
      sink(buffer.data(), static_cast<std::size_t>(got));
    }
  }

  if (file.bad()) {
    throw HashError("Read error in " + path.string());
  }
}

void LocalFileSystem::remove(const fs::path &path) {
  try {
    if (!fs::remove(path)) {
      throw ActionError("File does not exist: " + path.string());
    }
  } catch (const fs::filesystem_error &e) {
    throw ActionError("Cannot delete " + path.string() + ": " +
                      e.code().message());
  }
}

void LocalFileSystem::rename(const fs::path &from, const fs::path &to) {
  try {
    fs::rename(from, to);
  } catch (const fs::filesystem_error &e) {
    throw ActionError("Cannot rename " + from.string() + " -> " + to.string() +
                      ": " + e.code().message());
  }
}

void LocalFileSystem::setPermissions(const fs::path &path, unsigned bits) {
  try {
    fs::permissions(path, static_cast<fs::perms>(bits) & fs::perms::all,
                    fs::perm_options::replace);
  } catch (const fs::filesystem_error &e) {
    throw ActionError("Cannot change permissions of " + path.string() + ": " +
                      e.code().message());
  }
}

void LocalFileSystem::move(const fs::path &from, const fs::path &to) {
  try {
    fs::create_directories(to.parent_path());

    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) {
      return;
    }
    if (ec != std::errc::cross_device_link) {
      throw fs::filesystem_error("rename", from, to, ec);
    }

    // Different filesystems: copy, keep the mode, then drop the original
    fs::copy_file(from, to, fs::copy_options::none);
    fs::permissions(to, fs::status(from).permissions(),
                    fs::perm_options::replace);
    fs::last_write_time(to, fs::last_write_time(from));
    fs::remove(from);
  } catch (const fs::filesystem_error &e) {
    throw ActionError("Cannot move " + from.string() + " -> " + to.string() +
                      ": " + e.code().message());
  }
}

void LocalFileSystem::removeEmptyDir(const fs::path &dir) {
  std::error_code ec;
  if (!fs::is_directory(fs::symlink_status(dir, ec))) {
    throw ActionError("Not a directory: " + dir.string());
  }

  // fs::remove() refuses non-empty directories (ENOTEMPTY)
  fs::remove(dir, ec);
  if (ec) {
    throw ActionError("Cannot remove directory " + dir.string() + ": " +
                      ec.message());
  }
}
